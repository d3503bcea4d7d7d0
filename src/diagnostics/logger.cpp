#include "diagnostics/logger.hpp"

#include <algorithm>
#include <iostream>

namespace pdsl {

std::string severityToString(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::Error:       return "ERROR";
        case DiagnosticSeverity::Warning:     return "WARNING";
        case DiagnosticSeverity::Information: return "INFO";
        case DiagnosticSeverity::Debug:       return "DEBUG";
    }
    return "UNKNOWN";
}

Logger::Logger(std::string characterId, std::ostream* sink)
    : characterId_(std::move(characterId)), sink_(sink) {}

void Logger::debug(const std::string& message, const std::string& file, int line) {
    if (debug_) {
        log(DiagnosticSeverity::Debug, message, file, line);
    }
}

void Logger::info(const std::string& message, const std::string& file, int line) {
    log(DiagnosticSeverity::Information, message, file, line);
}

void Logger::warning(const std::string& message, const std::string& file, int line) {
    log(DiagnosticSeverity::Warning, message, file, line);
}

void Logger::error(const std::string& message, const std::string& file, int line) {
    log(DiagnosticSeverity::Error, message, file, line);
}

size_t Logger::count(DiagnosticSeverity severity) const {
    return std::count_if(records_.begin(), records_.end(),
                         [severity](const Diagnostic& d) { return d.severity == severity; });
}

void Logger::log(DiagnosticSeverity severity, const std::string& message, const std::string& file, int line) {
    records_.emplace_back(message, file, line, 0, severity);

    if (!sink_) {
        return;
    }
    // Info chatter only shows up in debug mode
    if (severity == DiagnosticSeverity::Information && !debug_) {
        return;
    }
    *sink_ << "[promptdsl:" << characterId_ << "] " << severityToString(severity) << " ";
    if (!file.empty()) {
        *sink_ << file;
        if (line > 0) {
            *sink_ << ":" << line;
        }
        *sink_ << ": ";
    }
    *sink_ << message << std::endl;
}

} // namespace pdsl
