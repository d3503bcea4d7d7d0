#pragma once

#include <string>

namespace pdsl {

enum class DiagnosticSeverity {
    Error,
    Warning,
    Information,
    Debug
};

std::string severityToString(DiagnosticSeverity severity);

struct Diagnostic {
    std::string message;
    std::string filePath;
    int line;
    int column;     // 0-based start column
    DiagnosticSeverity severity;

    Diagnostic(std::string msg, std::string file = "", int l = 0, int c = 0, DiagnosticSeverity sev = DiagnosticSeverity::Error)
        : message(std::move(msg)), filePath(std::move(file)), line(l), column(c), severity(sev) {}

    std::string toString() const {
        std::string location;
        if (!filePath.empty()) {
            location = filePath + ":" + std::to_string(line);
        } else if (line > 0) {
            location = "line " + std::to_string(line);
        }

        if (!location.empty()) {
            return severityToString(severity) + " at " + location + ": " + message;
        } else {
            return severityToString(severity) + ": " + message;
        }
    }
};

} // namespace pdsl
