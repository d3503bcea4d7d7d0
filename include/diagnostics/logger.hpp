#pragma once

#include "diagnostics/diagnostic.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace pdsl {

// Logger threaded explicitly through the engine. Every entry is written to the
// sink as "[promptdsl:<character>] <SEVERITY> message" and kept as a Diagnostic
// so callers can inspect what happened during one composition.
class Logger {
public:
    explicit Logger(std::string characterId = "NO_CHAR", std::ostream* sink = nullptr);

    void setCharacterId(const std::string& characterId) { characterId_ = characterId; }
    const std::string& characterId() const { return characterId_; }

    // Pass nullptr to keep records without writing anywhere
    void setSink(std::ostream* sink) { sink_ = sink; }
    void setDebug(bool debug) { debug_ = debug; }
    bool debugEnabled() const { return debug_; }

    void debug(const std::string& message, const std::string& file = "", int line = 0);
    void info(const std::string& message, const std::string& file = "", int line = 0);
    void warning(const std::string& message, const std::string& file = "", int line = 0);
    void error(const std::string& message, const std::string& file = "", int line = 0);

    const std::vector<Diagnostic>& records() const { return records_; }
    size_t count(DiagnosticSeverity severity) const;
    // Records cover one composition; the expander clears them when it starts
    void clearRecords() { records_.clear(); }

private:
    std::string characterId_;
    std::ostream* sink_;
    bool debug_ = false;
    std::vector<Diagnostic> records_;

    void log(DiagnosticSeverity severity, const std::string& message, const std::string& file, int line);
};

} // namespace pdsl
