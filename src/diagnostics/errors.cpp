#include "diagnostics/errors.hpp"

namespace pdsl {

namespace {

std::string formatError(const std::string& message, const std::string& file, int line,
                        const std::string& lineText, const std::string& cause) {
    std::string result = message;
    if (!file.empty()) {
        result += " [" + file;
        if (line > 0) {
            result += ":" + std::to_string(line);
        }
        result += "]";
    }
    if (!lineText.empty()) {
        result += " in line '" + lineText + "'";
    }
    if (!cause.empty()) {
        result += ": " + cause;
    }
    return result;
}

} // namespace

DslError::DslError(const std::string& message, std::string file, int line,
                   std::string lineText, std::string cause)
    : std::runtime_error(formatError(message, file, line, lineText, cause)),
      message_(message),
      file_(std::move(file)),
      line_(line),
      lineText_(std::move(lineText)),
      cause_(std::move(cause)) {}

} // namespace pdsl
