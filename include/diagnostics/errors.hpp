#pragma once

#include <stdexcept>
#include <string>

namespace pdsl {

// Base of every error raised while composing a prompt. Errors are caught at
// the smallest enclosing unit (placeholder, script, directive) and rendered
// as inline markers, so they rarely reach the caller.
class DslError : public std::runtime_error {
public:
    explicit DslError(const std::string& message,
                      std::string file = "",
                      int line = 0,
                      std::string lineText = "",
                      std::string cause = "");

    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& lineText() const { return lineText_; }
    const std::string& cause() const { return cause_; }

private:
    std::string message_;
    std::string file_;
    int line_;
    std::string lineText_;
    std::string cause_;
};

// Malformed script structure or literal blocks
class ParseError : public DslError {
public:
    using DslError::DslError;
};

// Reference is absolute, empty or escapes its root
class ResolutionError : public DslError {
public:
    using DslError::DslError;
};

class NotFoundError : public DslError {
public:
    using DslError::DslError;
};

class TagNotFoundError : public DslError {
public:
    using DslError::DslError;
};

// Expression failed after every repair strategy was exhausted
class EvaluationError : public DslError {
public:
    using DslError::DslError;
};

} // namespace pdsl
