#pragma once

#include <optional>
#include <string>

namespace pdsl {

enum class StatementKind {
    If,
    ElseIf,
    Else,
    EndIf,
    Set,
    Log,
    AddSystemInfo,
    Return,
    Unknown
};

// One logical line split into its command word and the rest
struct Statement {
    StatementKind kind;
    std::string keyword;    // as written, for messages
    std::string argument;   // trimmed, trailing comment removed
};

struct SetStatement {
    std::string variable;
    std::string expression;
    bool local = false;
};

// Remove a trailing "// ..." that is not inside a string literal
std::string stripLineComment(const std::string& line);

// nullopt for blank lines and comment lines
std::optional<Statement> classifyLine(const std::string& text);

// IF/ELSEIF conditions may end in THEN
std::string stripThen(const std::string& condition);

// Parse "[LOCAL] name = expr". Returns an error message on failure.
std::optional<std::string> parseSetArgument(const std::string& argument, SetStatement& out);

bool isIdentifier(const std::string& name);

std::string trimText(const std::string& text);

} // namespace pdsl
