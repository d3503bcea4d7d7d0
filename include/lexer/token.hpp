#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace pdsl {

enum class TokenType {
    // Literals
    INTEGER,
    FLOAT,
    STRING,
    IDENTIFIER,

    // Keywords (case-insensitive)
    TRUE,
    FALSE,
    NONE,
    AND,
    OR,
    NOT,

    // Operators
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,
    EQUALS,
    NOT_EQUALS,
    LESS,
    GREATER,
    LESS_EQUAL,
    GREATER_EQUAL,

    // Delimiters
    COMMA,
    LPAREN,
    RPAREN,

    // Special
    END_OF_FILE,
    ERROR
};

struct SourceLocation {
    size_t line{};
    size_t column{};
    std::string filename;
};

struct Token {
    TokenType type{};
    std::string lexeme;
    SourceLocation location;

    // Literal value if applicable
    std::variant<std::monostate, int64_t, double, std::string> value;
};

// Convert token type to string for debugging
std::string tokenTypeToString(TokenType type);

} // namespace pdsl
