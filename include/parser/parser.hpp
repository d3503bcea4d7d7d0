#pragma once

#include "lexer/lexer.hpp"
#include "ast/ast.hpp"
#include <memory>

namespace pdsl {

// Precedence-climbing parser for the expression sandbox. Syntax errors are
// reported as std::runtime_error; the evaluator turns them into a failure.
class Parser {
public:
    explicit Parser(Lexer& lexer);

    // Parse one complete expression; trailing tokens are an error
    ExprPtr parse();

    // Parse expression with minimum precedence (Pratt Parsing)
    ExprPtr expression(int minPrecedence = 0);

private:
    Lexer& lexer_;
    Token current_;
    Token previous_;

    void advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    Token consume(TokenType type, const std::string& message);
    [[noreturn]] void fail(const std::string& message) const;

    static int binaryPrecedence(TokenType type);
    static bool isComparison(TokenType type);

    // Grammar rules
    ExprPtr prefix();
    ExprPtr primary();
    ExprPtr call(const Token& name);
};

} // namespace pdsl
