#pragma once

#include "lexer/token.hpp"
#include <string>
#include <vector>

namespace pdsl {

// Tokenizer for the expression sandbox. Statements are split by the line
// segmenter first; the lexer only ever sees a single expression.
class Lexer {
public:
    explicit Lexer(const std::string& source, const std::string& filename = "<expr>");

    // Tokenize the entire source
    std::vector<Token> tokenize();

    // Next token; ERROR tokens carry the problem in their lexeme
    Token nextToken();

private:
    std::string source_;
    std::string filename_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char current() const;
    char peekChar(size_t offset) const;
    char advance();
    bool atEnd() const;
    void skipWhitespace();

    Token makeToken(TokenType type, const std::string& lexeme);
    Token scanString(char quote);
    Token scanNumber();
    Token scanIdentifier();
};

} // namespace pdsl
