#include "lexer/lexer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace pdsl {

// Looked up after lower-casing, so AND/And/and are the same keyword
static const std::unordered_map<std::string, TokenType> keywords = {
    {"true", TokenType::TRUE},
    {"false", TokenType::FALSE},
    {"none", TokenType::NONE},
    {"null", TokenType::NONE},
    {"and", TokenType::AND},
    {"or", TokenType::OR},
    {"not", TokenType::NOT},
};

Lexer::Lexer(const std::string& source, const std::string& filename)
    : source_(source), filename_(filename) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(nextToken());
        if (tokens.back().type == TokenType::END_OF_FILE || tokens.back().type == TokenType::ERROR) {
            break;
        }
    }
    return tokens;
}

Token Lexer::nextToken() {
    skipWhitespace();

    if (atEnd()) {
        return makeToken(TokenType::END_OF_FILE, "");
    }

    char c = advance();

    // Numbers
    if (std::isdigit(static_cast<unsigned char>(c))) {
        pos_--;
        column_--;
        return scanNumber();
    }

    // Strings
    if (c == '"' || c == '\'') {
        return scanString(c);
    }

    // Identifiers and keywords
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        pos_--;
        column_--;
        return scanIdentifier();
    }

    switch (c) {
        case '+': return makeToken(TokenType::PLUS, "+");
        case '-': return makeToken(TokenType::MINUS, "-");
        case '*': return makeToken(TokenType::STAR, "*");
        case '%': return makeToken(TokenType::PERCENT, "%");
        case '/':
            if (current() == '/') {
                advance();
                return makeToken(TokenType::ERROR, "'//' starts a comment, not an operator");
            }
            return makeToken(TokenType::SLASH, "/");
        case '<':
            if (current() == '=') {
                advance();
                return makeToken(TokenType::LESS_EQUAL, "<=");
            }
            return makeToken(TokenType::LESS, "<");
        case '>':
            if (current() == '=') {
                advance();
                return makeToken(TokenType::GREATER_EQUAL, ">=");
            }
            return makeToken(TokenType::GREATER, ">");
        case '(': return makeToken(TokenType::LPAREN, "(");
        case ')': return makeToken(TokenType::RPAREN, ")");
        case ',': return makeToken(TokenType::COMMA, ",");
        case '=':
            if (current() == '=') {
                advance();
                return makeToken(TokenType::EQUALS, "==");
            }
            return makeToken(TokenType::ERROR, "=");
        case '!':
            if (current() == '=') {
                advance();
                return makeToken(TokenType::NOT_EQUALS, "!=");
            }
            return makeToken(TokenType::ERROR, "!");
    }

    return makeToken(TokenType::ERROR, std::string(1, c));
}

char Lexer::current() const {
    if (atEnd()) return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const {
    if (pos_ + offset >= source_.size()) return '\0';
    return source_[pos_ + offset];
}

char Lexer::advance() {
    column_++;
    return source_[pos_++];
}

bool Lexer::atEnd() const {
    return pos_ >= source_.size();
}

void Lexer::skipWhitespace() {
    while (!atEnd()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r') {
            advance();
        } else if (c == '\n') {
            advance();
            line_++;
            column_ = 1;
        } else {
            break;
        }
    }
}

Token Lexer::makeToken(TokenType type, const std::string& lexeme) {
    Token token;
    token.type = type;
    token.lexeme = lexeme;
    token.location = {line_, column_ > lexeme.size() ? column_ - lexeme.size() : 1, filename_};
    return token;
}

Token Lexer::scanString(char quote) {
    // """...""" spans lines; the opening quote is already consumed
    bool triple = quote == '"' && current() == '"' && peekChar(1) == '"';
    if (triple) {
        advance();
        advance();
    }

    auto atClose = [&]() {
        if (triple) {
            return current() == '"' && peekChar(1) == '"' && peekChar(2) == '"';
        }
        return current() == quote;
    };

    std::string value;
    while (!atEnd() && !atClose()) {
        if (current() == '\n') {
            if (!triple) {
                return makeToken(TokenType::ERROR, "Unterminated string");
            }
            line_++;
            column_ = 0;
        }
        if (current() == '\\' && pos_ + 1 < source_.size()) {
            advance();
            switch (current()) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                case '\\': value += '\\'; break;
                default:
                    value += '\\';
                    value += current();
            }
        } else {
            value += current();
        }
        advance();
    }

    if (atEnd()) {
        return makeToken(TokenType::ERROR, "Unterminated string");
    }

    // closing quote(s)
    advance();
    if (triple) {
        advance();
        advance();
    }

    Token token = makeToken(TokenType::STRING, std::string(1, quote) + value + std::string(1, quote));
    token.value = value;
    return token;
}

Token Lexer::scanNumber() {
    std::string num;
    bool is_float = false;

    while (!atEnd() && std::isdigit(static_cast<unsigned char>(current()))) {
        num += advance();
    }

    if (current() == '.' && std::isdigit(static_cast<unsigned char>(peekChar(1)))) {
        is_float = true;
        num += advance(); // .
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(current()))) {
            num += advance();
        }
    }

    if (current() == 'e' || current() == 'E') {
        size_t digitOffset = (peekChar(1) == '+' || peekChar(1) == '-') ? 2 : 1;
        if (std::isdigit(static_cast<unsigned char>(peekChar(digitOffset)))) {
            is_float = true;
            for (size_t i = 0; i < digitOffset; i++) {
                num += advance();
            }
            while (!atEnd() && std::isdigit(static_cast<unsigned char>(current()))) {
                num += advance();
            }
        }
    }

    Token token = makeToken(is_float ? TokenType::FLOAT : TokenType::INTEGER, num);
    try {
        if (is_float) {
            token.value = std::stod(num);
        } else {
            token.value = static_cast<int64_t>(std::stoll(num));
        }
    } catch (const std::out_of_range&) {
        return makeToken(TokenType::ERROR, "Numeric literal out of range: " + num);
    }
    return token;
}

Token Lexer::scanIdentifier() {
    std::string id;
    while (!atEnd() && (std::isalnum(static_cast<unsigned char>(current())) || current() == '_')) {
        id += advance();
    }

    std::string lowered = id;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    // Check for keywords
    auto it = keywords.find(lowered);
    if (it != keywords.end()) {
        return makeToken(it->second, id);
    }

    return makeToken(TokenType::IDENTIFIER, id);
}

} // namespace pdsl
