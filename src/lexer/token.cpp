#include "lexer/token.hpp"

namespace pdsl {

std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::INTEGER:       return "INTEGER";
        case TokenType::FLOAT:         return "FLOAT";
        case TokenType::STRING:        return "STRING";
        case TokenType::IDENTIFIER:    return "IDENTIFIER";
        case TokenType::TRUE:          return "TRUE";
        case TokenType::FALSE:         return "FALSE";
        case TokenType::NONE:          return "NONE";
        case TokenType::AND:           return "AND";
        case TokenType::OR:            return "OR";
        case TokenType::NOT:           return "NOT";
        case TokenType::PLUS:          return "PLUS";
        case TokenType::MINUS:         return "MINUS";
        case TokenType::STAR:          return "STAR";
        case TokenType::SLASH:         return "SLASH";
        case TokenType::PERCENT:       return "PERCENT";
        case TokenType::EQUALS:        return "EQUALS";
        case TokenType::NOT_EQUALS:    return "NOT_EQUALS";
        case TokenType::LESS:          return "LESS";
        case TokenType::GREATER:       return "GREATER";
        case TokenType::LESS_EQUAL:    return "LESS_EQUAL";
        case TokenType::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenType::COMMA:         return "COMMA";
        case TokenType::LPAREN:        return "LPAREN";
        case TokenType::RPAREN:        return "RPAREN";
        case TokenType::END_OF_FILE:   return "END_OF_FILE";
        case TokenType::ERROR:         return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace pdsl
