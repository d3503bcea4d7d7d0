#include "parser/parser.hpp"
#include <stdexcept>

namespace pdsl {

namespace {

// Binding strength, lowest first. `not` sits between `and` and comparisons.
constexpr int PREC_OR = 1;
constexpr int PREC_AND = 2;
constexpr int PREC_NOT = 3;
constexpr int PREC_COMPARISON = 4;
constexpr int PREC_ADDITIVE = 5;
constexpr int PREC_MULTIPLICATIVE = 6;
constexpr int PREC_UNARY = 7;

} // namespace

Parser::Parser(Lexer& lexer) : lexer_(lexer) {
    advance();
}

void Parser::advance() {
    previous_ = current_;
    current_ = lexer_.nextToken();
    if (current_.type == TokenType::ERROR) {
        fail(current_.lexeme);
    }
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

Token Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) {
        Token token = current_;
        advance();
        return token;
    }
    fail(message);
}

void Parser::fail(const std::string& message) const {
    throw std::runtime_error(message + " at column " + std::to_string(current_.location.column));
}

int Parser::binaryPrecedence(TokenType type) {
    switch (type) {
        case TokenType::OR:
            return PREC_OR;
        case TokenType::AND:
            return PREC_AND;
        case TokenType::EQUALS:
        case TokenType::NOT_EQUALS:
        case TokenType::LESS:
        case TokenType::GREATER:
        case TokenType::LESS_EQUAL:
        case TokenType::GREATER_EQUAL:
            return PREC_COMPARISON;
        case TokenType::PLUS:
        case TokenType::MINUS:
            return PREC_ADDITIVE;
        case TokenType::STAR:
        case TokenType::SLASH:
        case TokenType::PERCENT:
            return PREC_MULTIPLICATIVE;
        default:
            return 0;
    }
}

bool Parser::isComparison(TokenType type) {
    return binaryPrecedence(type) == PREC_COMPARISON;
}

ExprPtr Parser::parse() {
    if (check(TokenType::END_OF_FILE)) {
        fail("Expected expression");
    }
    ExprPtr expr = expression();
    if (!check(TokenType::END_OF_FILE)) {
        fail("Unexpected token '" + current_.lexeme + "'");
    }
    return expr;
}

ExprPtr Parser::expression(int minPrecedence) {
    ExprPtr left = prefix();

    while (true) {
        int precedence = binaryPrecedence(current_.type);
        if (precedence == 0 || precedence < minPrecedence) {
            break;
        }

        if (isComparison(current_.type)) {
            auto compare = std::make_unique<CompareExpr>();
            compare->location = left->location;
            compare->operands.push_back(std::move(left));
            while (isComparison(current_.type)) {
                compare->ops.push_back(current_.type);
                advance();
                compare->operands.push_back(expression(PREC_COMPARISON + 1));
            }
            left = std::move(compare);
            continue;
        }

        auto binary = std::make_unique<BinaryExpr>();
        binary->location = current_.location;
        binary->op = current_.type;
        advance();
        binary->left = std::move(left);
        binary->right = expression(precedence + 1);
        left = std::move(binary);
    }

    return left;
}

ExprPtr Parser::prefix() {
    if (check(TokenType::NOT)) {
        auto unary = std::make_unique<UnaryExpr>();
        unary->location = current_.location;
        unary->op = TokenType::NOT;
        advance();
        unary->operand = expression(PREC_NOT);
        return unary;
    }

    if (check(TokenType::MINUS) || check(TokenType::PLUS)) {
        auto unary = std::make_unique<UnaryExpr>();
        unary->location = current_.location;
        unary->op = current_.type;
        advance();
        unary->operand = expression(PREC_UNARY);
        return unary;
    }

    return primary();
}

ExprPtr Parser::primary() {
    Token token = current_;

    switch (token.type) {
        case TokenType::INTEGER: {
            advance();
            auto lit = std::make_unique<IntegerLiteral>();
            lit->location = token.location;
            lit->value = std::get<int64_t>(token.value);
            return lit;
        }
        case TokenType::FLOAT: {
            advance();
            auto lit = std::make_unique<FloatLiteral>();
            lit->location = token.location;
            lit->value = std::get<double>(token.value);
            return lit;
        }
        case TokenType::STRING: {
            advance();
            auto lit = std::make_unique<StringLiteral>();
            lit->location = token.location;
            lit->value = std::get<std::string>(token.value);
            return lit;
        }
        case TokenType::TRUE:
        case TokenType::FALSE: {
            advance();
            auto lit = std::make_unique<BooleanLiteral>();
            lit->location = token.location;
            lit->value = token.type == TokenType::TRUE;
            return lit;
        }
        case TokenType::NONE: {
            advance();
            auto lit = std::make_unique<NoneLiteral>();
            lit->location = token.location;
            return lit;
        }
        case TokenType::IDENTIFIER: {
            advance();
            if (check(TokenType::LPAREN)) {
                return call(token);
            }
            auto id = std::make_unique<Identifier>();
            id->location = token.location;
            id->name = token.lexeme;
            return id;
        }
        case TokenType::LPAREN: {
            advance();
            ExprPtr inner = expression();
            consume(TokenType::RPAREN, "Expected ')' after expression");
            return inner;
        }
        case TokenType::END_OF_FILE:
            fail("Unexpected end of expression");
        default:
            fail("Unexpected token '" + token.lexeme + "'");
    }
}

ExprPtr Parser::call(const Token& name) {
    consume(TokenType::LPAREN, "Expected '(' after function name");

    auto node = std::make_unique<CallExpr>();
    node->location = name.location;
    node->callee = name.lexeme;

    if (!check(TokenType::RPAREN)) {
        do {
            node->args.push_back(expression());
        } while (match(TokenType::COMMA));
    }

    consume(TokenType::RPAREN, "Expected ')' after arguments");
    return node;
}

} // namespace pdsl
