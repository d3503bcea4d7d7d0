#pragma once

#include "lexer/token.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pdsl {

// Forward declarations
struct ASTVisitor;

// Base AST node
struct ASTNode {
    SourceLocation location;
    virtual ~ASTNode() = default;
    virtual void accept(ASTVisitor& visitor) = 0;
};

// Expression nodes
struct Expression : ASTNode {};
using ExprPtr = std::unique_ptr<Expression>;

struct IntegerLiteral : Expression {
    int64_t value;
    void accept(ASTVisitor& visitor) override;
};

struct FloatLiteral : Expression {
    double value;
    void accept(ASTVisitor& visitor) override;
};

struct StringLiteral : Expression {
    std::string value;
    void accept(ASTVisitor& visitor) override;
};

struct BooleanLiteral : Expression {
    bool value;
    void accept(ASTVisitor& visitor) override;
};

struct NoneLiteral : Expression {
    void accept(ASTVisitor& visitor) override;
};

struct Identifier : Expression {
    std::string name;
    void accept(ASTVisitor& visitor) override;
};

// -x, +x, not x
struct UnaryExpr : Expression {
    TokenType op;
    ExprPtr operand;
    void accept(ASTVisitor& visitor) override;
};

// Arithmetic and the short-circuiting and/or
struct BinaryExpr : Expression {
    ExprPtr left;
    TokenType op;
    ExprPtr right;
    void accept(ASTVisitor& visitor) override;
};

// a < b <= c chains; every adjacent pair must hold
struct CompareExpr : Expression {
    std::vector<ExprPtr> operands;
    std::vector<TokenType> ops;   // operands.size() - 1 entries
    void accept(ASTVisitor& visitor) override;
};

// Call of an allow-listed builtin: len(x), round(x, 2), ...
struct CallExpr : Expression {
    std::string callee;
    std::vector<ExprPtr> args;
    void accept(ASTVisitor& visitor) override;
};

// Visitor interface
struct ASTVisitor {
    virtual ~ASTVisitor() = default;
    virtual void visit(IntegerLiteral& node) = 0;
    virtual void visit(FloatLiteral& node) = 0;
    virtual void visit(StringLiteral& node) = 0;
    virtual void visit(BooleanLiteral& node) = 0;
    virtual void visit(NoneLiteral& node) = 0;
    virtual void visit(Identifier& node) = 0;
    virtual void visit(UnaryExpr& node) = 0;
    virtual void visit(BinaryExpr& node) = 0;
    virtual void visit(CompareExpr& node) = 0;
    virtual void visit(CallExpr& node) = 0;
};

} // namespace pdsl
