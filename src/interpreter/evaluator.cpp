#include "interpreter/evaluator.hpp"
#include "diagnostics/errors.hpp"
#include "diagnostics/logger.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

namespace pdsl {

namespace {

std::string opSymbol(TokenType op) {
    switch (op) {
        case TokenType::PLUS:          return "+";
        case TokenType::MINUS:         return "-";
        case TokenType::STAR:          return "*";
        case TokenType::SLASH:         return "/";
        case TokenType::PERCENT:       return "%";
        case TokenType::EQUALS:        return "==";
        case TokenType::NOT_EQUALS:    return "!=";
        case TokenType::LESS:          return "<";
        case TokenType::GREATER:       return ">";
        case TokenType::LESS_EQUAL:    return "<=";
        case TokenType::GREATER_EQUAL: return ">=";
        default:                       return tokenTypeToString(op);
    }
}

bool isIntegral(const Value& v) {
    return v.isInt() || v.isBool();
}

constexpr int64_t kMinInteger = std::numeric_limits<int64_t>::min();

// Longest string "text" * n may produce
constexpr size_t kMaxRepeatLength = 1 << 20;

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Number of code points in UTF-8 text
int64_t utf8Length(const std::string& text) {
    int64_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

bool valuesEqual(const Value& left, const Value& right) {
    if (left.isNumeric() && right.isNumeric()) {
        if (isIntegral(left) && isIntegral(right)) {
            return left.asInteger() == right.asInteger();
        }
        return left.asNumber() == right.asNumber();
    }
    if (left.isString() && right.isString()) {
        return left.asString() == right.asString();
    }
    return left.isNull() && right.isNull();
}

// Walks one parsed expression. The first failure stops evaluation; every
// visit returns early once failure_ is set.
class TreeWalker : public ASTVisitor {
public:
    explicit TreeWalker(const Scope& scope) : scope_(scope) {}

    EvalOutcome run(Expression& expr) {
        expr.accept(*this);
        if (failure_) {
            return *failure_;
        }
        return currentValue_;
    }

    void visit(IntegerLiteral& node) override { currentValue_ = Value(node.value); }
    void visit(FloatLiteral& node) override { currentValue_ = Value(node.value); }
    void visit(StringLiteral& node) override { currentValue_ = Value(node.value); }
    void visit(BooleanLiteral& node) override { currentValue_ = Value(node.value); }
    void visit(NoneLiteral&) override { currentValue_ = Value(); }

    void visit(Identifier& node) override {
        const Value* value = scope_.find(node.name);
        if (!value) {
            fail(FailureKind::UndefinedName, "name '" + node.name + "' is not defined", node.name);
            return;
        }
        currentValue_ = *value;
    }

    void visit(UnaryExpr& node) override {
        Value operand = eval(*node.operand);
        if (failure_) return;

        switch (node.op) {
            case TokenType::NOT:
                currentValue_ = Value(!operand.isTruthy());
                return;
            case TokenType::MINUS:
                if (isIntegral(operand)) {
                    if (operand.asInteger() == kMinInteger) {
                        fail(FailureKind::BadArgument, "integer overflow");
                        return;
                    }
                    currentValue_ = Value(-operand.asInteger());
                } else if (operand.isFloat()) {
                    currentValue_ = Value(-operand.asFloat());
                } else {
                    fail(FailureKind::TypeMismatch, "bad operand type for unary -: '" + operand.typeName() + "'");
                }
                return;
            case TokenType::PLUS:
                if (isIntegral(operand)) {
                    currentValue_ = Value(operand.asInteger());
                } else if (operand.isFloat()) {
                    currentValue_ = operand;
                } else {
                    fail(FailureKind::TypeMismatch, "bad operand type for unary +: '" + operand.typeName() + "'");
                }
                return;
            default:
                fail(FailureKind::TypeMismatch, "unsupported unary operator " + tokenTypeToString(node.op));
        }
    }

    void visit(BinaryExpr& node) override {
        Value left = eval(*node.left);
        if (failure_) return;

        // and/or yield the deciding operand
        if (node.op == TokenType::AND) {
            if (!left.isTruthy()) {
                currentValue_ = left;
                return;
            }
            currentValue_ = eval(*node.right);
            return;
        }
        if (node.op == TokenType::OR) {
            if (left.isTruthy()) {
                currentValue_ = left;
                return;
            }
            currentValue_ = eval(*node.right);
            return;
        }

        Value right = eval(*node.right);
        if (failure_) return;
        arithmetic(node.op, left, right);
    }

    void visit(CompareExpr& node) override {
        Value left = eval(*node.operands[0]);
        if (failure_) return;

        for (size_t i = 0; i < node.ops.size(); i++) {
            Value right = eval(*node.operands[i + 1]);
            if (failure_) return;

            std::optional<bool> holds = compare(node.ops[i], left, right);
            if (!holds) return;
            if (!*holds) {
                currentValue_ = Value(false);
                return;
            }
            left = std::move(right);
        }
        currentValue_ = Value(true);
    }

    void visit(CallExpr& node) override {
        std::vector<Value> args;
        args.reserve(node.args.size());
        for (auto& arg : node.args) {
            args.push_back(eval(*arg));
            if (failure_) return;
        }
        callBuiltin(node.callee, args);
    }

private:
    const Scope& scope_;
    Value currentValue_;
    std::optional<EvalFailure> failure_;

    Value eval(Expression& expr) {
        expr.accept(*this);
        return currentValue_;
    }

    void fail(FailureKind kind, const std::string& message, const std::string& name = "") {
        if (!failure_) {
            failure_ = EvalFailure{kind, message, name};
        }
        currentValue_ = Value();
    }

    void unsupported(TokenType op, const Value& left, const Value& right) {
        fail(FailureKind::TypeMismatch, "unsupported operand type(s) for " + opSymbol(op) + ": '" +
             left.typeName() + "' and '" + right.typeName() + "'");
    }

    void arithmetic(TokenType op, const Value& left, const Value& right) {
        if (op == TokenType::PLUS) {
            if (left.isString() && right.isString()) {
                currentValue_ = Value(left.asString() + right.asString());
                return;
            }
            if (left.isString()) {
                fail(FailureKind::ConcatMismatch,
                     "can only concatenate str (not \"" + right.typeName() + "\") to str");
                return;
            }
            if (right.isString()) {
                fail(FailureKind::ConcatMismatch, "unsupported operand type(s) for +: '" +
                     left.typeName() + "' and 'str'");
                return;
            }
        }

        if (op == TokenType::STAR) {
            // "ab" * 3
            if (left.isString() && isIntegral(right)) {
                repeat(left.asString(), right.asInteger());
                return;
            }
            if (isIntegral(left) && right.isString()) {
                repeat(right.asString(), left.asInteger());
                return;
            }
        }

        if (!left.isNumeric() || !right.isNumeric()) {
            unsupported(op, left, right);
            return;
        }

        bool integral = isIntegral(left) && isIntegral(right);
        switch (op) {
            case TokenType::PLUS:
            case TokenType::MINUS:
            case TokenType::STAR:
                if (integral) {
                    integerArithmetic(op, left.asInteger(), right.asInteger());
                } else if (op == TokenType::PLUS) {
                    currentValue_ = Value(left.asNumber() + right.asNumber());
                } else if (op == TokenType::MINUS) {
                    currentValue_ = Value(left.asNumber() - right.asNumber());
                } else {
                    currentValue_ = Value(left.asNumber() * right.asNumber());
                }
                return;
            case TokenType::SLASH:
                if (right.asNumber() == 0.0) {
                    fail(FailureKind::DivisionByZero, "division by zero");
                    return;
                }
                currentValue_ = Value(left.asNumber() / right.asNumber());
                return;
            case TokenType::PERCENT:
                modulo(left, right, integral);
                return;
            default:
                unsupported(op, left, right);
        }
    }

    void integerArithmetic(TokenType op, int64_t a, int64_t b) {
        int64_t result = 0;
        bool overflow = false;
        switch (op) {
            case TokenType::PLUS:  overflow = __builtin_add_overflow(a, b, &result); break;
            case TokenType::MINUS: overflow = __builtin_sub_overflow(a, b, &result); break;
            default:               overflow = __builtin_mul_overflow(a, b, &result); break;
        }
        if (overflow) {
            fail(FailureKind::BadArgument, "integer overflow");
            return;
        }
        currentValue_ = Value(result);
    }

    // Floored modulo: the result takes the sign of the divisor
    void modulo(const Value& left, const Value& right, bool integral) {
        if (right.asNumber() == 0.0) {
            fail(FailureKind::DivisionByZero,
                 integral ? "integer division or modulo by zero" : "float modulo");
            return;
        }

        if (integral) {
            int64_t a = left.asInteger();
            int64_t b = right.asInteger();
            if (b == -1) {
                currentValue_ = Value(int64_t{0});
                return;
            }
            int64_t remainder = a % b;
            if (remainder != 0 && ((remainder < 0) != (b < 0))) {
                remainder += b;
            }
            currentValue_ = Value(remainder);
            return;
        }

        double b = right.asNumber();
        double remainder = std::fmod(left.asNumber(), b);
        if (remainder != 0.0 && ((remainder < 0) != (b < 0))) {
            remainder += b;
        }
        currentValue_ = Value(remainder);
    }

    void repeat(const std::string& text, int64_t count) {
        if (count <= 0 || text.empty()) {
            currentValue_ = Value(std::string());
            return;
        }
        if (static_cast<uint64_t>(count) > kMaxRepeatLength / text.size()) {
            fail(FailureKind::BadArgument, "repeated string longer than " + std::to_string(kMaxRepeatLength) +
                 " characters");
            return;
        }
        std::string result;
        result.reserve(text.size() * static_cast<size_t>(count));
        for (int64_t i = 0; i < count; i++) {
            result += text;
        }
        currentValue_ = Value(std::move(result));
    }

    // nullopt means a failure was recorded
    std::optional<bool> compare(TokenType op, const Value& left, const Value& right) {
        if (op == TokenType::EQUALS) return valuesEqual(left, right);
        if (op == TokenType::NOT_EQUALS) return !valuesEqual(left, right);

        int order = 0;
        if (left.isNumeric() && right.isNumeric()) {
            if (isIntegral(left) && isIntegral(right)) {
                int64_t a = left.asInteger();
                int64_t b = right.asInteger();
                order = a < b ? -1 : (a > b ? 1 : 0);
            } else {
                double a = left.asNumber();
                double b = right.asNumber();
                if (std::isnan(a) || std::isnan(b)) return false;
                order = a < b ? -1 : (a > b ? 1 : 0);
            }
        } else if (left.isString() && right.isString()) {
            int c = left.asString().compare(right.asString());
            order = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
            fail(FailureKind::TypeMismatch, "'" + opSymbol(op) + "' not supported between instances of '" +
                 left.typeName() + "' and '" + right.typeName() + "'");
            return std::nullopt;
        }

        switch (op) {
            case TokenType::LESS:          return order < 0;
            case TokenType::GREATER:       return order > 0;
            case TokenType::LESS_EQUAL:    return order <= 0;
            case TokenType::GREATER_EQUAL: return order >= 0;
            default:                       return false;
        }
    }

    bool expectArgs(const std::string& name, const std::vector<Value>& args, size_t min, size_t max) {
        if (args.size() >= min && args.size() <= max) {
            return true;
        }
        std::string expected = min == max ? "exactly " + std::to_string(min) : "at most " + std::to_string(max);
        if (args.size() < min && min != max) {
            expected = "at least " + std::to_string(min);
        }
        fail(FailureKind::BadArgument, name + "() takes " + expected + " argument(s) (" +
             std::to_string(args.size()) + " given)");
        return false;
    }

    void callBuiltin(const std::string& name, const std::vector<Value>& args) {
        if (name == "len") {
            if (!expectArgs(name, args, 1, 1)) return;
            if (!args[0].isString()) {
                fail(FailureKind::TypeMismatch, "object of type '" + args[0].typeName() + "' has no len()");
                return;
            }
            currentValue_ = Value(utf8Length(args[0].asString()));
        } else if (name == "round") {
            builtinRound(args);
        } else if (name == "abs") {
            if (!expectArgs(name, args, 1, 1)) return;
            if (isIntegral(args[0])) {
                int64_t v = args[0].asInteger();
                if (v == kMinInteger) {
                    fail(FailureKind::BadArgument, "integer overflow");
                    return;
                }
                currentValue_ = Value(v < 0 ? -v : v);
            } else if (args[0].isFloat()) {
                currentValue_ = Value(std::fabs(args[0].asFloat()));
            } else {
                fail(FailureKind::TypeMismatch, "bad operand type for abs(): '" + args[0].typeName() + "'");
            }
        } else if (name == "min" || name == "max") {
            builtinMinMax(name, args);
        } else if (name == "str") {
            if (!expectArgs(name, args, 0, 1)) return;
            currentValue_ = Value(args.empty() ? std::string() : args[0].toString());
        } else if (name == "int") {
            builtinInt(args);
        } else if (name == "float") {
            builtinFloat(args);
        } else if (name == "bool") {
            if (!expectArgs(name, args, 0, 1)) return;
            currentValue_ = Value(!args.empty() && args[0].isTruthy());
        } else {
            fail(FailureKind::UnknownFunction, "function '" + name + "' is not available");
        }
    }

    void builtinRound(const std::vector<Value>& args) {
        if (!expectArgs("round", args, 1, 2)) return;
        const Value& number = args[0];
        if (!number.isNumeric()) {
            fail(FailureKind::TypeMismatch, "type " + number.typeName() + " doesn't define __round__ method");
            return;
        }

        // Round half to even, as the default rounding mode does
        if (args.size() == 1 || args[1].isNull()) {
            if (isIntegral(number)) {
                currentValue_ = Value(number.asInteger());
                return;
            }
            double rounded = std::nearbyint(number.asFloat());
            if (!std::isfinite(rounded) || std::fabs(rounded) > 9.2e18) {
                fail(FailureKind::BadArgument, "cannot convert float " + number.toString() + " to integer");
                return;
            }
            currentValue_ = Value(static_cast<int64_t>(rounded));
            return;
        }

        if (!isIntegral(args[1])) {
            fail(FailureKind::TypeMismatch, "'" + args[1].typeName() + "' object cannot be interpreted as an integer");
            return;
        }
        int64_t digits = args[1].asInteger();
        double scale = std::pow(10.0, static_cast<double>(digits));
        if (isIntegral(number)) {
            if (digits >= 0) {
                currentValue_ = Value(number.asInteger());
            } else {
                double rounded = std::nearbyint(static_cast<double>(number.asInteger()) * scale) / scale;
                if (!std::isfinite(rounded)) {
                    // 10**digits underflowed to zero
                    currentValue_ = Value(int64_t{0});
                } else if (std::fabs(rounded) > 9.2e18) {
                    fail(FailureKind::BadArgument, "integer overflow");
                } else {
                    currentValue_ = Value(static_cast<int64_t>(rounded));
                }
            }
            return;
        }
        currentValue_ = Value(std::nearbyint(number.asFloat() * scale) / scale);
    }

    void builtinMinMax(const std::string& name, const std::vector<Value>& args) {
        if (args.empty()) {
            fail(FailureKind::BadArgument, name + " expected at least 1 argument, got 0");
            return;
        }
        bool wantMax = name == "max";

        if (args.size() == 1) {
            // A single string is iterated character by character
            if (!args[0].isString()) {
                fail(FailureKind::TypeMismatch, "'" + args[0].typeName() + "' object is not iterable");
                return;
            }
            const std::string& text = args[0].asString();
            if (text.empty()) {
                fail(FailureKind::BadArgument, name + "() arg is an empty sequence");
                return;
            }
            char best = text[0];
            for (char c : text) {
                if (wantMax ? c > best : c < best) best = c;
            }
            currentValue_ = Value(std::string(1, best));
            return;
        }

        Value best = args[0];
        for (size_t i = 1; i < args.size(); i++) {
            std::optional<bool> better = compare(wantMax ? TokenType::GREATER : TokenType::LESS, args[i], best);
            if (!better) return;
            if (*better) best = args[i];
        }
        currentValue_ = best;
    }

    void builtinInt(const std::vector<Value>& args) {
        if (!expectArgs("int", args, 0, 1)) return;
        if (args.empty()) {
            currentValue_ = Value(0);
            return;
        }
        const Value& v = args[0];
        if (isIntegral(v)) {
            currentValue_ = Value(v.asInteger());
        } else if (v.isFloat()) {
            double truncated = std::trunc(v.asFloat());
            if (!std::isfinite(truncated) || std::fabs(truncated) > 9.2e18) {
                fail(FailureKind::BadArgument, "cannot convert float " + v.toString() + " to integer");
                return;
            }
            currentValue_ = Value(static_cast<int64_t>(truncated));
        } else if (v.isString()) {
            std::string text = trim(v.asString());
            char* end = nullptr;
            errno = 0;
            long long parsed = text.empty() ? 0 : std::strtoll(text.c_str(), &end, 10);
            if (text.empty() || *end != '\0' || errno == ERANGE) {
                fail(FailureKind::BadArgument, "invalid literal for int() with base 10: '" + v.asString() + "'");
                return;
            }
            currentValue_ = Value(static_cast<int64_t>(parsed));
        } else {
            fail(FailureKind::TypeMismatch,
                 "int() argument must be a string, a bytes-like object or a real number, not '" + v.typeName() + "'");
        }
    }

    void builtinFloat(const std::vector<Value>& args) {
        if (!expectArgs("float", args, 0, 1)) return;
        if (args.empty()) {
            currentValue_ = Value(0.0);
            return;
        }
        const Value& v = args[0];
        if (v.isNumeric()) {
            currentValue_ = Value(v.asNumber());
        } else if (v.isString()) {
            std::string text = trim(v.asString());
            char* end = nullptr;
            double parsed = text.empty() ? 0.0 : std::strtod(text.c_str(), &end);
            if (text.empty() || *end != '\0') {
                fail(FailureKind::BadArgument, "could not convert string to float: '" + v.asString() + "'");
                return;
            }
            currentValue_ = Value(parsed);
        } else {
            fail(FailureKind::TypeMismatch,
                 "float() argument must be a string or a real number, not '" + v.typeName() + "'");
        }
    }
};

std::string failureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::UndefinedName:   return "NameError";
        case FailureKind::ConcatMismatch:  return "TypeError";
        case FailureKind::TypeMismatch:    return "TypeError";
        case FailureKind::DivisionByZero:  return "ZeroDivisionError";
        case FailureKind::UnknownFunction: return "NameError";
        case FailureKind::BadArgument:     return "ValueError";
    }
    return "Error";
}

} // namespace

Evaluator::Evaluator(Logger& logger, IncludeHost* host)
    : logger_(logger), host_(host) {}

EvalOutcome Evaluator::tryEvaluate(Expression& expr, const Scope& scope) const {
    TreeWalker walker(scope);
    return walker.run(expr);
}

std::string Evaluator::expandDirectives(const std::string& expression, const EvalSite& site) {
    auto directives = findInlineDirectives(expression);
    if (directives.empty()) {
        return expression;
    }
    if (!host_) {
        throw EvaluationError("Inline LOAD directives are not available here", site.file, site.line, site.lineText);
    }

    std::string result;
    size_t last = 0;
    for (const auto& directive : directives) {
        logger_.debug("Expanding inline " + directiveToString(directive), site.file, site.line);
        result += expression.substr(last, directive.position - last);
        result += quoteLiteral(host_->expandDirective(directive, site.file));
        last = directive.position + directive.length;
    }
    result += expression.substr(last);
    return result;
}

Value Evaluator::evaluate(const std::string& expression, Scope& scope, const EvalSite& site) {
    std::string source = expandDirectives(expression, site);

    ExprPtr tree;
    try {
        Lexer lexer(source, site.file);
        Parser parser(lexer);
        tree = parser.parse();
    } catch (const std::runtime_error& e) {
        throw EvaluationError("Invalid expression", site.file, site.line, site.lineText,
                              std::string("SyntaxError: ") + e.what());
    }

    int fills = 0;
    EvalOutcome outcome = tryEvaluate(*tree, scope);

    while (true) {
        if (auto* value = std::get_if<Value>(&outcome)) {
            return *value;
        }
        EvalFailure failure = std::get<EvalFailure>(outcome);

        if (failure.kind == FailureKind::UndefinedName && fills < kMaxNameFills) {
            fills++;
            logger_.warning("Auto-repair: '" + failure.name + "' is not defined, using None", site.file, site.line);
            scope.bindLocal(failure.name, Value());
            outcome = tryEvaluate(*tree, scope);
            continue;
        }

        if (failure.kind == FailureKind::ConcatMismatch) {
            logger_.warning("Auto-repair: retrying with variables converted to strings (" + failure.message + ")",
                            site.file, site.line);
            VariableMap coerced = scope.flatten();
            for (auto& [name, value] : coerced) {
                if (!value.isString()) {
                    value = Value(value.toString());
                }
            }
            VariableMap noGlobals;
            Scope coercedScope(noGlobals, nullptr, coerced);
            EvalOutcome retry = tryEvaluate(*tree, coercedScope);
            if (auto* value = std::get_if<Value>(&retry)) {
                return *value;
            }
            throw EvaluationError("Expression evaluation failed", site.file, site.line, site.lineText,
                                  failureKindName(failure.kind) + ": " + failure.message);
        }

        throw EvaluationError("Expression evaluation failed", site.file, site.line, site.lineText,
                              failureKindName(failure.kind) + ": " + failure.message);
    }
}

} // namespace pdsl
