#pragma once

#include "ast/ast.hpp"
#include "interpreter/includeHost.hpp"
#include "interpreter/scope.hpp"
#include "interpreter/value.hpp"

#include <string>
#include <variant>

namespace pdsl {

class Logger;

enum class FailureKind {
    UndefinedName,
    ConcatMismatch,     // str + non-str
    TypeMismatch,
    DivisionByZero,
    UnknownFunction,
    BadArgument
};

struct EvalFailure {
    FailureKind kind;
    std::string message;
    std::string name;   // offending identifier for UndefinedName
};

using EvalOutcome = std::variant<Value, EvalFailure>;

// Where an expression came from, for error reports
struct EvalSite {
    std::string file;
    int line = 0;
    std::string lineText;
};

class Evaluator {
public:
    static constexpr int kMaxNameFills = 10;

    explicit Evaluator(Logger& logger, IncludeHost* host = nullptr);

    void setIncludeHost(IncludeHost* host) { host_ = host; }

    /**
     * Evaluate expression text in a scope.
     * Inline LOAD directives are expanded first. Undefined names are bound to
     * None in the local layer (at most kMaxNameFills times) and a str/number
     * concatenation is retried once with every variable stringified.
     * @throws EvaluationError when the text doesn't parse or every repair failed
     * @throws DslError raised while loading an inline directive
     */
    Value evaluate(const std::string& expression, Scope& scope, const EvalSite& site);

    // One attempt against a parsed tree, no repairs
    EvalOutcome tryEvaluate(Expression& expr, const Scope& scope) const;

    // Replace inline directives with quoted literals of their content
    std::string expandDirectives(const std::string& expression, const EvalSite& site);

private:
    Logger& logger_;
    IncludeHost* host_;
};

} // namespace pdsl
