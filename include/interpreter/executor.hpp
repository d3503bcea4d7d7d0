#pragma once

#include "interpreter/evaluator.hpp"
#include "interpreter/includeHost.hpp"
#include "interpreter/statement.hpp"
#include "lexer/lineSegmenter.hpp"
#include "resolver/pathResolver.hpp"

#include <set>
#include <string>
#include <vector>

namespace pdsl {

class Character;
class Logger;

// Side channels filled while scripts run
struct ScriptOutput {
    std::vector<std::string> logs;          // "<file>:<line>      | value"
    std::vector<std::string> systemInfos;   // ADD_SYSTEM_INFO results

    void clear() {
        logs.clear();
        systemInfos.clear();
    }
};

// Line-driven interpreter for .script/.system files. Each run owns a fresh
// local scope; nothing leaks into or out of nested runs.
class ScriptExecutor {
public:
    static constexpr int kMaxNesting = 32;

    ScriptExecutor(Character& character,
                   PathResolver& resolver,
                   Evaluator& evaluator,
                   IncludeHost& host,
                   Logger& logger,
                   ScriptOutput& output);

    // Run the script stored at id. Failures come back as an inline
    // "[DSL ERROR IN <file>]" marker instead of propagating.
    std::string run(const ResourceId& id, const std::string& displayPath);

    // Run script text that has no file behind it, in the current context
    std::string runSource(const std::string& source, const std::string& virtualId);

    // Record the physical line of every executed statement (null to stop)
    void setTrace(std::vector<int>* trace) { trace_ = trace; }

private:
    struct LocalScope {
        VariableMap values;
        std::set<std::string> declared;
    };

    struct IfFrame {
        bool branchTaken;
        bool skip;
    };

    Character& character_;
    PathResolver& resolver_;
    Evaluator& evaluator_;
    IncludeHost& host_;
    Logger& logger_;
    ScriptOutput& output_;
    std::vector<int>* trace_ = nullptr;
    int nesting_ = 0;

    std::string guardedExecute(const std::string& content, const std::string& file);
    std::string execute(const std::string& content, const std::string& file);

    Value evaluate(const std::string& expression, LocalScope& locals, const EvalSite& site);
    bool evaluateCondition(const std::string& condition, LocalScope& locals, const EvalSite& site);

    void executeSet(const Statement& statement, LocalScope& locals, const EvalSite& site);
    void executeLog(const Statement& statement, LocalScope& locals, const EvalSite& site);
    void executeAddSystemInfo(const Statement& statement, LocalScope& locals, const EvalSite& site);
    std::string executeReturn(const Statement& statement, LocalScope& locals, const EvalSite& site);

    static bool anySkipping(const std::vector<IfFrame>& stack, size_t count);
};

} // namespace pdsl
