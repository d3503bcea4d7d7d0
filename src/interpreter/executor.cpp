#include "interpreter/executor.hpp"
#include "character/character.hpp"
#include "diagnostics/errors.hpp"
#include "diagnostics/logger.hpp"

#include <functional>

namespace pdsl {

namespace {

constexpr size_t kLogPrefixWidth = 40;

std::string logPrefix(const std::string& file, int line) {
    std::string prefix = baseName(file) + ":" + std::to_string(line);
    if (prefix.size() < kLogPrefixWidth) {
        prefix.append(kLogPrefixWidth - prefix.size(), ' ');
    }
    return prefix;
}

// Turns any failure of one script run into its inline marker
std::string guarded(Logger& logger, const std::string& name, const std::function<std::string()>& body) {
    try {
        return body();
    } catch (const DslError& e) {
        logger.error(e.what(), e.file().empty() ? name : e.file(), e.line());
        return "[DSL ERROR IN " + name + "]";
    } catch (const std::exception& e) {
        logger.error(std::string("Internal error: ") + e.what(), name);
        return "[INTERNAL ERROR IN " + name + "]";
    }
}

} // namespace

ScriptExecutor::ScriptExecutor(Character& character,
                               PathResolver& resolver,
                               Evaluator& evaluator,
                               IncludeHost& host,
                               Logger& logger,
                               ScriptOutput& output)
    : character_(character),
      resolver_(resolver),
      evaluator_(evaluator),
      host_(host),
      logger_(logger),
      output_(output) {}

std::string ScriptExecutor::run(const ResourceId& id, const std::string& displayPath) {
    logger_.debug("Executing script " + displayPath + " (resolved: " + id.str() + ")");
    return guarded(logger_, baseName(id.str()), [&]() {
        ContextGuard guard(resolver_, resolver_.dirname(id));
        std::string content = resolver_.load(id);
        return guardedExecute(content, displayPath);
    });
}

std::string ScriptExecutor::runSource(const std::string& source, const std::string& virtualId) {
    logger_.debug("Executing script source " + virtualId);
    return guarded(logger_, baseName(virtualId), [&]() {
        return guardedExecute(source, virtualId);
    });
}

std::string ScriptExecutor::guardedExecute(const std::string& content, const std::string& file) {
    if (nesting_ >= kMaxNesting) {
        throw DslError("Scripts nested more than " + std::to_string(kMaxNesting) + " levels deep", file);
    }
    nesting_++;
    struct NestingReset {
        int& nesting;
        ~NestingReset() { nesting--; }
    } reset{nesting_};

    return execute(content, file);
}

bool ScriptExecutor::anySkipping(const std::vector<IfFrame>& stack, size_t count) {
    for (size_t i = 0; i < count; i++) {
        if (stack[i].skip) return true;
    }
    return false;
}

std::string ScriptExecutor::execute(const std::string& content, const std::string& file) {
    std::vector<LogicalLine> lines = segmentLines(content, file);
    LocalScope locals;
    std::vector<IfFrame> ifStack;

    for (const auto& line : lines) {
        std::optional<Statement> statement = classifyLine(line.text);
        if (!statement) {
            continue;
        }

        EvalSite site{file, line.line, trimText(line.text)};
        bool skipping = anySkipping(ifStack, ifStack.size());

        switch (statement->kind) {
            case StatementKind::If: {
                bool taken = false;
                if (!skipping) {
                    if (trace_) trace_->push_back(line.line);
                    taken = evaluateCondition(stripThen(statement->argument), locals, site);
                }
                ifStack.push_back({taken, skipping || !taken});
                continue;
            }

            case StatementKind::ElseIf: {
                if (ifStack.empty()) {
                    throw ParseError("ELSEIF without IF", file, line.line, site.lineText);
                }
                IfFrame& frame = ifStack.back();
                bool parentSkip = anySkipping(ifStack, ifStack.size() - 1);
                if (!parentSkip && !frame.branchTaken) {
                    if (trace_) trace_->push_back(line.line);
                    bool met = evaluateCondition(stripThen(statement->argument), locals, site);
                    frame.branchTaken = met;
                    frame.skip = !met;
                } else {
                    frame.skip = true;
                }
                continue;
            }

            case StatementKind::Else: {
                if (ifStack.empty()) {
                    throw ParseError("ELSE without IF", file, line.line, site.lineText);
                }
                if (!statement->argument.empty()) {
                    throw ParseError("ELSE statement should not have conditions or other text", file, line.line, site.lineText);
                }
                IfFrame& frame = ifStack.back();
                bool parentSkip = anySkipping(ifStack, ifStack.size() - 1);
                frame.skip = parentSkip || frame.branchTaken;
                if (!frame.skip) {
                    frame.branchTaken = true;
                    if (trace_) trace_->push_back(line.line);
                }
                continue;
            }

            case StatementKind::EndIf:
                if (ifStack.empty()) {
                    throw ParseError("ENDIF without IF", file, line.line, site.lineText);
                }
                if (!statement->argument.empty()) {
                    throw ParseError("ENDIF statement should not have other text", file, line.line, site.lineText);
                }
                ifStack.pop_back();
                continue;

            default:
                break;
        }

        if (skipping) {
            continue;
        }
        if (trace_) trace_->push_back(line.line);

        switch (statement->kind) {
            case StatementKind::Set:
                executeSet(*statement, locals, site);
                break;
            case StatementKind::Log:
                executeLog(*statement, locals, site);
                break;
            case StatementKind::AddSystemInfo:
                executeAddSystemInfo(*statement, locals, site);
                break;
            case StatementKind::Return:
                return executeReturn(*statement, locals, site);
            default:
                throw ParseError("Unknown DSL command '" + statement->keyword + "'", file, line.line, site.lineText);
        }
    }

    if (!ifStack.empty()) {
        logger_.warning("Script ended with unterminated IF block(s)", file);
    }
    return "";
}

Value ScriptExecutor::evaluate(const std::string& expression, LocalScope& locals, const EvalSite& site) {
    Scope scope(character_.variables(), &character_.appVariables(), locals.values);
    return evaluator_.evaluate(expression, scope, site);
}

bool ScriptExecutor::evaluateCondition(const std::string& condition, LocalScope& locals, const EvalSite& site) {
    return evaluate(condition, locals, site).isTruthy();
}

void ScriptExecutor::executeSet(const Statement& statement, LocalScope& locals, const EvalSite& site) {
    SetStatement set;
    if (auto error = parseSetArgument(statement.argument, set)) {
        throw ParseError(*error, site.file, site.line, site.lineText);
    }

    Value value = evaluate(set.expression, locals, site);
    logger_.debug("SET " + std::string(set.local ? "LOCAL " : "") + set.variable + " = " + value.toString(),
                  site.file, site.line);

    if (set.local) {
        locals.declared.insert(set.variable);
        locals.values[set.variable] = std::move(value);
    } else if (locals.declared.count(set.variable)) {
        locals.values[set.variable] = std::move(value);
    } else {
        // An auto-filled None must not shadow the new global
        locals.values.erase(set.variable);
        character_.setValue(set.variable, std::move(value));
    }
}

void ScriptExecutor::executeLog(const Statement& statement, LocalScope& locals, const EvalSite& site) {
    std::string prefix = logPrefix(site.file, site.line);
    try {
        Value value = evaluate(statement.argument, locals, site);
        std::string entry = prefix + "| " + value.toString();
        output_.logs.push_back(entry);
        logger_.info(entry);
    } catch (const DslError& e) {
        // A failing LOG never stops the script
        output_.logs.push_back(prefix + "| LOG ERROR: " + e.what());
        logger_.warning(std::string("LOG failed: ") + e.what(), site.file, site.line);
    }
}

void ScriptExecutor::executeAddSystemInfo(const Statement& statement, LocalScope& locals, const EvalSite& site) {
    if (statement.argument.empty()) {
        throw ParseError("ADD_SYSTEM_INFO requires an argument (expression or LOAD command)",
                         site.file, site.line, site.lineText);
    }

    std::string content;
    if (auto directive = parseSoleDirective(statement.argument)) {
        try {
            if (directive->kind == DirectiveKind::LoadTag) {
                content = host_.expandDirective(*directive, site.file);
            } else {
                content = host_.includeFile(directive->path);
            }
        } catch (const DslError& e) {
            throw DslError("Error in ADD_SYSTEM_INFO " + directiveToString(*directive),
                           site.file, site.line, site.lineText, e.what());
        }
    } else {
        content = evaluate(statement.argument, locals, site).toString();
    }

    if (!trimText(content).empty()) {
        output_.systemInfos.push_back(content);
    }
}

std::string ScriptExecutor::executeReturn(const Statement& statement, LocalScope& locals, const EvalSite& site) {
    if (statement.argument.empty()) {
        throw ParseError("RETURN requires an argument", site.file, site.line, site.lineText);
    }

    if (auto directive = parseSoleDirective(statement.argument)) {
        try {
            return host_.expandDirective(*directive, site.file);
        } catch (const DslError& e) {
            throw DslError("Error in RETURN " + directiveToString(*directive),
                           site.file, site.line, site.lineText, e.what());
        }
    }

    std::string text = evaluate(statement.argument, locals, site).toString();
    return host_.expand(text, "RETURN in " + site.file + ":" + std::to_string(site.line));
}

} // namespace pdsl
