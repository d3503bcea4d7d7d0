#include "parser/scriptParser.hpp"
#include "diagnostics/errors.hpp"
#include "interpreter/statement.hpp"
#include "lexer/lineSegmenter.hpp"

namespace pdsl {

namespace {

class ScriptParser {
public:
    ScriptParser(std::vector<LogicalLine> lines, std::string file, std::vector<Diagnostic>& diagnostics)
        : lines_(std::move(lines)), file_(std::move(file)), diagnostics_(diagnostics) {}

    Block parseBody() {
        return parseBlock(false);
    }

private:
    std::vector<LogicalLine> lines_;
    size_t pos_ = 0;
    std::string file_;
    std::vector<Diagnostic>& diagnostics_;

    void error(const std::string& message, int line) {
        diagnostics_.emplace_back(message, file_, line);
    }

    static bool isBranchKeyword(StatementKind kind) {
        return kind == StatementKind::ElseIf || kind == StatementKind::Else || kind == StatementKind::EndIf;
    }

    // Stops in front of ELSEIF/ELSE/ENDIF when inside an IF
    Block parseBlock(bool insideIf) {
        Block block;
        while (pos_ < lines_.size()) {
            const LogicalLine& line = lines_[pos_];
            std::optional<Statement> statement = classifyLine(line.text);
            if (!statement) {
                pos_++;
                continue;
            }

            if (isBranchKeyword(statement->kind)) {
                if (insideIf) {
                    return block;
                }
                error(statement->keyword + " without IF", line.line);
                pos_++;
                continue;
            }

            pos_++;
            if (statement->kind == StatementKind::If) {
                block.push_back(parseIf(*statement, line.line));
                continue;
            }
            if (auto node = parseSimple(*statement, line.line)) {
                block.push_back(std::move(*node));
            }
        }
        return block;
    }

    std::optional<ScriptNode> parseSimple(const Statement& statement, int line) {
        switch (statement.kind) {
            case StatementKind::Set: {
                SetStatement set;
                if (auto message = parseSetArgument(statement.argument, set)) {
                    error(*message, line);
                    return std::nullopt;
                }
                return ScriptNode(SetNode{set.variable, set.expression, set.local}, line);
            }
            case StatementKind::Log:
                if (statement.argument.empty()) {
                    error("LOG requires an expression", line);
                    return std::nullopt;
                }
                return ScriptNode(LogNode{statement.argument}, line);
            case StatementKind::AddSystemInfo:
                if (statement.argument.empty()) {
                    error("ADD_SYSTEM_INFO requires an argument (expression or LOAD command)", line);
                    return std::nullopt;
                }
                return ScriptNode(AddSystemInfoNode{statement.argument}, line);
            case StatementKind::Return:
                if (statement.argument.empty()) {
                    error("RETURN requires an argument", line);
                    return std::nullopt;
                }
                return ScriptNode(ReturnNode{statement.argument}, line);
            default:
                error("Unknown DSL command '" + statement.keyword + "'", line);
                return std::nullopt;
        }
    }

    ScriptNode parseIf(const Statement& statement, int line) {
        IfNode node;
        std::string condition = stripThen(statement.argument);
        if (condition.empty()) {
            error("IF requires a condition", line);
        }
        node.branches.push_back({condition, parseBlock(true)});

        while (true) {
            if (pos_ >= lines_.size()) {
                error("Unterminated IF block", line);
                break;
            }

            const LogicalLine& current = lines_[pos_++];
            Statement branch = *classifyLine(current.text);

            if (branch.kind == StatementKind::ElseIf) {
                if (node.elseBody) {
                    error("ELSEIF after ELSE", current.line);
                }
                std::string branchCondition = stripThen(branch.argument);
                if (branchCondition.empty()) {
                    error("ELSEIF requires a condition", current.line);
                }
                node.branches.push_back({branchCondition, parseBlock(true)});
            } else if (branch.kind == StatementKind::Else) {
                if (!branch.argument.empty()) {
                    error("ELSE statement should not have conditions or other text", current.line);
                }
                if (node.elseBody) {
                    error("Duplicate ELSE", current.line);
                }
                node.elseBody = parseBlock(true);
            } else {
                if (!branch.argument.empty()) {
                    error("ENDIF statement should not have other text", current.line);
                }
                break;
            }
        }
        return ScriptNode(std::move(node), line);
    }
};

} // namespace

ScriptParseResult parseScript(const std::string& text, const std::string& file) {
    ScriptParseResult result;
    std::vector<LogicalLine> lines;
    try {
        lines = segmentLines(text, file);
    } catch (const ParseError& e) {
        result.diagnostics.emplace_back(e.message(), file, e.line());
        return result;
    }

    ScriptParser parser(std::move(lines), file, result.diagnostics);
    result.script.body = parser.parseBody();
    return result;
}

} // namespace pdsl
