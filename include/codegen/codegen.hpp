#pragma once

#include "ast/scriptAst.hpp"

#include <map>
#include <string>

namespace pdsl {

struct GeneratedScript {
    std::string text;
    std::map<int, NodeId> lineToNode;   // 1-based physical line -> node
};

// Emits canonical script text from a statement tree: one statement per line,
// four spaces per nesting level, "IF ... THEN" / "ELSEIF ... THEN" / "ELSE" / "ENDIF".
class CodeGenerator {
public:
    GeneratedScript generate(const Script& script);

private:
    std::string text_;
    int line_ = 0;
    std::map<int, NodeId> lineToNode_;

    void emit(int indent, const std::string& statement, NodeId id);
    void generateBlock(const Block& block, int indent);
    void generateNode(const ScriptNode& node, int indent);
};

// Shorthand for CodeGenerator().generate(script)
GeneratedScript generateScript(const Script& script);

} // namespace pdsl
