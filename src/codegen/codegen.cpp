#include "codegen/codegen.hpp"

#include <algorithm>

namespace pdsl {

GeneratedScript CodeGenerator::generate(const Script& script) {
    text_.clear();
    line_ = 0;
    lineToNode_.clear();

    generateBlock(script.body, 0);
    return GeneratedScript{text_, lineToNode_};
}

void CodeGenerator::emit(int indent, const std::string& statement, NodeId id) {
    lineToNode_[line_ + 1] = id;
    text_ += std::string(static_cast<size_t>(indent) * 4, ' ');
    text_ += statement;
    text_ += "\n";
    // Multiline literals span several physical lines
    line_ += 1 + static_cast<int>(std::count(statement.begin(), statement.end(), '\n'));
}

void CodeGenerator::generateBlock(const Block& block, int indent) {
    for (const auto& node : block) {
        generateNode(node, indent);
    }
}

void CodeGenerator::generateNode(const ScriptNode& node, int indent) {
    if (const auto* set = std::get_if<SetNode>(&node.data)) {
        emit(indent, std::string("SET ") + (set->local ? "LOCAL " : "") + set->variable + " = " + set->expression,
             node.id);
    } else if (const auto* log = std::get_if<LogNode>(&node.data)) {
        emit(indent, "LOG " + log->expression, node.id);
    } else if (const auto* info = std::get_if<AddSystemInfoNode>(&node.data)) {
        emit(indent, "ADD_SYSTEM_INFO " + info->argument, node.id);
    } else if (const auto* ret = std::get_if<ReturnNode>(&node.data)) {
        emit(indent, "RETURN " + ret->argument, node.id);
    } else if (const auto* ifNode = std::get_if<IfNode>(&node.data)) {
        for (size_t i = 0; i < ifNode->branches.size(); i++) {
            const IfBranch& branch = ifNode->branches[i];
            emit(indent, (i == 0 ? "IF " : "ELSEIF ") + branch.condition + " THEN", node.id);
            generateBlock(branch.body, indent + 1);
        }
        if (ifNode->elseBody) {
            emit(indent, "ELSE", node.id);
            generateBlock(*ifNode->elseBody, indent + 1);
        }
        emit(indent, "ENDIF", node.id);
    }
}

GeneratedScript generateScript(const Script& script) {
    return CodeGenerator().generate(script);
}

} // namespace pdsl
