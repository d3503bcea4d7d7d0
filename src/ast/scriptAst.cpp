#include "ast/scriptAst.hpp"

#include <atomic>

namespace pdsl {

namespace {

const ScriptNode* findInBlock(const Block& block, NodeId id) {
    for (const auto& node : block) {
        if (node.id == id) {
            return &node;
        }
        if (const auto* ifNode = std::get_if<IfNode>(&node.data)) {
            for (const auto& branch : ifNode->branches) {
                if (const ScriptNode* found = findInBlock(branch.body, id)) {
                    return found;
                }
            }
            if (ifNode->elseBody) {
                if (const ScriptNode* found = findInBlock(*ifNode->elseBody, id)) {
                    return found;
                }
            }
        }
    }
    return nullptr;
}

} // namespace

NodeId nextNodeId() {
    static std::atomic<NodeId> counter{0};
    return ++counter;
}

const ScriptNode* findNode(const Script& script, NodeId id) {
    return findInBlock(script.body, id);
}

} // namespace pdsl
