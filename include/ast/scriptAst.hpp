#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pdsl {

// Statement-level tree of a script, shared by the visual editing surface.
// Expressions stay as text; they are parsed when the script runs.

using NodeId = uint64_t;

// Unique for the lifetime of the process
NodeId nextNodeId();

struct ScriptNode;
using Block = std::vector<ScriptNode>;

struct SetNode {
    std::string variable;
    std::string expression;
    bool local = false;
};

struct LogNode {
    std::string expression;
};

struct AddSystemInfoNode {
    std::string argument;   // expression or LOAD directive
};

struct ReturnNode {
    std::string argument;   // expression or LOAD directive
};

struct IfBranch {
    std::string condition;
    Block body;
};

// IF plus every ELSEIF, in order; ELSE is optional
struct IfNode {
    std::vector<IfBranch> branches;
    std::optional<Block> elseBody;
};

struct ScriptNode {
    using Data = std::variant<SetNode, LogNode, AddSystemInfoNode, ReturnNode, IfNode>;

    NodeId id;
    Data data;
    int line = 0;   // source line it was parsed from, 0 when built in memory

    explicit ScriptNode(Data d, int sourceLine = 0)
        : id(nextNodeId()), data(std::move(d)), line(sourceLine) {}
};

struct Script {
    Block body;
};

// Depth-first lookup, nullptr if no node has that id
const ScriptNode* findNode(const Script& script, NodeId id);

} // namespace pdsl
