#pragma once

#include "interpreter/value.hpp"

#include <string>

namespace pdsl {

// Name lookup for one evaluation: locals win over app variables, which win
// over the character's globals. Only the local layer is writable here.
class Scope {
public:
    Scope(const VariableMap& globals, const VariableMap* appVariables, VariableMap& locals)
        : globals_(globals), appVariables_(appVariables), locals_(locals) {}

    const Value* find(const std::string& name) const;

    void bindLocal(const std::string& name, Value value) { locals_[name] = std::move(value); }

    // Every visible name with its winning value
    VariableMap flatten() const;

private:
    const VariableMap& globals_;
    const VariableMap* appVariables_;
    VariableMap& locals_;
};

} // namespace pdsl
