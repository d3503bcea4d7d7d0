#include "interpreter/scope.hpp"

namespace pdsl {

const Value* Scope::find(const std::string& name) const {
    auto local = locals_.find(name);
    if (local != locals_.end()) {
        return &local->second;
    }
    if (appVariables_) {
        auto app = appVariables_->find(name);
        if (app != appVariables_->end()) {
            return &app->second;
        }
    }
    auto global = globals_.find(name);
    if (global != globals_.end()) {
        return &global->second;
    }
    return nullptr;
}

VariableMap Scope::flatten() const {
    VariableMap merged = globals_;
    if (appVariables_) {
        for (const auto& [name, value] : *appVariables_) {
            merged[name] = value;
        }
    }
    for (const auto& [name, value] : locals_) {
        merged[name] = value;
    }
    return merged;
}

} // namespace pdsl
