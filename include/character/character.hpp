#pragma once

#include "interpreter/value.hpp"

#include <map>
#include <optional>
#include <string>

namespace pdsl {

// A character definition: identity plus the global variable store scripts
// read and write. Mutations persist across compositions.
class Character {
public:
    Character(std::string id, std::string displayName = "", std::string kind = "");

    const std::string& id() const { return id_; }
    const std::string& displayName() const { return displayName_; }
    const std::string& kind() const { return kind_; }

    const std::string& mainTemplate() const { return mainTemplate_; }
    void setMainTemplate(const std::string& relPath) { mainTemplate_ = relPath; }

    VariableMap& variables() { return variables_; }
    const VariableMap& variables() const { return variables_; }

    // Host-supplied values; scripts can read but not assign them
    const VariableMap& appVariables() const { return appVariables_; }
    void setAppVariable(const std::string& name, Value value) { appVariables_[name] = std::move(value); }

    // App variables shadow globals
    std::optional<Value> getVariable(const std::string& name) const;

    // Store text, coerced: true/false, integers and floats become typed values;
    // anything else loses its surrounding quotes
    void setVariable(const std::string& name, const std::string& text);
    void setValue(const std::string& name, Value value) { variables_[name] = std::move(value); }

    void applyVariables(const VariableMap& overrides);

    // SYSTEM_DATETIME, e.g. "2024 March 05 (Tuesday) 14:30"
    void stampDateTime();

    static const VariableMap& baseDefaults();
    static const std::map<std::string, VariableMap>& kindOverrides();
    static Value coerce(const std::string& text);

private:
    std::string id_;
    std::string displayName_;
    std::string kind_;
    std::string mainTemplate_ = "main_template.txt";
    VariableMap variables_;
    VariableMap appVariables_;
};

} // namespace pdsl
