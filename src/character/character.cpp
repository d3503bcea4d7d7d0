#include "character/character.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>

namespace pdsl {

const VariableMap& Character::baseDefaults() {
    static const VariableMap defaults = {
        {"attitude", Value(60)},
        {"boredom", Value(10)},
        {"stress", Value(5)},
        {"secretExposed", Value(false)},
        {"current_fsm_state", Value("Hello")},
        {"available_action_level", Value(1)},
        {"PlayingFirst", Value(false)},
        {"secretExposedFirst", Value(false)},
        {"secret_exposed_event_text_shown", Value(false)},
        {"LongMemoryRememberCount", Value(0)},
        {"player_name", Value("Player")},
        {"player_name_known", Value(false)},
    };
    return defaults;
}

const std::map<std::string, VariableMap>& Character::kindOverrides() {
    static const std::map<std::string, VariableMap> overrides = {
        {"crazy", {{"attitude", Value(50)}, {"boredom", Value(20)}, {"stress", Value(8)}}},
        {"kind", {{"attitude", Value(90)}, {"stress", Value(0)}}},
        {"shorthair", {{"attitude", Value(70)}, {"boredom", Value(15)}, {"stress", Value(10)}}},
        {"cappy", {{"boredom", Value(25)}}},
        {"mila", {{"attitude", Value(75)}}},
        {"creepy", {{"attitude", Value(40)}, {"stress", Value(30)}}},
        {"sleepy", {{"boredom", Value(40)}}},
    };
    return overrides;
}

Character::Character(std::string id, std::string displayName, std::string kind)
    : id_(std::move(id)),
      displayName_(displayName.empty() ? id_ : std::move(displayName)),
      kind_(std::move(kind)),
      variables_(baseDefaults()) {
    if (!kind_.empty()) {
        auto it = kindOverrides().find(kind_);
        if (it != kindOverrides().end()) {
            applyVariables(it->second);
        }
    }
    stampDateTime();
}

std::optional<Value> Character::getVariable(const std::string& name) const {
    auto app = appVariables_.find(name);
    if (app != appVariables_.end()) {
        return app->second;
    }
    auto it = variables_.find(name);
    if (it != variables_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Value Character::coerce(const std::string& text) {
    std::string lowered;
    for (char c : text) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lowered == "true") return Value(true);
    if (lowered == "false") return Value(false);

    if (!text.empty() && !std::isspace(static_cast<unsigned char>(text.front())) &&
        !std::isspace(static_cast<unsigned char>(text.back()))) {
        char* end = nullptr;
        errno = 0;
        long long integer = std::strtoll(text.c_str(), &end, 10);
        if (*end == '\0' && errno != ERANGE) {
            return Value(static_cast<int64_t>(integer));
        }
        double number = std::strtod(text.c_str(), &end);
        if (*end == '\0') {
            return Value(number);
        }
    }

    size_t start = text.find_first_not_of("'\"");
    if (start == std::string::npos) {
        return Value(std::string());
    }
    size_t end = text.find_last_not_of("'\"");
    return Value(text.substr(start, end - start + 1));
}

void Character::setVariable(const std::string& name, const std::string& text) {
    variables_[name] = coerce(text);
}

void Character::applyVariables(const VariableMap& overrides) {
    for (const auto& [name, value] : overrides) {
        variables_[name] = value;
    }
}

void Character::stampDateTime() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[64];
    size_t length = std::strftime(buffer, sizeof(buffer), "%Y %B %d (%A) %H:%M", &local);
    variables_["SYSTEM_DATETIME"] = Value(std::string(buffer, length));
}

} // namespace pdsl
