#include "config/config.hpp"
#include "diagnostics/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace pdsl {

namespace {

// Quoted scalars stay strings; plain ones are tried as bool, int, then float
Value scalarToValue(const YAML::Node& node) {
    if (node.IsNull()) {
        return Value();
    }
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return Value(text);
    }

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return Value(flag);
    }
    int64_t integer = 0;
    if (YAML::convert<int64_t>::decode(node, integer)) {
        return Value(integer);
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return Value(number);
    }
    return Value(text);
}

} // namespace

void loadEngineConfig(const std::filesystem::path& file, EngineConfig& config) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Cannot load config " + file.string() + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config " + file.string() + " must be a map");
    }

    try {
        if (root["root"]) config.promptsRoot = root["root"].as<std::string>();
        if (root["character"]) config.characterId = root["character"].as<std::string>();
        if (root["kind"]) config.kind = root["kind"].as<std::string>();
        if (root["entry"]) config.entry = root["entry"].as<std::string>();
        if (root["max_recursion"]) config.maxRecursion = root["max_recursion"].as<int>();
        if (root["debug"]) config.debug = root["debug"].as<bool>();

        if (const YAML::Node variables = root["variables"]) {
            for (const auto& entry : variables) {
                config.variables[entry.first.as<std::string>()] = scalarToValue(entry.second);
            }
        }
        if (const YAML::Node inserts = root["inserts"]) {
            for (const auto& entry : inserts) {
                config.inserts[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + file.string() + ": " + e.what());
    }
}

std::optional<VariableMap> loadCharacterConfig(const std::filesystem::path& file, Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        logger.debug("No character config at " + file.string());
        return std::nullopt;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::Exception& e) {
        logger.error("Cannot parse character config: " + std::string(e.what()), file.string());
        return std::nullopt;
    }
    if (!root.IsMap()) {
        logger.error("Character config must be an object", file.string());
        return std::nullopt;
    }

    VariableMap variables;
    for (const auto& entry : root) {
        std::string name = entry.first.as<std::string>();
        if (!entry.second.IsScalar() && !entry.second.IsNull()) {
            logger.warning("Skipping non-scalar config value '" + name + "'", file.string());
            continue;
        }
        variables[name] = scalarToValue(entry.second);
    }
    logger.info("Loaded " + std::to_string(variables.size()) + " variable(s) from character config", file.string());
    return variables;
}

} // namespace pdsl
