#pragma once

#include "interpreter/value.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace pdsl {

class Logger;

// Runtime settings for one engine instance. Filled from argv by the CLI and
// optionally from a YAML file given with --config.
struct EngineConfig {
    std::filesystem::path promptsRoot = "Prompts";
    std::string characterId;
    std::string kind;
    std::string entry = "main_template.txt";
    int maxRecursion = 10;
    bool debug = false;
    VariableMap variables;                       // applied after config.json
    std::map<std::string, std::string> inserts;
};

/**
 * Merge an engine settings file into config. Recognized keys: root, character,
 * kind, entry, max_recursion, debug, variables (map), inserts (map).
 * @throws std::runtime_error if the file can't be read or parsed
 */
void loadEngineConfig(const std::filesystem::path& file, EngineConfig& config);

/**
 * Read a character's config.json: a flat map of scalars. Nested values are
 * skipped with a warning.
 * @return nullopt if the file is missing or malformed (malformed is logged)
 */
std::optional<VariableMap> loadCharacterConfig(const std::filesystem::path& file, Logger& logger);

} // namespace pdsl
