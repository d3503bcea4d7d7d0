#include "character/character.hpp"
#include "codegen/codegen.hpp"
#include "config/config.hpp"
#include "dependency/dependencyCollector.hpp"
#include "diagnostics/logger.hpp"
#include "parser/scriptParser.hpp"
#include "resolver/localPathResolver.hpp"
#include "template/templateExpander.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [entry]\n";
    std::cerr << "       " << program << " --check <file.script>\n";
    std::cerr << "       " << program << " --format <file.script>\n";
    std::cerr << "\nComposes the prompt of a character (default entry: main_template.txt)\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --root <dir>          Global prompts root (default: ./Prompts)\n";
    std::cerr << "  --character <id>      Character id (directory under the root)\n";
    std::cerr << "  --kind <kind>         Character kind for default overrides\n";
    std::cerr << "  --config <file>       YAML engine settings, overridden by later options\n";
    std::cerr << "  --var NAME=VALUE      Set a variable (repeatable)\n";
    std::cerr << "  --insert NAME=VALUE   Set an insert (repeatable)\n";
    std::cerr << "  --deps                Print the dependency set of the entry instead\n";
    std::cerr << "  --check <script>      Parse a script file and print diagnostics\n";
    std::cerr << "  --format <script>     Print the canonical regenerated script text\n";
    std::cerr << "  --sysinfo             Also print collected system infos\n";
    std::cerr << "  --logs                Also print the script LOG lines\n";
    std::cerr << "  --debug               Enable debug logging\n";
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Split NAME=VALUE; the name must not be empty
bool splitAssignment(const std::string& text, std::string& name, std::string& value) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    name = text.substr(0, eq);
    value = text.substr(eq + 1);
    return true;
}

// --check and --format
int runScriptTool(const std::string& path, bool format) {
    pdsl::ScriptParseResult parsed = pdsl::parseScript(readFile(path), path);
    for (const auto& diagnostic : parsed.diagnostics) {
        std::cerr << diagnostic.toString() << "\n";
    }
    if (!parsed.ok()) {
        return 1;
    }

    if (format) {
        std::cout << pdsl::generateScript(parsed.script).text;
    } else {
        std::cerr << path << ": OK\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    pdsl::EngineConfig config;
    std::string checkFile;
    std::string formatFile;
    bool depsMode = false;
    bool printSysInfo = false;
    bool printLogs = false;

    try {
        // Settings from --config are applied first so any other option wins
        for (int argIndex = 1; argIndex < argc; argIndex++) {
            if (std::string(argv[argIndex]) == "--config" && argIndex + 1 < argc) {
                pdsl::loadEngineConfig(argv[argIndex + 1], config);
            }
        }

        for (int argIndex = 1; argIndex < argc; argIndex++) {
            std::string arg = argv[argIndex];
            bool hasValue = argIndex + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--debug") {
                config.debug = true;
            } else if (arg == "--deps") {
                depsMode = true;
            } else if (arg == "--sysinfo") {
                printSysInfo = true;
            } else if (arg == "--logs") {
                printLogs = true;
            } else if (arg == "--root" || arg == "--character" || arg == "--kind" || arg == "--config" ||
                       arg == "--var" || arg == "--insert" || arg == "--check" || arg == "--format") {
                if (!hasValue) {
                    std::cerr << "Error: " << arg << " requires a value\n";
                    return 1;
                }
                std::string value = argv[++argIndex];

                if (arg == "--root") {
                    config.promptsRoot = value;
                } else if (arg == "--character") {
                    config.characterId = value;
                } else if (arg == "--kind") {
                    config.kind = value;
                } else if (arg == "--check") {
                    checkFile = value;
                } else if (arg == "--format") {
                    formatFile = value;
                } else if (arg == "--var" || arg == "--insert") {
                    std::string name;
                    std::string text;
                    if (!splitAssignment(value, name, text)) {
                        std::cerr << "Error: expected NAME=VALUE after " << arg << ", got '" << value << "'\n";
                        return 1;
                    }
                    if (arg == "--var") {
                        config.variables[name] = pdsl::Character::coerce(text);
                    } else {
                        config.inserts[name] = text;
                    }
                }
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            } else {
                config.entry = arg;
            }
        }

        if (!checkFile.empty()) {
            return runScriptTool(checkFile, false);
        }
        if (!formatFile.empty()) {
            return runScriptTool(formatFile, true);
        }

        pdsl::Logger logger(config.characterId.empty() ? "NO_CHAR" : config.characterId, &std::cerr);
        logger.setDebug(config.debug);

        fs::path characterDir = config.promptsRoot / config.characterId;
        pdsl::LocalPathResolver resolver(config.promptsRoot, characterDir);

        pdsl::Character character(config.characterId, config.characterId, config.kind);
        if (!config.characterId.empty()) {
            if (auto variables = pdsl::loadCharacterConfig(characterDir / "config.json", logger)) {
                character.applyVariables(*variables);
            }
        }
        character.applyVariables(config.variables);

        if (depsMode) {
            pdsl::DependencyCollector collector(resolver, logger);
            for (const auto& id : collector.collect(config.entry)) {
                std::cout << id.str() << "\n";
            }
            return 0;
        }

        pdsl::TemplateExpander expander(character, resolver, logger);
        expander.setMaxRecursion(config.maxRecursion);
        for (const auto& [name, text] : config.inserts) {
            expander.setInsert(name, text);
        }

        character.setMainTemplate(config.entry);
        pdsl::CompositionResult result = expander.composePrompt(character.mainTemplate());
        std::cout << result.text << "\n";

        if (printSysInfo) {
            std::cout << "\n--- SYSTEM INFO ---\n";
            for (const auto& info : result.systemInfos) {
                std::cout << info << "\n";
            }
        }
        if (printLogs) {
            std::cout << "\n--- LOGS ---\n";
            for (const auto& line : result.logs) {
                std::cout << line << "\n";
            }
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
