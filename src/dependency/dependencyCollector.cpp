#include "dependency/dependencyCollector.hpp"
#include "diagnostics/errors.hpp"
#include "diagnostics/logger.hpp"
#include "interpreter/directive.hpp"
#include "interpreter/statement.hpp"
#include "template/placeholders.hpp"

#include <algorithm>
#include <cctype>
#include <queue>
#include <regex>
#include <sstream>

namespace pdsl {

namespace {

// LOAD "path", LOAD FROM "path", LOAD TAG FROM "path"
const std::regex kInlineLoad(R"(\bLOAD\s+(?:(?:[A-Z0-9_]+\s+)?FROM\s+)?(['"])(.+?)\1)", std::regex::icase);
const std::regex kInlineLoadRel(R"(\bLOAD_?REL\s+(['"])(.+?)\1)", std::regex::icase);

bool startsWithCommand(const std::string& line, const std::string& command) {
    if (line.size() <= command.size()) return false;
    for (size_t i = 0; i < command.size(); i++) {
        if (std::toupper(static_cast<unsigned char>(line[i])) != command[i]) return false;
    }
    return std::isspace(static_cast<unsigned char>(line[command.size()])) != 0;
}

void collectMatches(const std::string& text, const std::regex& pattern, std::set<std::string>& out) {
    for (std::sregex_iterator it(text.begin(), text.end(), pattern), end; it != end; ++it) {
        out.insert((*it)[2].str());
    }
}

} // namespace

DependencyCollector::DependencyCollector(PathResolver& resolver, Logger& logger)
    : resolver_(resolver), logger_(logger) {}

bool DependencyCollector::isParsable(const ResourceId& id) {
    std::string ext = extensionOf(id.str());
    return ext == "script" || ext == "txt" || ext == "system";
}

std::set<std::string> DependencyCollector::scanReferences(const std::string& content) {
    std::set<std::string> references;

    for (const auto& placeholder : findPlaceholders(content)) {
        references.insert(placeholder.path);
    }

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        collectMatches(line, kInlineLoad, references);
        collectMatches(line, kInlineLoadRel, references);

        std::string trimmed = trimText(line);
        if (startsWithCommand(trimmed, "RETURN") || startsWithCommand(trimmed, "ADD_SYSTEM_INFO")) {
            // Unquoted paths are only valid when the directive is the whole argument
            if (auto statement = classifyLine(trimmed)) {
                if (auto directive = parseSoleDirective(statement->argument)) {
                    references.insert(directive->path);
                }
            }
        }
    }
    return references;
}

std::set<ResourceId> DependencyCollector::collect(const std::string& entryRelPath) {
    ResourceId entry = resolver_.resolve(entryRelPath);

    std::set<ResourceId> visited;
    std::queue<ResourceId> pending;
    pending.push(entry);

    while (!pending.empty()) {
        ResourceId current = pending.front();
        pending.pop();

        if (!visited.insert(current).second) {
            continue;
        }
        if (!isParsable(current)) {
            continue;
        }

        std::string content;
        try {
            content = resolver_.load(current);
        } catch (const DslError& e) {
            logger_.warning(std::string("Skipping unreadable dependency: ") + e.what(), current.str());
            continue;
        }

        ContextGuard guard(resolver_, resolver_.dirname(current));
        for (const auto& reference : scanReferences(content)) {
            try {
                ResourceId dependency = resolver_.resolve(reference);
                if (!visited.count(dependency)) {
                    pending.push(dependency);
                }
            } catch (const DslError& e) {
                logger_.warning("Skipping unresolvable reference '" + reference + "': " + e.what(), current.str());
            }
        }
    }

    logger_.debug("Collected " + std::to_string(visited.size()) + " dependencies for " + entryRelPath);
    return visited;
}

} // namespace pdsl
