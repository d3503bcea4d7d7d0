#pragma once

#include "resolver/pathResolver.hpp"

#include <set>
#include <string>

namespace pdsl {

class Logger;

/**
 * DependencyCollector - static, read-only walk of everything an entry point
 * can pull in.
 *
 * Nothing is executed: each file is scanned as text for placeholders,
 * inline "LOAD ... FROM" directives and the LOAD / LOAD_REL forms of
 * RETURN and ADD_SYSTEM_INFO lines. References are resolved relative to the
 * file they appear in.
 */
class DependencyCollector {
public:
    DependencyCollector(PathResolver& resolver, Logger& logger);

    /**
     * Transitive dependency set of an entry point, entry included
     * @param entryRelPath reference resolved against the current context
     * @return every reachable resource id, sorted, each exactly once
     * @throws ResolutionError if the entry point itself can't be resolved
     */
    std::set<ResourceId> collect(const std::string& entryRelPath);

    // Relative references mentioned in one file's text
    static std::set<std::string> scanReferences(const std::string& content);

    // Only these can reference further files
    static bool isParsable(const ResourceId& id);

private:
    PathResolver& resolver_;
    Logger& logger_;
};

} // namespace pdsl
