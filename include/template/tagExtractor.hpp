#pragma once

#include "resolver/pathResolver.hpp"

#include <optional>
#include <string>

namespace pdsl {

// Named sections: [#TAG] ... [/TAG], names case-insensitive
class TagExtractor {
public:
    explicit TagExtractor(const PathResolver& resolver) : resolver_(resolver) {}

    /**
     * Interior of the first TAG section in a resource, minus one leading newline
     * @throws ParseError if the tag name is not [A-Za-z0-9_]+
     * @throws TagNotFoundError if the resource has no such section
     * @throws NotFoundError if the resource doesn't exist
     */
    std::string extract(const ResourceId& id, const std::string& tag) const;

    static std::optional<std::string> findSection(const std::string& text, const std::string& tag);

    // Drop lines holding nothing but a marker, and inline markers of tags
    // that are opened somewhere in the text
    static std::string stripMarkers(const std::string& text);

    static bool isValidTagName(const std::string& tag);

private:
    const PathResolver& resolver_;
};

} // namespace pdsl
