#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdsl {

// A "[<relative/path.ext>]" token
struct Placeholder {
    size_t position;
    size_t length;
    std::string path;
};

// First placeholder at or after `from`. Only .script, .txt and .system
// references count; anything else between "[<" and ">]" is plain text.
std::optional<Placeholder> findPlaceholder(std::string_view text, size_t from = 0);

// All placeholders, left to right, non-overlapping
std::vector<Placeholder> findPlaceholders(std::string_view text);

// Substitute {{NAME}} tokens ([A-Z0-9_]+). Names missing from the map stay as they are.
std::string replaceInsertTokens(const std::string& text, const std::map<std::string, std::string>& inserts);

// Substitute [{name}] tokens with whatever `lookup` returns for the name
std::string replaceTextVariables(const std::string& text,
                                 const std::function<std::string(const std::string&)>& lookup);

} // namespace pdsl
