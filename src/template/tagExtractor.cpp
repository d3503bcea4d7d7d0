#include "template/tagExtractor.hpp"
#include "diagnostics/errors.hpp"

#include <cctype>
#include <set>

namespace pdsl {

namespace {

struct Marker {
    size_t start;
    size_t end;         // one past ']'
    char sigil;         // '#' opens, '/' closes
    std::string name;   // upper-cased
};

bool isTagChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string upper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

// [#NAME] or [/NAME] starting exactly at pos, blanks allowed inside the brackets
std::optional<Marker> markerAt(const std::string& text, size_t pos) {
    if (pos + 1 >= text.size() || text[pos] != '[') {
        return std::nullopt;
    }
    char sigil = text[pos + 1];
    if (sigil != '#' && sigil != '/') {
        return std::nullopt;
    }

    size_t i = pos + 2;
    while (i < text.size() && isBlank(text[i])) i++;
    size_t nameStart = i;
    while (i < text.size() && isTagChar(text[i])) i++;
    if (i == nameStart) {
        return std::nullopt;
    }
    std::string name = text.substr(nameStart, i - nameStart);
    while (i < text.size() && isBlank(text[i])) i++;
    if (i >= text.size() || text[i] != ']') {
        return std::nullopt;
    }
    return Marker{pos, i + 1, sigil, upper(name)};
}

std::optional<Marker> findMarker(const std::string& text, size_t from, char sigil, const std::string& name) {
    size_t pos = text.find('[', from);
    while (pos != std::string::npos) {
        auto marker = markerAt(text, pos);
        if (marker && marker->sigil == sigil && marker->name == name) {
            return marker;
        }
        pos = text.find('[', pos + 1);
    }
    return std::nullopt;
}

bool isMarkerOnlyLine(const std::string& line) {
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = line.size();
    if (end > start && line[end - 1] == '\r') end--;
    while (end > start && (line[end - 1] == ' ' || line[end - 1] == '\t')) end--;

    auto marker = markerAt(line, start);
    return marker && marker->end == end;
}

} // namespace

bool TagExtractor::isValidTagName(const std::string& tag) {
    if (tag.empty()) {
        return false;
    }
    for (char c : tag) {
        if (!isTagChar(c)) return false;
    }
    return true;
}

std::optional<std::string> TagExtractor::findSection(const std::string& text, const std::string& tag) {
    std::string name = upper(tag);
    auto open = findMarker(text, 0, '#', name);
    if (!open) {
        return std::nullopt;
    }
    auto close = findMarker(text, open->end, '/', name);
    if (!close) {
        return std::nullopt;
    }

    std::string interior = text.substr(open->end, close->start - open->end);
    if (!interior.empty() && interior[0] == '\n') {
        interior.erase(0, 1);
    }
    return interior;
}

std::string TagExtractor::extract(const ResourceId& id, const std::string& tag) const {
    if (!isValidTagName(tag)) {
        throw ParseError("Invalid tag name '" + tag + "'", id.value);
    }

    std::string text = resolver_.load(id);
    auto section = findSection(text, tag);
    if (!section) {
        throw TagNotFoundError("Tag '[#" + tag + "]' not found", id.value);
    }
    return *section;
}

std::string TagExtractor::stripMarkers(const std::string& text) {
    std::set<std::string> openedTags;
    for (size_t pos = text.find("[#"); pos != std::string::npos; pos = text.find("[#", pos + 1)) {
        if (auto marker = markerAt(text, pos)) {
            openedTags.insert(marker->name);
        }
    }

    std::string result;
    size_t lineStart = 0;
    while (lineStart < text.size()) {
        size_t newline = text.find('\n', lineStart);
        size_t lineEnd = newline == std::string::npos ? text.size() : newline;
        std::string line = text.substr(lineStart, lineEnd - lineStart);
        bool hasNewline = newline != std::string::npos;
        lineStart = hasNewline ? newline + 1 : text.size();

        if (isMarkerOnlyLine(line)) {
            continue;
        }

        std::string kept;
        size_t i = 0;
        while (i < line.size()) {
            if (line[i] == '[') {
                auto marker = markerAt(line, i);
                if (marker && openedTags.count(marker->name)) {
                    i = marker->end;
                    continue;
                }
            }
            kept += line[i++];
        }
        result += kept;
        if (hasNewline) {
            result += '\n';
        }
    }
    return result;
}

} // namespace pdsl
