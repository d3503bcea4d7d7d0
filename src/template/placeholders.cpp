#include "template/placeholders.hpp"

#include <cctype>

namespace pdsl {

namespace {

bool endsWith(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool hasPlaceholderExtension(std::string_view path) {
    for (std::string_view ext : {".script", ".txt", ".system"}) {
        if (path.size() > ext.size() && endsWith(path, ext)) {
            return true;
        }
    }
    return false;
}

bool isInsertChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::optional<Placeholder> findPlaceholder(std::string_view text, size_t from) {
    for (size_t pos = text.find("[<", from); pos != std::string_view::npos; pos = text.find("[<", pos + 1)) {
        size_t close = text.find('>', pos + 2);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        if (close + 1 >= text.size() || text[close + 1] != ']') {
            continue;
        }
        std::string_view path = text.substr(pos + 2, close - pos - 2);
        if (hasPlaceholderExtension(path)) {
            return Placeholder{pos, close + 2 - pos, std::string(path)};
        }
    }
    return std::nullopt;
}

std::vector<Placeholder> findPlaceholders(std::string_view text) {
    std::vector<Placeholder> result;
    size_t from = 0;
    while (auto match = findPlaceholder(text, from)) {
        from = match->position + match->length;
        result.push_back(std::move(*match));
    }
    return result;
}

std::string replaceInsertTokens(const std::string& text, const std::map<std::string, std::string>& inserts) {
    std::string result;
    size_t cursor = 0;
    size_t pos = text.find("{{");
    while (pos != std::string::npos) {
        size_t end = pos + 2;
        while (end < text.size() && isInsertChar(text[end])) end++;

        if (end > pos + 2 && text.compare(end, 2, "}}") == 0) {
            auto it = inserts.find(text.substr(pos + 2, end - pos - 2));
            if (it != inserts.end()) {
                result.append(text, cursor, pos - cursor);
                result += it->second;
                cursor = end + 2;
                pos = text.find("{{", cursor);
                continue;
            }
        }
        pos = text.find("{{", pos + 1);
    }
    result.append(text, cursor, std::string::npos);
    return result;
}

std::string replaceTextVariables(const std::string& text,
                                 const std::function<std::string(const std::string&)>& lookup) {
    std::string result;
    size_t cursor = 0;
    size_t pos = text.find("[{");
    while (pos != std::string::npos) {
        size_t end = pos + 2;
        if (end < text.size() && isIdentStart(text[end])) {
            while (end < text.size() && isIdentChar(text[end])) end++;
            if (text.compare(end, 2, "}]") == 0) {
                result.append(text, cursor, pos - cursor);
                result += lookup(text.substr(pos + 2, end - pos - 2));
                cursor = end + 2;
                pos = text.find("[{", cursor);
                continue;
            }
        }
        pos = text.find("[{", pos + 1);
    }
    result.append(text, cursor, std::string::npos);
    return result;
}

} // namespace pdsl
