#include "interpreter/directive.hpp"

#include <cctype>

namespace pdsl {

namespace {

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Case-insensitive keyword at pos, not followed by an identifier character
bool matchKeyword(std::string_view text, size_t pos, std::string_view keyword) {
    if (pos + keyword.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); i++) {
        if (std::toupper(static_cast<unsigned char>(text[pos + i])) != keyword[i]) {
            return false;
        }
    }
    size_t end = pos + keyword.size();
    return end == text.size() || !isWordChar(text[end]);
}

size_t skipSpaces(std::string_view text, size_t pos) {
    while (pos < text.size() && isSpace(text[pos])) {
        pos++;
    }
    return pos;
}

// At least one blank is required between directive words
bool requireSpaces(std::string_view text, size_t& pos) {
    size_t next = skipSpaces(text, pos);
    if (next == pos) {
        return false;
    }
    pos = next;
    return true;
}

// "path" or 'path' (non-empty); with allowBare, also a run of non-blanks
std::optional<std::string> readPath(std::string_view text, size_t& pos, bool allowBare) {
    if (pos >= text.size()) {
        return std::nullopt;
    }
    char quote = text[pos];
    if (quote == '"' || quote == '\'') {
        size_t close = text.find(quote, pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            return std::nullopt;
        }
        std::string path(text.substr(pos + 1, close - pos - 1));
        pos = close + 1;
        return path;
    }
    if (!allowBare) {
        return std::nullopt;
    }
    size_t start = pos;
    while (pos < text.size() && !isSpace(text[pos])) {
        pos++;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return std::string(text.substr(start, pos - start));
}

std::optional<Directive> parseDirectiveAt(std::string_view text, size_t start, bool allowBare) {
    Directive directive;
    directive.position = start;
    size_t pos = start;

    if (matchKeyword(text, pos, "LOAD_REL") || matchKeyword(text, pos, "LOADREL")) {
        pos += matchKeyword(text, pos, "LOAD_REL") ? 8 : 7;
        if (!requireSpaces(text, pos)) {
            return std::nullopt;
        }
        auto path = readPath(text, pos, allowBare);
        if (!path) {
            return std::nullopt;
        }
        directive.kind = DirectiveKind::LoadRel;
        directive.path = *path;
        directive.length = pos - start;
        return directive;
    }

    if (!matchKeyword(text, pos, "LOAD")) {
        return std::nullopt;
    }
    pos += 4;
    if (!requireSpaces(text, pos)) {
        return std::nullopt;
    }

    // LOAD "p"
    if (pos < text.size() && (text[pos] == '"' || text[pos] == '\'')) {
        auto path = readPath(text, pos, false);
        if (!path) {
            return std::nullopt;
        }
        directive.kind = DirectiveKind::Load;
        directive.path = *path;
        directive.length = pos - start;
        return directive;
    }

    size_t wordStart = pos;
    while (pos < text.size() && isWordChar(text[pos])) {
        pos++;
    }
    if (pos == wordStart) {
        // LOAD ./path.txt
        auto path = readPath(text, pos, allowBare);
        if (!path) {
            return std::nullopt;
        }
        directive.kind = DirectiveKind::Load;
        directive.path = *path;
        directive.length = pos - start;
        return directive;
    }
    std::string word(text.substr(wordStart, pos - wordStart));

    if (matchKeyword(text, wordStart, "FROM")) {
        // LOAD FROM "p"
        if (!requireSpaces(text, pos)) {
            return std::nullopt;
        }
        auto path = readPath(text, pos, allowBare);
        if (!path) {
            return std::nullopt;
        }
        directive.kind = DirectiveKind::Load;
        directive.path = *path;
        directive.length = pos - start;
        return directive;
    }

    // LOAD TAG FROM "p"
    if (!requireSpaces(text, pos) || !matchKeyword(text, pos, "FROM")) {
        if (allowBare) {
            // LOAD some/path.txt
            directive.kind = DirectiveKind::Load;
            pos = wordStart;
            auto path = readPath(text, pos, true);
            if (!path) {
                return std::nullopt;
            }
            directive.path = *path;
            directive.length = pos - start;
            return directive;
        }
        return std::nullopt;
    }
    pos += 4;
    if (!requireSpaces(text, pos)) {
        return std::nullopt;
    }
    auto path = readPath(text, pos, allowBare);
    if (!path) {
        return std::nullopt;
    }
    directive.kind = DirectiveKind::LoadTag;
    directive.tag = word;
    directive.path = *path;
    directive.length = pos - start;
    return directive;
}

} // namespace

std::string directiveToString(const Directive& directive) {
    switch (directive.kind) {
        case DirectiveKind::Load:    return "LOAD \"" + directive.path + "\"";
        case DirectiveKind::LoadTag: return "LOAD " + directive.tag + " FROM \"" + directive.path + "\"";
        case DirectiveKind::LoadRel: return "LOAD_REL \"" + directive.path + "\"";
    }
    return "LOAD";
}

size_t skipStringLiteral(std::string_view text, size_t start) {
    char quote = text[start];
    bool triple = quote == '"' && text.compare(start, 3, "\"\"\"") == 0;
    size_t pos = start + (triple ? 3 : 1);

    while (pos < text.size()) {
        if (text[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (triple) {
            if (text.compare(pos, 3, "\"\"\"") == 0) {
                return pos + 3;
            }
        } else if (text[pos] == quote) {
            return pos + 1;
        }
        pos++;
    }
    return text.size();
}

std::vector<Directive> findInlineDirectives(std::string_view expression) {
    std::vector<Directive> directives;
    size_t pos = 0;

    while (pos < expression.size()) {
        char c = expression[pos];
        if (c == '"' || c == '\'') {
            pos = skipStringLiteral(expression, pos);
            continue;
        }
        bool wordStart = pos == 0 || !isWordChar(expression[pos - 1]);
        if (wordStart && (c == 'L' || c == 'l')) {
            auto directive = parseDirectiveAt(expression, pos, false);
            if (directive) {
                pos += directive->length;
                directives.push_back(std::move(*directive));
                continue;
            }
        }
        pos++;
    }
    return directives;
}

std::optional<Directive> parseSoleDirective(std::string_view argument) {
    size_t start = skipSpaces(argument, 0);
    size_t end = argument.size();
    while (end > start && isSpace(argument[end - 1])) {
        end--;
    }
    std::string_view trimmed = argument.substr(start, end - start);

    auto directive = parseDirectiveAt(trimmed, 0, true);
    if (!directive || directive->length != trimmed.size()) {
        return std::nullopt;
    }
    return directive;
}

std::string quoteLiteral(const std::string& text) {
    std::string literal = "\"";
    for (char c : text) {
        switch (c) {
            case '\\': literal += "\\\\"; break;
            case '"':  literal += "\\\""; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default:   literal += c;
        }
    }
    literal += '"';
    return literal;
}

} // namespace pdsl
