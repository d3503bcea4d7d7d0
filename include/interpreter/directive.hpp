#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdsl {

enum class DirectiveKind {
    Load,       // LOAD "p" or LOAD FROM "p": whole file, tag markers stripped
    LoadTag,    // LOAD TAG FROM "p": one tag section
    LoadRel     // LOAD_REL "p" (alias LOADREL)
};

struct Directive {
    DirectiveKind kind;
    std::string tag;
    std::string path;
    size_t position = 0;    // offset of the LOAD keyword in the scanned text
    size_t length = 0;      // characters covered by the directive
};

std::string directiveToString(const Directive& directive);

// Every LOAD/LOAD_REL directive in an expression, skipping string literals
std::vector<Directive> findInlineDirectives(std::string_view expression);

// The argument of RETURN / ADD_SYSTEM_INFO when it is exactly one directive.
// Unquoted paths are accepted in this form.
std::optional<Directive> parseSoleDirective(std::string_view argument);

// Render text as a double-quoted expression literal
std::string quoteLiteral(const std::string& text);

// Offset just past the string literal starting at `start` (a quote character)
size_t skipStringLiteral(std::string_view text, size_t start);

} // namespace pdsl
