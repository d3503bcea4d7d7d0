#include "interpreter/statement.hpp"
#include "interpreter/directive.hpp"

#include <cctype>

namespace pdsl {

namespace {

std::string upper(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

StatementKind kindOf(const std::string& keyword) {
    std::string word = upper(keyword);
    if (word == "IF") return StatementKind::If;
    if (word == "ELSEIF") return StatementKind::ElseIf;
    if (word == "ELSE") return StatementKind::Else;
    if (word == "ENDIF") return StatementKind::EndIf;
    if (word == "SET") return StatementKind::Set;
    if (word == "LOG") return StatementKind::Log;
    if (word == "ADD_SYSTEM_INFO") return StatementKind::AddSystemInfo;
    if (word == "RETURN") return StatementKind::Return;
    return StatementKind::Unknown;
}

} // namespace

std::string trimText(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string stripLineComment(const std::string& line) {
    size_t pos = 0;
    while (pos < line.size()) {
        char c = line[pos];
        if (c == '"' || c == '\'') {
            pos = skipStringLiteral(line, pos);
            continue;
        }
        if (c == '/' && pos + 1 < line.size() && line[pos + 1] == '/') {
            return line.substr(0, pos);
        }
        pos++;
    }
    return line;
}

std::optional<Statement> classifyLine(const std::string& text) {
    std::string stripped = trimText(text);
    if (stripped.empty() || stripped.compare(0, 2, "//") == 0) {
        return std::nullopt;
    }

    std::string command = trimText(stripLineComment(stripped));
    size_t split = command.find_first_of(" \t\r\n");
    Statement statement;
    statement.keyword = command.substr(0, split);
    statement.argument = split == std::string::npos ? "" : trimText(command.substr(split));
    statement.kind = kindOf(statement.keyword);
    return statement;
}

std::string stripThen(const std::string& condition) {
    std::string trimmed = trimText(condition);
    if (trimmed.size() >= 5) {
        std::string tail = upper(trimmed.substr(trimmed.size() - 5));
        if (tail == " THEN" || tail == "\tTHEN") {
            return trimText(trimmed.substr(0, trimmed.size() - 5));
        }
    }
    if (upper(trimmed) == "THEN") {
        return "";
    }
    return trimmed;
}

bool isIdentifier(const std::string& name) {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::optional<std::string> parseSetArgument(const std::string& argument, SetStatement& out) {
    std::string rest = trimText(argument);
    out.local = false;

    size_t split = rest.find_first_of(" \t");
    if (split != std::string::npos && upper(rest.substr(0, split)) == "LOCAL") {
        out.local = true;
        rest = trimText(rest.substr(split));
    }

    size_t equals = rest.find('=');
    if (equals == std::string::npos) {
        return std::string(out.local ? "Malformed SET LOCAL command. Missing '='." : "SET requires '='");
    }

    out.variable = trimText(rest.substr(0, equals));
    out.expression = trimText(rest.substr(equals + 1));
    if (!isIdentifier(out.variable)) {
        return "Invalid variable name '" + out.variable + "'";
    }
    if (out.expression.empty()) {
        return "SET requires an expression after '='";
    }
    return std::nullopt;
}

} // namespace pdsl
