#include "lexer/lineSegmenter.hpp"
#include "diagnostics/errors.hpp"

namespace pdsl {

std::vector<LogicalLine> segmentLines(const std::string& text, const std::string& file) {
    static const std::string delimiter = "\"\"\"";

    std::vector<LogicalLine> lines;
    std::string current;
    int physicalLine = 1;
    int startLine = 1;
    int literalStart = 0;
    bool insideLiteral = false;

    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, delimiter.size(), delimiter) == 0) {
            insideLiteral = !insideLiteral;
            if (insideLiteral) {
                literalStart = physicalLine;
            }
            current += delimiter;
            i += delimiter.size();
            continue;
        }

        char c = text[i];
        if (c == '\n') {
            if (insideLiteral) {
                current += c;
            } else {
                lines.push_back({current, startLine});
                current.clear();
                startLine = physicalLine + 1;
            }
            physicalLine++;
        } else {
            current += c;
        }
        i++;
    }

    if (insideLiteral) {
        throw ParseError("Unterminated multiline block", file, literalStart);
    }

    if (!current.empty()) {
        lines.push_back({current, startLine});
    }

    return lines;
}

} // namespace pdsl
