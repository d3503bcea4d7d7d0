#pragma once

#include <string>
#include <vector>

namespace pdsl {

// One statement's worth of text. A """...""" block keeps its newlines, so a
// logical line may span several physical lines; `line` is where it starts.
struct LogicalLine {
    std::string text;
    int line;
};

// Split raw script text into logical lines. Throws ParseError when a """ block
// is still open at end of input.
std::vector<LogicalLine> segmentLines(const std::string& text, const std::string& file = "");

} // namespace pdsl
