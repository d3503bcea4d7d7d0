#include "diagnostics/errors.hpp"
#include "lexer/lexer.hpp"
#include "lexer/lineSegmenter.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>

using namespace pdsl;

namespace {

std::vector<TokenType> typesOf(const std::string& source) {
    Lexer lexer(source);
    std::vector<TokenType> types;
    for (const auto& token : lexer.tokenize()) {
        types.push_back(token.type);
    }
    return types;
}

} // namespace

TEST(LineSegmenterTest, SplitsOnNewlinesKeepingLineNumbers) {
    auto lines = segmentLines("a\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].text, "a");
    EXPECT_EQ(lines[1].text, "b");
    EXPECT_EQ(lines[2].text, "");
    EXPECT_EQ(lines[2].line, 3);
    EXPECT_EQ(lines[3].text, "c");
    EXPECT_EQ(lines[3].line, 4);
}

TEST(LineSegmenterTest, MultilineLiteralIsOneLogicalLine) {
    auto lines = segmentLines("SET x = \"\"\"one\ntwo\"\"\"\nLOG x");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "SET x = \"\"\"one\ntwo\"\"\"");
    EXPECT_EQ(lines[0].line, 1);
    EXPECT_EQ(lines[1].text, "LOG x");
    EXPECT_EQ(lines[1].line, 3);
}

TEST(LineSegmenterTest, UnterminatedLiteralIsFatal) {
    try {
        segmentLines("LOG 1\nSET x = \"\"\"open\nstill open", "story.script");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.message(), "Unterminated multiline block");
        EXPECT_EQ(e.file(), "story.script");
        EXPECT_EQ(e.line(), 2);
    }
}

TEST(LexerTest, KeywordsAreCaseInsensitive) {
    auto types = typesOf("attitude >= 10 AND Not flag or TRUE");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::GREATER_EQUAL, TokenType::INTEGER, TokenType::AND,
        TokenType::NOT, TokenType::IDENTIFIER, TokenType::OR, TokenType::TRUE, TokenType::END_OF_FILE};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, StringEscapes) {
    Lexer lexer("'a\\nb' \"say \\\"hi\\\"\"");
    auto tokens = lexer.tokenize();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(std::get<std::string>(tokens[0].value), "a\nb");
    EXPECT_EQ(std::get<std::string>(tokens[1].value), "say \"hi\"");
}

TEST(LexerTest, TripleQuotedStringSpansLines) {
    Lexer lexer("\"\"\"first\nsecond\"\"\"");
    Token token = lexer.nextToken();
    ASSERT_EQ(token.type, TokenType::STRING);
    EXPECT_EQ(std::get<std::string>(token.value), "first\nsecond");
}

TEST(LexerTest, NumbersAndOperators) {
    auto types = typesOf("7 / 2 % 3.5e1 != -1");
    std::vector<TokenType> expected = {
        TokenType::INTEGER, TokenType::SLASH, TokenType::INTEGER, TokenType::PERCENT,
        TokenType::FLOAT, TokenType::NOT_EQUALS, TokenType::MINUS, TokenType::INTEGER, TokenType::END_OF_FILE};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, AssignmentIsNotAnExpressionToken) {
    auto types = typesOf("a = 1");
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[1], TokenType::ERROR);
}

TEST(ParserTest, ChainsComparisons) {
    Lexer lexer("1 < x <= 3");
    Parser parser(lexer);
    ExprPtr expr = parser.parse();
    auto* compare = dynamic_cast<CompareExpr*>(expr.get());
    ASSERT_NE(compare, nullptr);
    EXPECT_EQ(compare->operands.size(), 3u);
    EXPECT_EQ(compare->ops.size(), 2u);
}

TEST(ParserTest, RejectsTrailingTokens) {
    Lexer lexer("1 2");
    Parser parser(lexer);
    EXPECT_THROW(parser.parse(), std::runtime_error);
}

TEST(ParserTest, CallsTakeArguments) {
    Lexer lexer("max(a, 2, 3)");
    Parser parser(lexer);
    ExprPtr expr = parser.parse();
    auto* call = dynamic_cast<CallExpr*>(expr.get());
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->callee, "max");
    EXPECT_EQ(call->args.size(), 3u);
}
