#include "interpreter/directive.hpp"

#include <gtest/gtest.h>

using namespace pdsl;

TEST(DirectiveTest, FindsInlineForms) {
    std::string expression = "LOAD INTRO FROM \"story.txt\" + load_rel 'notes.txt' + LOAD FROM \"a.txt\"";
    std::vector<Directive> found = findInlineDirectives(expression);
    ASSERT_EQ(found.size(), 3u);

    EXPECT_EQ(found[0].kind, DirectiveKind::LoadTag);
    EXPECT_EQ(found[0].tag, "INTRO");
    EXPECT_EQ(found[0].path, "story.txt");
    EXPECT_EQ(found[0].position, 0u);
    EXPECT_EQ(found[0].length, std::string("LOAD INTRO FROM \"story.txt\"").size());

    EXPECT_EQ(found[1].kind, DirectiveKind::LoadRel);
    EXPECT_EQ(found[1].path, "notes.txt");

    EXPECT_EQ(found[2].kind, DirectiveKind::Load);
    EXPECT_EQ(found[2].path, "a.txt");
}

TEST(DirectiveTest, SkipsStringLiterals) {
    EXPECT_TRUE(findInlineDirectives("'LOAD \"a.txt\"' + x").empty());
    EXPECT_TRUE(findInlineDirectives("\"\"\"LOAD FROM 'a.txt'\"\"\"").empty());
}

TEST(DirectiveTest, RequiresWordBoundary) {
    EXPECT_TRUE(findInlineDirectives("RELOAD \"a.txt\"").empty());
    EXPECT_TRUE(findInlineDirectives("LOADED \"a.txt\"").empty());
}

TEST(DirectiveTest, InlineFormNeedsQuotedPath) {
    EXPECT_TRUE(findInlineDirectives("LOAD FROM a.txt").empty());
    EXPECT_TRUE(findInlineDirectives("LOAD_REL a.txt").empty());
}

TEST(DirectiveTest, SoleDirectiveAcceptsBarePaths) {
    auto directive = parseSoleDirective("LOAD common/rules.txt");
    ASSERT_TRUE(directive);
    EXPECT_EQ(directive->kind, DirectiveKind::Load);
    EXPECT_EQ(directive->path, "common/rules.txt");

    directive = parseSoleDirective("  LOAD SPOILERS FROM lore.txt  ");
    ASSERT_TRUE(directive);
    EXPECT_EQ(directive->kind, DirectiveKind::LoadTag);
    EXPECT_EQ(directive->tag, "SPOILERS");
    EXPECT_EQ(directive->path, "lore.txt");

    directive = parseSoleDirective("LOADREL \"./x.txt\"");
    ASSERT_TRUE(directive);
    EXPECT_EQ(directive->kind, DirectiveKind::LoadRel);
    EXPECT_EQ(directive->path, "./x.txt");
}

TEST(DirectiveTest, SoleDirectiveRejectsExtraText) {
    EXPECT_FALSE(parseSoleDirective("LOAD \"a.txt\" + 'x'"));
    EXPECT_FALSE(parseSoleDirective("'text'"));
    EXPECT_FALSE(parseSoleDirective("LOAD"));
}

TEST(DirectiveTest, Rendering) {
    Directive directive{DirectiveKind::LoadTag, "INTRO", "story.txt"};
    EXPECT_EQ(directiveToString(directive), "LOAD INTRO FROM \"story.txt\"");
    EXPECT_EQ(quoteLiteral("a \"b\"\n\\"), "\"a \\\"b\\\"\\n\\\\\"");
}
