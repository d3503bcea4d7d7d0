#include "diagnostics/errors.hpp"
#include "resolver/localPathResolver.hpp"
#include "template/tagExtractor.hpp"

#include <gtest/gtest.h>

using namespace pdsl;

TEST(TagExtractorTest, FindsExactInterior) {
    std::string text = "before\n[#INTRO]\nHello\n  world\n[/INTRO]\nafter";
    EXPECT_EQ(TagExtractor::findSection(text, "INTRO"), "Hello\n  world\n");
}

TEST(TagExtractorTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(TagExtractor::findSection("[#Intro]x[/INTRO]", "intro"), "x");
    EXPECT_EQ(TagExtractor::findSection("[# intro ]x[/ Intro]", "INTRO"), "x");
}

TEST(TagExtractorTest, StripsOnlyOneLeadingNewline) {
    EXPECT_EQ(TagExtractor::findSection("[#A]\n\nx[/A]", "A"), "\nx");
}

TEST(TagExtractorTest, FirstSectionWins) {
    EXPECT_EQ(TagExtractor::findSection("[#A]one[/A][#A]two[/A]", "A"), "one");
}

TEST(TagExtractorTest, MissingSection) {
    EXPECT_FALSE(TagExtractor::findSection("[#A]unclosed", "A"));
    EXPECT_FALSE(TagExtractor::findSection("[#A]x[/A]", "B"));
}

TEST(TagExtractorTest, ExtractFromResource) {
    auto store = std::make_shared<MemorySourceStore>();
    store->add("/prompts/bot/lore.txt", "[#SPOILERS]\nNo spoilers\n[/SPOILERS]\n");
    LocalPathResolver resolver("/prompts", "/prompts/bot", store);
    TagExtractor tags(resolver);

    ResourceId id = resolver.resolve("lore.txt");
    EXPECT_EQ(tags.extract(id, "spoilers"), "No spoilers\n");
    EXPECT_THROW(tags.extract(id, "ENDING"), TagNotFoundError);
    EXPECT_THROW(tags.extract(id, "bad-name"), ParseError);
    EXPECT_THROW(tags.extract(resolver.resolve("missing.txt"), "A"), NotFoundError);
}

TEST(TagExtractorTest, StripMarkersDropsMarkerLines) {
    std::string text = "Intro\n[#A]\nBody\n  [/A]  \nOutro";
    EXPECT_EQ(TagExtractor::stripMarkers(text), "Intro\nBody\nOutro");
}

TEST(TagExtractorTest, StripMarkersDropsInlineMarkersOfOpenedTags) {
    EXPECT_EQ(TagExtractor::stripMarkers("Hello [#NAME]Bot[/NAME] World"), "Hello Bot World");
    EXPECT_EQ(TagExtractor::stripMarkers("Path [/usr] stays"), "Path [/usr] stays");
}
