#include "diagnostics/errors.hpp"
#include "resolver/localPathResolver.hpp"
#include "resolver/remotePathResolver.hpp"

#include <gtest/gtest.h>

using namespace pdsl;

namespace {

class LocalResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySourceStore> store_ = std::make_shared<MemorySourceStore>();
    LocalPathResolver resolver_{"/prompts", "/prompts/bot", store_};

    std::string resolve(const std::string& ref) { return resolver_.resolve(ref).str(); }
};

} // namespace

TEST_F(LocalResolverTest, PlainReferencesUseCharacterBase) {
    EXPECT_EQ(resolve("main_template.txt"), "/prompts/bot/main_template.txt");
    EXPECT_EQ(resolve("scripts/mood.script"), "/prompts/bot/scripts/mood.script");
    EXPECT_EQ(resolve("sub\\story.txt"), "/prompts/bot/sub/story.txt");
}

TEST_F(LocalResolverTest, CommonDirectoriesUseRoot) {
    EXPECT_EQ(resolve("_CommonPrompts/rules.txt"), "/prompts/_CommonPrompts/rules.txt");
    EXPECT_EQ(resolve("_CommonScripts/a/b.script"), "/prompts/_CommonScripts/a/b.script");
}

TEST_F(LocalResolverTest, ContextReferencesUseTopOfStack) {
    EXPECT_EQ(resolve("./x.txt"), "/prompts/bot/x.txt");

    ContextGuard outer(resolver_, ResourceId{"/prompts/bot/sub"});
    EXPECT_EQ(resolve("./x.txt"), "/prompts/bot/sub/x.txt");
    EXPECT_EQ(resolve("../x.txt"), "/prompts/bot/x.txt");
    EXPECT_EQ(resolve("x.txt"), "/prompts/bot/x.txt");
    {
        ContextGuard inner(resolver_, ResourceId{"/prompts/bot/sub/deeper"});
        EXPECT_EQ(resolve("./y.txt"), "/prompts/bot/sub/deeper/y.txt");
        EXPECT_EQ(resolver_.contextDepth(), 2u);
    }
    EXPECT_EQ(resolver_.contextDepth(), 1u);
    EXPECT_EQ(resolve("./y.txt"), "/prompts/bot/sub/y.txt");
}

TEST_F(LocalResolverTest, TraversalOutsideRootIsRejected) {
    EXPECT_THROW(resolve("../../etc/passwd"), ResolutionError);
    EXPECT_THROW(resolve("_CommonPrompts/../../secret.txt"), ResolutionError);
    EXPECT_THROW(resolve("./../../secret.txt"), ResolutionError);
    EXPECT_THROW(resolve("../../prompts2/x.txt"), ResolutionError);

    // Climbing out of the character directory but staying in the root is fine
    EXPECT_EQ(resolve("../other/x.txt"), "/prompts/other/x.txt");
}

TEST_F(LocalResolverTest, AbsoluteAndEmptyReferencesAreRejected) {
    EXPECT_THROW(resolve("/etc/passwd"), ResolutionError);
    EXPECT_THROW(resolve("C:/windows/win.ini"), ResolutionError);
    EXPECT_THROW(resolve("https://example.com/a.txt"), ResolutionError);
    EXPECT_THROW(resolve(""), ResolutionError);
    EXPECT_THROW(resolve("   "), ResolutionError);
}

TEST_F(LocalResolverTest, LoadStripsTrailingWhitespace) {
    store_->add("/prompts/bot/a.txt", "  Hello\n\n  \n");
    EXPECT_EQ(resolver_.load(resolver_.resolve("a.txt")), "  Hello");
}

TEST_F(LocalResolverTest, LoadReportsMissingFiles) {
    try {
        resolver_.load(resolver_.resolve("missing.txt"));
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.file(), "/prompts/bot/missing.txt");
    }
}

TEST_F(LocalResolverTest, Dirname) {
    EXPECT_EQ(resolver_.dirname(ResourceId{"/prompts/bot/sub/a.txt"}).str(), "/prompts/bot/sub");
    EXPECT_EQ(resolver_.dirname(ResourceId{"/prompts/a.txt"}).str(), "/prompts");
}

TEST_F(LocalResolverTest, PopOnEmptyStackThrows) {
    EXPECT_THROW(resolver_.popContext(), ResolutionError);
}

TEST(LocalResolverSetupTest, CharacterBaseMustLieInsideRoot) {
    auto store = std::make_shared<MemorySourceStore>();
    EXPECT_THROW(LocalPathResolver("/prompts", "/elsewhere/bot", store), ResolutionError);
    EXPECT_THROW(LocalPathResolver("/prompts", "/prompts2/bot", store), ResolutionError);
    EXPECT_NO_THROW(LocalPathResolver("/prompts/", "/prompts/bot/", store));
}

TEST(PathHelpersTest, BaseNameAndExtension) {
    EXPECT_EQ(baseName("a/b/c.txt"), "c.txt");
    EXPECT_EQ(baseName("c.txt"), "c.txt");
    EXPECT_EQ(extensionOf("x/Mood.Script"), "script");
    EXPECT_EQ(extensionOf("README"), "");
}

TEST(RemoteResolverTest, ResolvesAgainstUrls) {
    std::map<std::string, std::string> files = {
        {"https://cdn.example.com/prompts/bot/main_template.txt", "Hi \n"},
    };
    RemotePathResolver resolver("https://cdn.example.com/prompts", "https://cdn.example.com/prompts/bot/",
                                [&files](const std::string& url) -> std::optional<std::string> {
                                    auto it = files.find(url);
                                    if (it == files.end()) return std::nullopt;
                                    return it->second;
                                });

    ResourceId id = resolver.resolve("main_template.txt");
    EXPECT_EQ(id.str(), "https://cdn.example.com/prompts/bot/main_template.txt");
    EXPECT_EQ(resolver.load(id), "Hi");
    EXPECT_EQ(resolver.resolve("_CommonPrompts/a.txt").str(), "https://cdn.example.com/prompts/_CommonPrompts/a.txt");
    EXPECT_EQ(resolver.dirname(id).str(), "https://cdn.example.com/prompts/bot");

    EXPECT_THROW(resolver.resolve("../../x.txt"), ResolutionError);
    EXPECT_THROW(resolver.resolve("../../prompts-other/x.txt"), ResolutionError);
    EXPECT_THROW(resolver.load(resolver.resolve("missing.txt")), NotFoundError);
}

TEST(RemoteResolverTest, RootMustBeUrl) {
    EXPECT_THROW(RemotePathResolver("/prompts", "/prompts/bot", nullptr), ResolutionError);
}

TEST(RemoteResolverTest, NormalizeUrl) {
    EXPECT_EQ(normalizeUrl("https://host/a/./b/"), "https://host/a/b");
    EXPECT_EQ(normalizeUrl("https://host/a/../b"), "https://host/b");
    EXPECT_FALSE(normalizeUrl("https://host/../a"));
}
