#include "dependency/dependencyCollector.hpp"
#include "diagnostics/errors.hpp"
#include "testSupport.hpp"

using namespace pdsl;

namespace {

class DependencyCollectorTest : public pdsl::test::PromptTest {
protected:
    std::set<std::string> collect(const std::string& entry) {
        DependencyCollector collector(resolver_, logger_);
        std::set<std::string> ids;
        for (const auto& id : collector.collect(entry)) {
            ids.insert(id.str());
        }
        return ids;
    }
};

} // namespace

TEST_F(DependencyCollectorTest, WalksEveryReferenceForm) {
    addFile("bot/main_template.txt", "Hi [<a.txt>] [<s.script>]");
    addFile("bot/a.txt", "[<b.txt>] [<../../../etc/passwd.txt>]");
    addFile("bot/b.txt", "[<a.txt>] [<_CommonPrompts/rules.txt>]");
    addFile("_CommonPrompts/rules.txt", "rules");
    addFile("bot/s.script",
            "SET intro = LOAD INTRO FROM \"lore.txt\"\n"
            "ADD_SYSTEM_INFO LOAD_REL 'sub/y.txt'\n"
            "RETURN LOAD ./sub/x.txt\n");
    addFile("bot/lore.txt", "[#INTRO]x[/INTRO]");
    addFile("bot/sub/x.txt", "[<./z.txt>]");
    addFile("bot/sub/y.txt", "y");

    std::set<std::string> expected = {
        "/prompts/bot/main_template.txt",
        "/prompts/bot/a.txt",
        "/prompts/bot/b.txt",
        "/prompts/_CommonPrompts/rules.txt",
        "/prompts/bot/s.script",
        "/prompts/bot/lore.txt",
        "/prompts/bot/sub/x.txt",
        "/prompts/bot/sub/y.txt",
        "/prompts/bot/sub/z.txt",
    };
    EXPECT_EQ(collect("main_template.txt"), expected);
    EXPECT_TRUE(logged(DiagnosticSeverity::Warning, "Skipping unreadable dependency"));
    EXPECT_TRUE(logged(DiagnosticSeverity::Warning, "Skipping unresolvable reference '../../../etc/passwd.txt'"));
    EXPECT_EQ(resolver_.contextDepth(), 0u);
}

TEST_F(DependencyCollectorTest, CyclesTerminate) {
    addFile("bot/a.txt", "[<b.txt>]");
    addFile("bot/b.txt", "[<a.txt>][<b.txt>]");
    std::set<std::string> expected = {"/prompts/bot/a.txt", "/prompts/bot/b.txt"};
    EXPECT_EQ(collect("a.txt"), expected);
}

TEST_F(DependencyCollectorTest, NothingIsExecuted) {
    addFile("bot/s.script", "SET attitude = 1\nLOG 'x'\nRETURN 'done'");
    EXPECT_EQ(collect("s.script").size(), 1u);
    EXPECT_EQ(character_.variables().at("attitude"), Value(60));
}

TEST_F(DependencyCollectorTest, UnresolvableEntryThrows) {
    EXPECT_THROW(collect("/etc/passwd"), ResolutionError);
}

TEST(DependencyScanTest, ScanReferences) {
    std::string content =
        "Text [<a.txt>] and [<b.md>]\n"
        "SET x = 'Hi' + load from 'c.txt'\n"
        "  return LOAD \"d.txt\"\n"
        "LOG LOAD \"e.txt\"\n";
    std::set<std::string> expected = {"a.txt", "c.txt", "d.txt", "e.txt"};
    EXPECT_EQ(DependencyCollector::scanReferences(content), expected);
}
