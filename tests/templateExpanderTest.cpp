#include "testSupport.hpp"

using namespace pdsl;

namespace {

class TemplateExpanderTest : public pdsl::test::PromptTest {
protected:
    std::string compose(const std::string& mainTemplate) {
        addFile("bot/main_template.txt", mainTemplate);
        return expander_.composePrompt("main_template.txt").text;
    }

    static bool contains(const std::string& text, const std::string& fragment) {
        return text.find(fragment) != std::string::npos;
    }
};

} // namespace

TEST_F(TemplateExpanderTest, InsertsAndTaggedInclude) {
    addFile("bot/part.txt", "[#X]World[/X]");
    expander_.setInsert("NAME", "Bot");
    EXPECT_EQ(compose("Hello {{NAME}} [<part.txt>]"), "Hello Bot World");
    EXPECT_TRUE(logged(DiagnosticSeverity::Warning, "Mandatory insert {{SYS_INFO}} not found"));
}

TEST_F(TemplateExpanderTest, MandatoryInsertPresent) {
    expander_.setInsert("sys_info", std::vector<std::string>{"first", "second"});
    EXPECT_EQ(compose("Info:\n{{SYS_INFO}}"), "Info:\nfirst\nsecond");
    EXPECT_FALSE(logged(DiagnosticSeverity::Warning, "Mandatory insert"));
}

TEST_F(TemplateExpanderTest, UnknownInsertStaysVerbatim) {
    EXPECT_EQ(compose("{{UNKNOWN}} {{lower}} {{SYS_INFO}}"), "{{UNKNOWN}} {{lower}} {{SYS_INFO}}");
}

TEST_F(TemplateExpanderTest, ScriptPlaceholder) {
    addFile("bot/name.script", "IF attitude > 50 THEN\n    RETURN 'friendly'\nENDIF\nRETURN 'cold'");
    EXPECT_EQ(compose("You are [<name.script>]."), "You are friendly.");
}

TEST_F(TemplateExpanderTest, ReturnedTextIsExpandedAgain) {
    addFile("bot/part.txt", "inner");
    addFile("bot/wrap.script", "RETURN '<' + '[<part.txt>]' + '>'");
    EXPECT_EQ(compose("[<wrap.script>]"), "<inner>");
}

TEST_F(TemplateExpanderTest, MutualIncludesStopAtRecursionLimit) {
    addFile("bot/a.txt", "A[<b.txt>]");
    addFile("bot/b.txt", "B[<a.txt>]");
    std::string text = compose("[<a.txt>]");

    EXPECT_EQ(text.rfind("ABABABABA", 0), 0u);
    EXPECT_TRUE(contains(text, "[DSL ERROR: MAX RECURSION 10 REACHED IN"));
    EXPECT_TRUE(logged(DiagnosticSeverity::Error, "Max recursion depth (10)"));
}

TEST_F(TemplateExpanderTest, ConfigurableRecursionLimit) {
    expander_.setMaxRecursion(3);
    addFile("bot/self.txt", "x[<self.txt>]");
    std::string text = compose("[<self.txt>]");

    EXPECT_EQ(text.rfind("xx", 0), 0u);
    EXPECT_TRUE(contains(text, "MAX RECURSION 3 REACHED"));
}

TEST_F(TemplateExpanderTest, MissingTagInReturnBecomesScriptMarker) {
    addFile("bot/f.txt", "[#Y]other[/Y]");
    addFile("bot/s.script", "RETURN LOAD X FROM \"f.txt\"");
    EXPECT_EQ(compose("Start [<s.script>] end"), "Start [DSL ERROR IN s.script] end");
    EXPECT_TRUE(logged(DiagnosticSeverity::Error, "Error in RETURN LOAD X FROM \"f.txt\""));
}

TEST_F(TemplateExpanderTest, BrokenPlaceholdersDoNotStopSiblings) {
    addFile("bot/ok.txt", "fine");
    EXPECT_EQ(compose("[<missing.txt>] [<../../secret.txt>] [<ok.txt>]"),
              "[DSL ERROR missing.txt] [DSL ERROR ../../secret.txt] fine");
}

TEST_F(TemplateExpanderTest, OtherExtensionsAreNotPlaceholders) {
    EXPECT_EQ(compose("See [<notes.md>] and [<x.TXT>]"), "See [<notes.md>] and [<x.TXT>]");
}

TEST_F(TemplateExpanderTest, TextVariables) {
    addFile("bot/greet.txt", "Hi [{player_name}] [{nothing}]!");
    EXPECT_EQ(compose("[<greet.txt>]"), "Hi Player !");

    character_.variables()["nothing"] = Value();
    EXPECT_EQ(compose("[<greet.txt>]"), "Hi Player !");
}

TEST_F(TemplateExpanderTest, AppVariablesShadowGlobalsInText) {
    addFile("bot/greet.txt", "Hi [{player_name}], attitude [{attitude}]");
    character_.setAppVariable("player_name", Value("Alice"));
    EXPECT_EQ(compose("[<greet.txt>]"), "Hi Alice, attitude 60");

    character_.variables().erase("player_name");
    EXPECT_EQ(compose("[<greet.txt>]"), "Hi Alice, attitude 60");
}

TEST_F(TemplateExpanderTest, PlaceholderThatReproducesItselfStalls) {
    // Text variables are substituted after expansion, so the include hands
    // back its own placeholder unchanged
    addFile("bot/echo.txt", "[{again}]");
    character_.variables()["again"] = Value("[<echo.txt>]");

    EXPECT_EQ(compose("Start [<echo.txt>] end"), "Start [STALLED DSL ERROR echo.txt] end");
    EXPECT_TRUE(logged(DiagnosticSeverity::Error, "Template processing stalled at depth 1"));
}

TEST_F(TemplateExpanderTest, ContextRelativeIncludes) {
    addFile("bot/sub/outer.txt", "[<./inner.txt>]/[<inner.txt>]");
    addFile("bot/sub/inner.txt", "sub");
    addFile("bot/inner.txt", "top");
    EXPECT_EQ(compose("[<sub/outer.txt>]"), "sub/top");
    EXPECT_EQ(resolver_.contextDepth(), 0u);
}

TEST_F(TemplateExpanderTest, ScriptDirectivesUseScriptDirectory) {
    addFile("bot/sub/part.txt", "rel part");
    addFile("bot/sub/rel.script", "RETURN LOAD_REL \"./part.txt\"");
    addFile("bot/sub/bare.script", "RETURN LOAD ./part.txt");
    EXPECT_EQ(compose("[<sub/rel.script>] [<sub/bare.script>]"), "rel part rel part");
}

TEST_F(TemplateExpanderTest, CommonDirectories) {
    addFile("_CommonPrompts/rules.txt", "Be nice");
    addFile("_CommonScripts/mood.script", "RETURN 'calm'");
    EXPECT_EQ(compose("[<_CommonPrompts/rules.txt>], [<_CommonScripts/mood.script>]"), "Be nice, calm");
}

TEST_F(TemplateExpanderTest, InlineLoadInsideExpression) {
    addFile("bot/lore.txt", "[#INTRO]\nOnce upon[/INTRO]");
    addFile("bot/intro.script", "RETURN 'Intro: ' + LOAD INTRO FROM \"lore.txt\"");
    EXPECT_EQ(compose("[<intro.script>]"), "Intro: Once upon");
}

TEST_F(TemplateExpanderTest, MissingMainTemplate) {
    CompositionResult result = expander_.composePrompt("nope.txt");
    EXPECT_EQ(result.text, "[DSL ERROR IN MAIN TEMPLATE nope.txt]");
    EXPECT_TRUE(logged(DiagnosticSeverity::Error, "Failed to process main template"));
}

TEST_F(TemplateExpanderTest, CompositionCollectsSideChannels) {
    addFile("bot/side.script", "LOG 'hello'\nADD_SYSTEM_INFO 'Secret'\nSET attitude = 99");
    addFile("bot/main_template.txt", "[<side.script>]done");
    CompositionResult result = expander_.composePrompt("main_template.txt");

    EXPECT_EQ(result.text, "done");
    ASSERT_EQ(result.logs.size(), 1u);
    EXPECT_EQ(result.systemInfos, std::vector<std::string>{"Secret"});
    EXPECT_EQ(result.variablesBefore.at("attitude"), Value(60));
    EXPECT_EQ(result.variablesAfter.at("attitude"), Value(99));

    // Side channels are per composition
    result = expander_.composePrompt("main_template.txt");
    EXPECT_EQ(result.logs.size(), 1u);
    EXPECT_EQ(result.variablesBefore.at("attitude"), Value(99));
}

TEST_F(TemplateExpanderTest, ProcessFile) {
    addFile("bot/set.script", "SET mood = 'ok'\nRETURN mood");
    CompositionResult result = expander_.processFile("set.script");
    EXPECT_EQ(result.text, "ok");
    EXPECT_FALSE(result.variablesBefore.count("mood"));
    EXPECT_EQ(result.variablesAfter.at("mood"), Value("ok"));

    EXPECT_EQ(expander_.processFile("notes.md").text, "[DSL ERROR IN FILE notes.md]");
}
