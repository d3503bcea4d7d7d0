#include "character/character.hpp"

#include <gtest/gtest.h>

using namespace pdsl;

TEST(CharacterTest, Defaults) {
    Character character("bot");
    EXPECT_EQ(character.id(), "bot");
    EXPECT_EQ(character.displayName(), "bot");
    EXPECT_EQ(character.mainTemplate(), "main_template.txt");
    EXPECT_EQ(character.variables().at("attitude"), Value(60));
    EXPECT_EQ(character.variables().at("player_name"), Value("Player"));
    EXPECT_EQ(character.variables().at("secretExposed"), Value(false));
    ASSERT_TRUE(character.variables().count("SYSTEM_DATETIME"));
    EXPECT_TRUE(character.variables().at("SYSTEM_DATETIME").isString());
}

TEST(CharacterTest, KindOverrides) {
    Character character("alice", "Alice", "kind");
    EXPECT_EQ(character.displayName(), "Alice");
    EXPECT_EQ(character.variables().at("attitude"), Value(90));
    EXPECT_EQ(character.variables().at("stress"), Value(0));
    EXPECT_EQ(character.variables().at("boredom"), Value(10));
}

TEST(CharacterTest, UnknownKindKeepsDefaults) {
    Character character("x", "", "robot");
    EXPECT_EQ(character.variables().at("attitude"), Value(60));
    EXPECT_EQ(character.kind(), "robot");
}

TEST(CharacterTest, Coerce) {
    EXPECT_EQ(Character::coerce("TRUE"), Value(true));
    EXPECT_EQ(Character::coerce("false"), Value(false));
    EXPECT_EQ(Character::coerce("42"), Value(42));
    EXPECT_EQ(Character::coerce("-7"), Value(-7));
    EXPECT_EQ(Character::coerce("2.5"), Value(2.5));
    EXPECT_EQ(Character::coerce("1e3"), Value(1000.0));
    EXPECT_EQ(Character::coerce("'hello'"), Value("hello"));
    EXPECT_EQ(Character::coerce("\"quoted\""), Value("quoted"));
    EXPECT_EQ(Character::coerce(" 42"), Value(" 42"));
    EXPECT_EQ(Character::coerce("plain text"), Value("plain text"));
    EXPECT_EQ(Character::coerce(""), Value(""));
}

TEST(CharacterTest, SetVariableCoerces) {
    Character character("bot");
    character.setVariable("count", "3");
    character.setVariable("name", "'Mila'");
    EXPECT_EQ(character.variables().at("count"), Value(3));
    EXPECT_EQ(character.variables().at("name"), Value("Mila"));
}

TEST(CharacterTest, AppVariablesShadowGlobals) {
    Character character("bot");
    EXPECT_EQ(character.getVariable("player_name"), Value("Player"));

    character.setAppVariable("player_name", Value("Alice"));
    EXPECT_EQ(character.getVariable("player_name"), Value("Alice"));
    EXPECT_EQ(character.variables().at("player_name"), Value("Player"));
    EXPECT_FALSE(character.getVariable("missing"));
}

TEST(CharacterTest, ApplyVariables) {
    Character character("bot");
    character.applyVariables({{"attitude", Value(5)}, {"extra", Value("x")}});
    EXPECT_EQ(character.variables().at("attitude"), Value(5));
    EXPECT_EQ(character.variables().at("extra"), Value("x"));
    EXPECT_EQ(character.variables().at("boredom"), Value(10));
}
