#include "diagnostics/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace pdsl;

TEST(LoggerTest, WritesAttributedLines) {
    std::ostringstream sink;
    Logger logger("mila", &sink);
    logger.warning("Careful", "mood.script", 3);
    logger.error("Broken");

    EXPECT_EQ(sink.str(),
              "[promptdsl:mila] WARNING mood.script:3: Careful\n"
              "[promptdsl:mila] ERROR Broken\n");
    EXPECT_EQ(logger.count(DiagnosticSeverity::Warning), 1u);
    EXPECT_EQ(logger.count(DiagnosticSeverity::Error), 1u);
}

TEST(LoggerTest, InfoAndDebugNeedDebugMode) {
    std::ostringstream sink;
    Logger logger("bot", &sink);
    logger.info("quiet");
    logger.debug("dropped");
    EXPECT_EQ(sink.str(), "");
    ASSERT_EQ(logger.records().size(), 1u);
    EXPECT_EQ(logger.records()[0].severity, DiagnosticSeverity::Information);

    logger.setDebug(true);
    logger.debug("shown");
    EXPECT_EQ(sink.str(), "[promptdsl:bot] DEBUG shown\n");
    EXPECT_EQ(logger.records().size(), 2u);
}

TEST(LoggerTest, CharacterIdCanChange) {
    std::ostringstream sink;
    Logger logger("NO_CHAR", &sink);
    logger.setCharacterId("cappy");
    logger.error("x");
    EXPECT_EQ(sink.str(), "[promptdsl:cappy] ERROR x\n");

    logger.clearRecords();
    EXPECT_TRUE(logger.records().empty());
}
