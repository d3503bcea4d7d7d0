#pragma once

#include "character/character.hpp"
#include "diagnostics/logger.hpp"
#include "resolver/localPathResolver.hpp"
#include "resolver/sourceStore.hpp"
#include "template/templateExpander.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace pdsl::test {

constexpr const char* kRoot = "/prompts";
constexpr const char* kCharacterBase = "/prompts/bot";

// An in-memory prompts tree rooted at /prompts with the character "bot"
class PromptTest : public ::testing::Test {
protected:
    PromptTest();

    // Path relative to the prompts root, e.g. "bot/main_template.txt"
    void addFile(const std::string& path, const std::string& content);

    // Whether any logger record of that severity contains the fragment
    bool logged(DiagnosticSeverity severity, const std::string& fragment) const;

    std::shared_ptr<MemorySourceStore> store_;
    LocalPathResolver resolver_;
    Logger logger_;
    Character character_;
    TemplateExpander expander_;
};

// "<file>:<line>" padded the way LOG entries are
std::string logPrefix(const std::string& file, int line);

} // namespace pdsl::test
