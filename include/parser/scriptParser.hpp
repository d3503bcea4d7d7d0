#pragma once

#include "ast/scriptAst.hpp"
#include "diagnostics/diagnostic.hpp"

#include <string>
#include <vector>

namespace pdsl {

struct ScriptParseResult {
    Script script;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return diagnostics.empty(); }
};

/**
 * Build the statement tree of a script. Never throws: every problem is
 * reported as a diagnostic and the offending line is left out of the tree.
 * @param text script source
 * @param file name used in diagnostics
 */
ScriptParseResult parseScript(const std::string& text, const std::string& file = "");

} // namespace pdsl
