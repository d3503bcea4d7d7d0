#pragma once

#include "ast/scriptAst.hpp"
#include "template/templateExpander.hpp"

#include <string>
#include <vector>

namespace pdsl {

struct AstRunResult {
    CompositionResult result;
    std::vector<NodeId> executedNodes;   // in first-execution order
};

/**
 * Run a statement tree: it is regenerated as canonical text and executed by
 * the same executor that runs script files.
 * @param virtualId name the run is reported under
 */
AstRunResult runScriptAst(TemplateExpander& expander, const Script& script,
                          const std::string& virtualId = "editor.script");

} // namespace pdsl
