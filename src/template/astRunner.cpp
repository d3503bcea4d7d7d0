#include "template/astRunner.hpp"
#include "codegen/codegen.hpp"

#include <set>

namespace pdsl {

AstRunResult runScriptAst(TemplateExpander& expander, const Script& script, const std::string& virtualId) {
    GeneratedScript generated = generateScript(script);

    std::vector<int> trace;
    AstRunResult run;
    run.result = expander.runScriptSource(generated.text, virtualId, &trace);

    std::set<NodeId> seen;
    for (int line : trace) {
        auto it = generated.lineToNode.find(line);
        if (it != generated.lineToNode.end() && seen.insert(it->second).second) {
            run.executedNodes.push_back(it->second);
        }
    }
    return run;
}

} // namespace pdsl
