#pragma once

#include "interpreter/evaluator.hpp"
#include "interpreter/executor.hpp"
#include "interpreter/includeHost.hpp"
#include "resolver/pathResolver.hpp"
#include "template/tagExtractor.hpp"

#include <map>
#include <string>
#include <vector>

namespace pdsl {

class Character;
class Logger;

// What one composition hands back to the caller
struct CompositionResult {
    std::string text;
    std::vector<std::string> logs;
    std::vector<std::string> systemInfos;
    VariableMap variablesBefore;
    VariableMap variablesAfter;
};

/**
 * Recursive placeholder expansion. Owns the evaluator and the statement
 * executor, and is the IncludeHost both of them call back into.
 *
 * Placeholders:  [<path.script>] [<path.system>]  run the script
 *                [<path.txt>]                      expand the file in turn
 * Inserts:       {{NAME}}, substituted once over the final main template
 * Variables:     [{name}], substituted in .txt includes after expansion
 */
class TemplateExpander : public IncludeHost {
public:
    static constexpr int kMaxRecursion = 10;

    TemplateExpander(Character& character, PathResolver& resolver, Logger& logger);

    TemplateExpander(const TemplateExpander&) = delete;
    TemplateExpander& operator=(const TemplateExpander&) = delete;

    /**
     * Expand an entry template, then apply inserts.
     * Never throws; failures become inline markers and logger records.
     * @param entryRelPath template reference, resolved against the character base
     */
    CompositionResult composePrompt(const std::string& entryRelPath);

    // Run one .script/.system file or expand one .txt file on its own
    CompositionResult processFile(const std::string& relPath);

    // Run script text under a virtual id; `trace` receives executed lines
    CompositionResult runScriptSource(const std::string& source,
                                      const std::string& virtualId,
                                      std::vector<int>* trace = nullptr);

    void setInsert(const std::string& name, const std::string& content);
    void setInsert(const std::string& name, const std::vector<std::string>& lines);
    const std::map<std::string, std::string>& inserts() const { return inserts_; }

    // Substitute inserts; warns when a mandatory insert never appears in `text`
    std::string applyInserts(const std::string& text, const std::string& context);

    void setMaxRecursion(int maxRecursion) { maxRecursion_ = maxRecursion; }
    int maxRecursion() const { return maxRecursion_; }

    std::string expand(const std::string& text, const std::string& context) override;
    std::string includeFile(const std::string& relPath) override;
    std::string expandDirective(const Directive& directive, const std::string& context) override;

private:
    Character& character_;
    PathResolver& resolver_;
    Logger& logger_;
    TagExtractor tags_;
    Evaluator evaluator_;
    ScriptOutput output_;
    ScriptExecutor executor_;
    std::map<std::string, std::string> inserts_;
    int maxRecursion_ = kMaxRecursion;
    int nesting_ = 0;

    std::string expandPlaceholder(const std::string& relPath, const std::string& context);
    std::string expandTextFile(const ResourceId& id, const std::string& relPath);
    std::string textVariable(const std::string& name) const;
    std::string recursionMarker(const std::string& context) const;

    void beginComposition();
    CompositionResult finishComposition(std::string text, VariableMap before);
};

} // namespace pdsl
