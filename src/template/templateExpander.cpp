#include "template/templateExpander.hpp"
#include "character/character.hpp"
#include "diagnostics/errors.hpp"
#include "diagnostics/logger.hpp"
#include "template/placeholders.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace pdsl {

namespace {

const char* const kMandatoryInserts[] = {"SYS_INFO"};

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool isScriptExtension(const std::string& ext) {
    return ext == "script" || ext == "system";
}

} // namespace

TemplateExpander::TemplateExpander(Character& character, PathResolver& resolver, Logger& logger)
    : character_(character),
      resolver_(resolver),
      logger_(logger),
      tags_(resolver),
      evaluator_(logger, this),
      executor_(character, resolver, evaluator_, *this, logger, output_) {}

void TemplateExpander::setInsert(const std::string& name, const std::string& content) {
    inserts_[upper(name)] = content;
}

void TemplateExpander::setInsert(const std::string& name, const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) joined += "\n";
        joined += lines[i];
    }
    inserts_[upper(name)] = joined;
}

std::string TemplateExpander::applyInserts(const std::string& text, const std::string& context) {
    std::string processed = replaceInsertTokens(text, inserts_);

    for (const char* mandatory : kMandatoryInserts) {
        std::string token = std::string("{{") + mandatory + "}}";
        if (text.find(token) == std::string::npos) {
            logger_.warning("Mandatory insert " + token + " not found while processing " + context);
        }
    }
    return processed;
}

void TemplateExpander::beginComposition() {
    output_.clear();
    logger_.clearRecords();
    character_.stampDateTime();
}

CompositionResult TemplateExpander::finishComposition(std::string text, VariableMap before) {
    CompositionResult result;
    result.text = std::move(text);
    result.logs = output_.logs;
    result.systemInfos = output_.systemInfos;
    result.variablesBefore = std::move(before);
    result.variablesAfter = character_.variables();
    return result;
}

CompositionResult TemplateExpander::composePrompt(const std::string& entryRelPath) {
    beginComposition();
    VariableMap before = character_.variables();
    logger_.info("Processing main template " + entryRelPath + " for character " + character_.id());

    std::string text;
    try {
        ResourceId id = resolver_.resolve(entryRelPath);
        ContextGuard guard(resolver_, resolver_.dirname(id));
        std::string raw = resolver_.load(id);

        std::string context = "main template " + entryRelPath;
        text = applyInserts(expand(raw, context), context);
    } catch (const DslError& e) {
        logger_.error(std::string("Failed to process main template: ") + e.what(), entryRelPath);
        text = "[DSL ERROR IN MAIN TEMPLATE " + baseName(e.file().empty() ? entryRelPath : e.file()) + "]";
    } catch (const std::exception& e) {
        logger_.error(std::string("Internal error in main template: ") + e.what(), entryRelPath);
        text = "[INTERNAL ERROR IN MAIN TEMPLATE " + baseName(entryRelPath) + "]";
    }

    return finishComposition(std::move(text), std::move(before));
}

CompositionResult TemplateExpander::processFile(const std::string& relPath) {
    beginComposition();
    VariableMap before = character_.variables();
    logger_.info("Processing file " + relPath + " for character " + character_.id());

    std::string text;
    try {
        text = includeFile(relPath);
    } catch (const DslError& e) {
        logger_.error(std::string("Failed to process file: ") + e.what(), relPath);
        text = "[DSL ERROR IN FILE " + baseName(relPath) + "]";
    } catch (const std::exception& e) {
        logger_.error(std::string("Internal error in file: ") + e.what(), relPath);
        text = "[INTERNAL ERROR IN FILE " + baseName(relPath) + "]";
    }

    return finishComposition(std::move(text), std::move(before));
}

CompositionResult TemplateExpander::runScriptSource(const std::string& source,
                                                    const std::string& virtualId,
                                                    std::vector<int>* trace) {
    beginComposition();
    VariableMap before = character_.variables();

    executor_.setTrace(trace);
    std::string text = executor_.runSource(source, virtualId);
    executor_.setTrace(nullptr);

    return finishComposition(std::move(text), std::move(before));
}

std::string TemplateExpander::includeFile(const std::string& relPath) {
    ResourceId id = resolver_.resolve(relPath);
    std::string ext = extensionOf(relPath);

    if (isScriptExtension(ext)) {
        return executor_.run(id, relPath);
    }
    if (ext == "txt") {
        return expandTextFile(id, relPath);
    }
    throw DslError("Unsupported file type '" + relPath + "'", relPath);
}

std::string TemplateExpander::expandDirective(const Directive& directive, const std::string& context) {
    ResourceId id = resolver_.resolve(directive.path);
    ContextGuard guard(resolver_, resolver_.dirname(id));

    std::string raw = directive.kind == DirectiveKind::LoadTag
        ? tags_.extract(id, directive.tag)
        : TagExtractor::stripMarkers(resolver_.load(id));

    return expand(raw, directiveToString(directive) + " in " + baseName(context));
}

std::string TemplateExpander::expandTextFile(const ResourceId& id, const std::string& relPath) {
    ContextGuard guard(resolver_, resolver_.dirname(id));
    std::string raw = TagExtractor::stripMarkers(resolver_.load(id));
    std::string expanded = expand(raw, "txt " + relPath);
    return replaceTextVariables(expanded, [this](const std::string& name) { return textVariable(name); });
}

std::string TemplateExpander::textVariable(const std::string& name) const {
    std::optional<Value> value = character_.getVariable(name);
    return !value || value->isNull() ? "" : value->toString();
}

std::string TemplateExpander::recursionMarker(const std::string& context) const {
    return "[DSL ERROR: MAX RECURSION " + std::to_string(maxRecursion_) + " REACHED IN '" + context + "']";
}

std::string TemplateExpander::expandPlaceholder(const std::string& relPath, const std::string& context) {
    logger_.debug("Processing placeholder " + relPath + " in context '" + context + "'");
    try {
        return includeFile(relPath);
    } catch (const DslError& e) {
        logger_.error("Error processing placeholder " + relPath + " in " + context + ": " + e.what());
        return "[DSL ERROR " + relPath + "]";
    } catch (const std::exception& e) {
        logger_.error("Internal error processing placeholder " + relPath + " in " + context + ": " + e.what());
        return "[INTERNAL ERROR " + relPath + "]";
    }
}

std::string TemplateExpander::expand(const std::string& text, const std::string& context) {
    if (nesting_ >= maxRecursion_) {
        // Past the cap every remaining placeholder becomes the marker, so
        // mutually recursive includes stop here
        std::vector<Placeholder> pending = findPlaceholders(text);
        if (pending.empty()) {
            return text;
        }
        logger_.error("Max recursion depth (" + std::to_string(maxRecursion_) + ") reached in '" + context + "'");
        std::string marker = recursionMarker(context);
        std::string result;
        size_t cursor = 0;
        for (const auto& placeholder : pending) {
            result.append(text, cursor, placeholder.position - cursor);
            result += marker;
            cursor = placeholder.position + placeholder.length;
        }
        result.append(text, cursor, std::string::npos);
        return result;
    }

    nesting_++;
    struct NestingReset {
        int& nesting;
        ~NestingReset() { nesting--; }
    } reset{nesting_};

    std::string current = text;
    int depth = 0;
    while (depth < maxRecursion_) {
        std::vector<Placeholder> placeholders = findPlaceholders(current);
        if (placeholders.empty()) {
            break;
        }
        depth++;

        std::string processed;
        size_t cursor = 0;
        for (const auto& placeholder : placeholders) {
            processed.append(current, cursor, placeholder.position - cursor);
            processed += expandPlaceholder(placeholder.path, context);
            cursor = placeholder.position + placeholder.length;
        }
        processed.append(current, cursor, std::string::npos);

        if (processed == current) {
            const Placeholder& stalled = placeholders.front();
            logger_.error("Template processing stalled at depth " + std::to_string(depth) + " in '" + context +
                          "'. Unresolved: [<" + stalled.path + ">]");
            current.replace(stalled.position, stalled.length, "[STALLED DSL ERROR " + stalled.path + "]");
        } else {
            current = std::move(processed);
        }

        if (depth == maxRecursion_ - 1 && findPlaceholder(current)) {
            logger_.warning("Nearing max recursion depth (" + std::to_string(depth + 1) + "/" +
                            std::to_string(maxRecursion_) + ") in '" + context + "'");
        }
    }

    if (depth >= maxRecursion_ && findPlaceholder(current)) {
        logger_.error("Max recursion depth (" + std::to_string(maxRecursion_) + ") reached in '" + context + "'");
        current += "\n" + recursionMarker(context);
    }
    return current;
}

} // namespace pdsl
