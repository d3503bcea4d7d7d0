#pragma once

#include "interpreter/directive.hpp"

#include <string>

namespace pdsl {

// What scripts and expressions need from the template layer. The template
// expander implements it; the executor and evaluator only see this seam.
class IncludeHost {
public:
    virtual ~IncludeHost() = default;

    // Placeholder expansion over a piece of text
    virtual std::string expand(const std::string& text, const std::string& context) = 0;

    // Run a script or template-process a text file, given a reference.
    // Throws DslError when the reference can't be resolved or loaded.
    virtual std::string includeFile(const std::string& relPath) = 0;

    // Load what a LOAD directive names and template-process it
    virtual std::string expandDirective(const Directive& directive, const std::string& context) = 0;
};

} // namespace pdsl
