#include "resolver/pathResolver.hpp"
#include "diagnostics/errors.hpp"

#include <algorithm>
#include <cctype>

namespace pdsl {

namespace {

const char* const kCommonDirectories[] = {"_CommonPrompts", "_CommonScripts"};

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool isCommonReference(const std::string& ref) {
    for (const char* dir : kCommonDirectories) {
        std::string name(dir);
        if (ref == name || startsWith(ref, name + "/")) {
            return true;
        }
    }
    return false;
}

bool isContextReference(const std::string& ref) {
    return ref == "." || ref == ".." || startsWith(ref, "./") || startsWith(ref, "../");
}

bool isAbsoluteReference(const std::string& ref) {
    if (ref[0] == '/') {
        return true;
    }
    if (ref.size() > 1 && std::isalpha(static_cast<unsigned char>(ref[0])) && ref[1] == ':') {
        return true;
    }
    return ref.find("://") != std::string::npos;
}

} // namespace

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string extensionOf(const std::string& path) {
    std::string name = baseName(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

PathResolver::PathResolver(std::string root, std::string characterBase)
    : root_{std::move(root)}, characterBase_{std::move(characterBase)} {}

void PathResolver::checkCharacterBase() const {
    if (!contains(root_.value, characterBase_.value)) {
        throw ResolutionError("Character directory '" + characterBase_.value +
                              "' is outside the prompts root '" + root_.value + "'");
    }
}

ResourceId PathResolver::resolve(const std::string& relPath) const {
    std::string ref = relPath;
    std::replace(ref.begin(), ref.end(), '\\', '/');
    size_t first = ref.find_first_not_of(" \t\r\n");
    size_t last = ref.find_last_not_of(" \t\r\n");
    ref = first == std::string::npos ? "" : ref.substr(first, last - first + 1);

    if (ref.empty()) {
        throw ResolutionError("Empty path reference");
    }
    if (isAbsoluteReference(ref)) {
        throw ResolutionError("Absolute path reference not allowed: '" + relPath + "'");
    }

    const std::string* base = &characterBase_.value;
    if (isCommonReference(ref)) {
        base = &root_.value;
    } else if (isContextReference(ref) && !contextStack_.empty()) {
        base = &contextStack_.back().value;
    }

    std::optional<std::string> joined = join(*base, ref);
    if (!joined || !contains(root_.value, *joined)) {
        throw ResolutionError("Path '" + relPath + "' resolves outside the prompts root");
    }
    return ResourceId{*joined};
}

std::string PathResolver::load(const ResourceId& id) const {
    std::optional<std::string> content = fetch(id);
    if (!content) {
        throw NotFoundError("File not found: " + id.value, id.value);
    }

    std::string text = std::move(*content);
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    text.erase(end == std::string::npos ? 0 : end + 1);
    return text;
}

ResourceId PathResolver::dirname(const ResourceId& id) const {
    std::string parent = parentOf(id.value);
    if (!contains(root_.value, parent)) {
        throw ResolutionError("Directory of '" + id.value + "' is outside the prompts root");
    }
    return ResourceId{parent};
}

void PathResolver::pushContext(const ResourceId& dir) {
    contextStack_.push_back(dir);
}

void PathResolver::popContext() {
    if (contextStack_.empty()) {
        throw ResolutionError("Cannot pop from an empty directory context stack");
    }
    contextStack_.pop_back();
}

std::optional<ResourceId> PathResolver::currentContext() const {
    if (contextStack_.empty()) {
        return std::nullopt;
    }
    return contextStack_.back();
}

} // namespace pdsl
