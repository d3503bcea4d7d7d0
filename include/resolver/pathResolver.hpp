#pragma once

#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace pdsl {

// Opaque, root-bounded identifier of a prompt resource (a normalized absolute
// path or a URL). Two ids are equal iff they name the same resource.
struct ResourceId {
    std::string value;

    const std::string& str() const { return value; }
    bool empty() const { return value.empty(); }

    auto operator<=>(const ResourceId&) const = default;
};

// Last path segment of an id or reference ("a/b/c.txt" -> "c.txt")
std::string baseName(const std::string& path);

// Lower-cased extension without the dot ("x.Script" -> "script")
std::string extensionOf(const std::string& path);

/**
 * Maps relative references to resource ids that never leave the prompts root.
 *
 * Precedence:
 *   _CommonPrompts/..., _CommonScripts/...  -> the global root
 *   ./..., ../...                           -> top of the context stack, or the character base
 *   anything else                           -> the character base
 *
 * Subclasses provide the joining rules and the actual reads.
 */
class PathResolver {
public:
    virtual ~PathResolver() = default;

    /**
     * Resolve a reference against the rules above
     * @throws ResolutionError for empty or absolute references and for results outside the root
     */
    ResourceId resolve(const std::string& relPath) const;

    /**
     * Read a resource with its trailing whitespace removed
     * @throws NotFoundError if the resource doesn't exist
     */
    std::string load(const ResourceId& id) const;

    // Containing directory, checked against the root
    ResourceId dirname(const ResourceId& id) const;

    void pushContext(const ResourceId& dir);
    void popContext();
    std::optional<ResourceId> currentContext() const;
    size_t contextDepth() const { return contextStack_.size(); }

    const ResourceId& globalRoot() const { return root_; }
    const ResourceId& characterBase() const { return characterBase_; }

    // Whether an id lies inside the global root
    bool isInsideRoot(const ResourceId& id) const { return contains(root_.value, id.value); }

protected:
    PathResolver(std::string root, std::string characterBase);

    // Fails construction when the character base lies outside the root
    void checkCharacterBase() const;

    // Normalized join; nullopt if `..` climbs above the top of the namespace
    virtual std::optional<std::string> join(const std::string& base, const std::string& rel) const = 0;
    virtual std::string parentOf(const std::string& id) const = 0;
    virtual bool contains(const std::string& root, const std::string& candidate) const = 0;
    virtual std::optional<std::string> fetch(const ResourceId& id) const = 0;

private:
    ResourceId root_;
    ResourceId characterBase_;
    std::vector<ResourceId> contextStack_;
};

// Pushes a directory context for the lifetime of the guard
class ContextGuard {
public:
    ContextGuard(PathResolver& resolver, const ResourceId& dir) : resolver_(resolver) {
        resolver_.pushContext(dir);
    }
    ~ContextGuard() { resolver_.popContext(); }

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    PathResolver& resolver_;
};

} // namespace pdsl
