#include "resolver/localPathResolver.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace pdsl {

std::string normalizeLocalPath(const fs::path& path) {
    fs::path normalized = fs::absolute(path).lexically_normal();
    if (normalized.has_relative_path() && !normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    return normalized.generic_string();
}

LocalPathResolver::LocalPathResolver(const fs::path& root,
                                     const fs::path& characterBase,
                                     std::shared_ptr<SourceStore> store)
    : PathResolver(normalizeLocalPath(root), normalizeLocalPath(characterBase)),
      store_(store ? std::move(store) : std::make_shared<DiskSourceStore>()) {
    checkCharacterBase();
}

std::optional<std::string> LocalPathResolver::join(const std::string& base, const std::string& rel) const {
    fs::path joined = (fs::path(base) / rel).lexically_normal();
    if (joined.has_relative_path() && !joined.has_filename()) {
        joined = joined.parent_path();
    }
    return joined.generic_string();
}

std::string LocalPathResolver::parentOf(const std::string& id) const {
    return fs::path(id).parent_path().generic_string();
}

bool LocalPathResolver::contains(const std::string& root, const std::string& candidate) const {
    fs::path rootPath(root);
    fs::path candidatePath(candidate);
    auto [rootIt, candidateIt] = std::mismatch(rootPath.begin(), rootPath.end(),
                                               candidatePath.begin(), candidatePath.end());
    return rootIt == rootPath.end();
}

std::optional<std::string> LocalPathResolver::fetch(const ResourceId& id) const {
    return store_->read(id.value);
}

} // namespace pdsl
