#pragma once

#include "resolver/pathResolver.hpp"
#include "resolver/sourceStore.hpp"

#include <filesystem>
#include <memory>

namespace pdsl {

// Resolves against directories; ids are normalized absolute paths
class LocalPathResolver : public PathResolver {
public:
    /**
     * @param root The global prompts root
     * @param characterBase The character's directory, which must lie inside root
     * @param store Where contents are read from (the disk when null)
     */
    LocalPathResolver(const std::filesystem::path& root,
                      const std::filesystem::path& characterBase,
                      std::shared_ptr<SourceStore> store = nullptr);

    SourceStore& store() { return *store_; }

protected:
    std::optional<std::string> join(const std::string& base, const std::string& rel) const override;
    std::string parentOf(const std::string& id) const override;
    bool contains(const std::string& root, const std::string& candidate) const override;
    std::optional<std::string> fetch(const ResourceId& id) const override;

private:
    std::shared_ptr<SourceStore> store_;
};

// Lexically normalized absolute form without a trailing separator
std::string normalizeLocalPath(const std::filesystem::path& path);

} // namespace pdsl
