#pragma once

#include <map>
#include <optional>
#include <string>

namespace pdsl {

// Where the local resolver reads file contents from. Reads are never cached:
// an edited file is seen on the next composition.
class SourceStore {
public:
    virtual ~SourceStore() = default;

    // Returns nullopt if the file doesn't exist or can't be read
    virtual std::optional<std::string> read(const std::string& path) = 0;
};

// Reads directly from disk
class DiskSourceStore : public SourceStore {
public:
    std::optional<std::string> read(const std::string& path) override;
};

// Files held in memory, keyed by normalized absolute path. Used by tests and
// by hosts that keep prompt sources in their own storage.
class MemorySourceStore : public SourceStore {
public:
    void add(const std::string& path, std::string content);
    void remove(const std::string& path) { files_.erase(path); }
    size_t size() const { return files_.size(); }

    std::optional<std::string> read(const std::string& path) override;

private:
    std::map<std::string, std::string> files_;
};

} // namespace pdsl
