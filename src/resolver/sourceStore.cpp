#include "resolver/sourceStore.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace pdsl {

std::optional<std::string> DiskSourceStore::read(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void MemorySourceStore::add(const std::string& path, std::string content) {
    files_[fs::path(path).lexically_normal().generic_string()] = std::move(content);
}

std::optional<std::string> MemorySourceStore::read(const std::string& path) {
    auto it = files_.find(path);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace pdsl
