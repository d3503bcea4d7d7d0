#include "resolver/remotePathResolver.hpp"
#include "diagnostics/errors.hpp"

#include <vector>

namespace pdsl {

namespace {

// Splits "scheme://host/path" into "scheme://host" and "/path"
std::pair<std::string, std::string> splitUrl(const std::string& url) {
    size_t scheme = url.find("://");
    size_t pathStart = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (pathStart == std::string::npos) {
        return {url, ""};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

std::optional<std::string> normalizePath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(start, slash - start);
        start = slash + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized;
    for (const auto& segment : segments) {
        normalized += "/" + segment;
    }
    return normalized;
}

} // namespace

std::optional<std::string> normalizeUrl(const std::string& url) {
    auto [origin, path] = splitUrl(url);
    auto normalized = normalizePath(path);
    if (!normalized) {
        return std::nullopt;
    }
    return origin + *normalized;
}

RemotePathResolver::RemotePathResolver(const std::string& rootUrl, const std::string& characterBaseUrl,
                                       Fetcher fetcher)
    : PathResolver(normalizeUrl(rootUrl).value_or(rootUrl), normalizeUrl(characterBaseUrl).value_or(characterBaseUrl)),
      fetcher_(std::move(fetcher)) {
    if (rootUrl.find("://") == std::string::npos) {
        throw ResolutionError("Remote prompts root must be a URL: '" + rootUrl + "'");
    }
    checkCharacterBase();
}

std::optional<std::string> RemotePathResolver::join(const std::string& base, const std::string& rel) const {
    auto [origin, path] = splitUrl(base);
    auto normalized = normalizePath(path + "/" + rel);
    if (!normalized) {
        return std::nullopt;
    }
    return origin + *normalized;
}

std::string RemotePathResolver::parentOf(const std::string& id) const {
    auto [origin, path] = splitUrl(id);
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return origin;
    }
    return origin + path.substr(0, slash);
}

bool RemotePathResolver::contains(const std::string& root, const std::string& candidate) const {
    if (candidate == root) {
        return true;
    }
    return candidate.compare(0, root.size() + 1, root + "/") == 0;
}

std::optional<std::string> RemotePathResolver::fetch(const ResourceId& id) const {
    if (!fetcher_) {
        return std::nullopt;
    }
    return fetcher_(id.value);
}

} // namespace pdsl
