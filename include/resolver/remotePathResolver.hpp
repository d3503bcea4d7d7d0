#pragma once

#include "resolver/pathResolver.hpp"

#include <functional>

namespace pdsl {

// Resolves against a URL prefix. Fetching is left to the host: this library
// carries no network code.
class RemotePathResolver : public PathResolver {
public:
    // Returns nullopt when the URL can't be fetched
    using Fetcher = std::function<std::optional<std::string>(const std::string& url)>;

    RemotePathResolver(const std::string& rootUrl, const std::string& characterBaseUrl, Fetcher fetcher);

protected:
    std::optional<std::string> join(const std::string& base, const std::string& rel) const override;
    std::string parentOf(const std::string& id) const override;
    bool contains(const std::string& root, const std::string& candidate) const override;
    std::optional<std::string> fetch(const ResourceId& id) const override;

private:
    Fetcher fetcher_;
};

// "https://host/a/./b/" -> "https://host/a/b"; nullopt if `..` leaves the host
std::optional<std::string> normalizeUrl(const std::string& url);

} // namespace pdsl
