#pragma once

#include <optional>
#include <string>

namespace hoya::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path;

    // "https://host:port", with brackets around IPv6 literals.
    std::string SchemeHostPort() const;
};

// Only absolute http:// and https:// URLs are accepted. Hosts are lower-cased,
// fragments dropped, and URLs carrying credentials rejected.
std::optional<ParsedUrl> ParseUrl(const std::string& url);

// Final path segment without query or fragment, e.g. "/a/b.wasm?x=1" -> "b.wasm".
std::string UrlFileName(const std::string& url);

}  // namespace hoya::utils
