#include "fetch/resource_downloader.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "detect/code_kind.hpp"
#include "httplib.h"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace hoya::fetch {
namespace {

using hoya::sandbox::ErrorKind;
using hoya::sandbox::ExecutionError;

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

// First usable of HTTPS_PROXY, HTTP_PROXY, https_proxy, http_proxy.
void ApplyProxy(httplib::Client& client) {
    std::string host;
    int port = 0;
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

DownloadResult Failure(const std::string& url, std::string message, int status = 0) {
    hoya::utils::Log(hoya::utils::LogLevel::kWarn, "download", url + ": " + message);
    nlohmann::json details = {{"url", url}};
    if (status != 0) {
        details["status"] = status;
    }
    return DownloadResult{
        .resource = std::nullopt,
        .error = ExecutionError{.kind = ErrorKind::kDownloadError, .message = std::move(message), .details = details}};
}

}  // namespace

ResourceDownloader::ResourceDownloader(const hoya::config::DownloadConfig& config)
    : config_(config) {}

DownloadResult ResourceDownloader::Download(const std::string& url) const {
    const auto parsed = hoya::utils::ParseUrl(url);
    if (!parsed || parsed->host.empty()) {
        return Failure(url, "only http and https urls can be downloaded");
    }

    httplib::Client client(parsed->SchemeHostPort());
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_follow_location(true);
    ApplyProxy(client);

    int status = 0;
    bool oversized = false;
    std::vector<std::uint8_t> bytes;
    const auto max_bytes = config_.max_bytes;
    auto response = client.Get(
        parsed->path,
        [&](const httplib::Response& head) {
            status = head.status;
            return true;
        },
        [&](const char* data, std::size_t length) {
            if (bytes.size() + length > max_bytes) {
                oversized = true;
                return false;
            }
            bytes.insert(bytes.end(), data, data + length);
            return true;
        });

    if (oversized) {
        return Failure(url, "resource exceeds the download limit of " + std::to_string(max_bytes) + " bytes");
    }
    if (!response) {
        return Failure(url, "request failed: " + httplib::to_string(response.error()));
    }
    status = response->status;
    if (status < 200 || status >= 300) {
        return Failure(url, "server answered HTTP " + std::to_string(status), status);
    }

    hoya::sandbox::FetchedResource resource{};
    resource.size_bytes = bytes.size();
    resource.detected_kind = hoya::detect::DetectCodeKind(url, bytes);
    resource.bytes = std::move(bytes);
    resource.source_url = url;
    hoya::utils::Log(hoya::utils::LogLevel::kDebug, "download",
                     url + " -> " + std::to_string(resource.size_bytes) + " bytes");
    return DownloadResult{.resource = std::move(resource), .error = std::nullopt};
}

}  // namespace hoya::fetch
