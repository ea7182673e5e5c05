#include "utils/url.hpp"

#include <stdexcept>

#include "utils/common.hpp"

namespace hoya::utils {

std::string ParsedUrl::SchemeHostPort() const {
    std::string result = https ? "https://" : "http://";
    if (host.find(':') != std::string::npos) {
        result += "[" + host + "]";
    } else {
        result += host;
    }
    result += ":" + std::to_string(port);
    return result;
}

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    const auto lowered = ToLower(url.substr(0, 8));
    if (lowered.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (lowered.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    } else {
        return std::nullopt;
    }

    const auto fragment_pos = working.find('#');
    if (fragment_pos != std::string::npos) {
        working = working.substr(0, fragment_pos);
    }

    const auto path_pos = working.find_first_of("/?");
    std::string host_port = working;
    if (path_pos != std::string::npos) {
        host_port = working.substr(0, path_pos);
        parsed.path = working.substr(path_pos);
        if (parsed.path.front() == '?') {
            parsed.path.insert(parsed.path.begin(), '/');
        }
    } else {
        parsed.path = "/";
    }

    if (host_port.find('@') != std::string::npos) {
        return std::nullopt;
    }

    std::string port_text;
    if (!host_port.empty() && host_port.front() == '[') {
        const auto close = host_port.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = host_port.substr(1, close - 1);
        const auto rest = host_port.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            port_text = rest.substr(1);
        }
    } else {
        const auto colon_pos = host_port.find(':');
        if (colon_pos != std::string::npos) {
            parsed.host = host_port.substr(0, colon_pos);
            port_text = host_port.substr(colon_pos + 1);
        } else {
            parsed.host = host_port;
        }
    }

    if (!port_text.empty()) {
        try {
            std::size_t consumed = 0;
            const int port = std::stoi(port_text, &consumed);
            if (consumed != port_text.size() || port <= 0 || port > 65535) {
                return std::nullopt;
            }
            parsed.port = port;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    parsed.host = ToLower(parsed.host);
    while (!parsed.host.empty() && parsed.host.back() == '.') {
        parsed.host.pop_back();
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string UrlFileName(const std::string& url) {
    std::string path = url;
    const auto scheme_pos = path.find("://");
    if (scheme_pos != std::string::npos) {
        const auto path_pos = path.find('/', scheme_pos + 3);
        if (path_pos == std::string::npos) {
            return {};
        }
        path = path.substr(path_pos);
    }
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path = path.substr(0, cut);
    }
    const auto slash = path.rfind('/');
    if (slash != std::string::npos) {
        path = path.substr(slash + 1);
    }
    return path;
}

}  // namespace hoya::utils
