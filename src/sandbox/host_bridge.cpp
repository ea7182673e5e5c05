#include "sandbox/host_bridge.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <set>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "httplib.h"
#include "sandbox/fetch_policy.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace hoya::sandbox {
namespace {

const std::set<std::string> kAllowedMethods = {
    "GET", "HEAD", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"
};

FetchResult Violation(std::string message) {
    hoya::utils::Log(hoya::utils::LogLevel::kDebug, "bridge", "fetch rejected: " + message);
    return FetchResult{
        .response = std::nullopt,
        .error = FetchError{.kind = ErrorKind::kFetchPolicyViolation, .message = std::move(message)}};
}

FetchResult TransportError(std::string message) {
    return FetchResult{
        .response = std::nullopt,
        .error = FetchError{.kind = ErrorKind::kFetchTransportError, .message = std::move(message)}};
}

bool IsRestrictedHeader(const std::string& name) {
    const auto lowered = hoya::utils::ToLower(name);
    return lowered == "host" || lowered == "content-length" || lowered == "transfer-encoding" ||
           lowered == "connection";
}

// Header names are RFC 7230 tokens; values may not carry line breaks or NUL.
bool IsValidHeaderName(const std::string& name) {
    static const std::string kTokenPunctuation = "!#$%&'*+-.^_`|~";
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return std::isalnum(byte) || kTokenPunctuation.find(c) != std::string::npos;
    });
}

bool IsValidHeaderValue(const std::string& value) {
    return value.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

// Stops the client once the call deadline passes. httplib's own timeouts only
// bound a single socket read or write.
class CallDeadline {
public:
    CallDeadline(httplib::Client& client, std::chrono::steady_clock::time_point deadline)
        : timer_(io_, deadline) {
        timer_.async_wait([this, &client](const boost::system::error_code& ec) {
            if (!ec) {
                expired_.store(true);
                client.stop();
            }
        });
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~CallDeadline() {
        boost::asio::post(io_, [this]() { timer_.cancel(); });
        thread_.join();
    }

    CallDeadline(const CallDeadline&) = delete;
    CallDeadline& operator=(const CallDeadline&) = delete;

    bool Expired() const { return expired_.load(); }

private:
    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> expired_{false};
    std::thread thread_;
};

}  // namespace

HostBridge::HostBridge(HostCallContext context)
    : context_(context) {}

void HostBridge::Log(const std::string& level, const std::string& message) {
    const auto label = level.empty() ? std::string("INFO") : hoya::utils::ToUpper(level);
    const auto parsed = hoya::utils::ParseLogLevel(label);
    const auto stream = (parsed == hoya::utils::LogLevel::kWarn || parsed == hoya::utils::LogLevel::kError)
        ? Stream::kStderr
        : Stream::kStdout;
    context_.sink.Write(stream, "[" + label + "] " + message + "\n");
}

void HostBridge::Write(Stream stream, std::string_view data) {
    context_.sink.Write(stream, data);
}

std::int64_t HostBridge::CurrentUnixTime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

FetchResult HostBridge::Fetch(const FetchRequest& request) {
    const auto& policy = context_.policy;

    const auto parsed = hoya::utils::ParseUrl(request.url);
    if (!parsed) {
        return Violation("unsupported or malformed url: " + request.url);
    }
    if (!IsHostAllowed(parsed->host, policy.allowed_domains)) {
        return Violation("host not in allow-list: " + parsed->host);
    }
    const auto method = hoya::utils::ToUpper(request.method.empty() ? std::string("GET") : request.method);
    if (kAllowedMethods.count(method) == 0) {
        return Violation("unsupported method: " + method);
    }
    if (request.body && request.body->size() > policy.max_request_body_bytes) {
        return Violation("request body of " + std::to_string(request.body->size()) +
                         " bytes exceeds limit of " + std::to_string(policy.max_request_body_bytes));
    }
    for (const auto& [name, value] : request.headers) {
        if (!IsValidHeaderName(name)) {
            return Violation("invalid header name: " + name);
        }
        if (!IsValidHeaderValue(value)) {
            return Violation("header " + name + " contains a line break or NUL");
        }
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= context_.deadline) {
        return TransportError("execution deadline reached before fetch");
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(context_.deadline - now);
    const auto timeout = std::min(std::chrono::milliseconds(policy.timeout_ms), remaining);
    const auto call_deadline = now + timeout;

    const auto resolved = ResolveHost(parsed->host, parsed->port, policy.allow_loopback, timeout);
    if (resolved.restricted) {
        return Violation(resolved.error);
    }
    if (!resolved.ok) {
        return TransportError(resolved.error);
    }
    const auto after_resolve = std::chrono::steady_clock::now();
    if (after_resolve >= call_deadline) {
        return TransportError("fetch timed out after " + std::to_string(timeout.count()) + "ms");
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(call_deadline - after_resolve);

    httplib::Client client(parsed->SchemeHostPort());
    client.set_connection_timeout(left);
    client.set_read_timeout(left);
    client.set_write_timeout(left);
    client.set_follow_location(false);
    client.set_hostname_addr_map({{parsed->host, resolved.address}});

    httplib::Request http_request;
    http_request.method = method;
    http_request.path = parsed->path;
    for (const auto& [name, value] : request.headers) {
        if (!IsRestrictedHeader(name)) {
            http_request.set_header(name, value);
        }
    }
    if (request.body) {
        http_request.body = *request.body;
    }

    std::string body;
    bool truncated = false;
    bool timed_out = false;
    const auto max_body = policy.max_response_body_bytes;
    http_request.content_receiver =
        [&](const char* data, std::size_t length, std::uint64_t, std::uint64_t) {
            if (std::chrono::steady_clock::now() > call_deadline) {
                timed_out = true;
                return false;
            }
            const auto room = max_body - body.size();
            if (length > room) {
                body.append(data, room);
                truncated = true;
                return false;
            }
            body.append(data, length);
            return true;
        };

    httplib::Response http_response;
    httplib::Error error = httplib::Error::Success;
    bool sent = false;
    {
        CallDeadline guard(client, call_deadline);
        sent = client.send(http_request, http_response, error);
        timed_out = timed_out || (!sent && guard.Expired());
    }
    if (timed_out) {
        return TransportError("fetch timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (!sent && !(truncated && error == httplib::Error::Canceled)) {
        if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read) {
            return TransportError("fetch to " + parsed->host + " failed: " + httplib::to_string(error) +
                                  " (timeout " + std::to_string(timeout.count()) + "ms)");
        }
        return TransportError("fetch to " + parsed->host + " failed: " + httplib::to_string(error));
    }

    FetchResponse response{};
    response.status = http_response.status;
    for (const auto& [name, value] : http_response.headers) {
        auto [it, inserted] = response.headers.emplace(name, value);
        if (!inserted) {
            it->second += ", " + value;
        }
    }
    response.body = std::move(body);
    response.truncated = truncated;
    return FetchResult{.response = std::move(response), .error = std::nullopt};
}

std::optional<FetchRequest> FetchRequestFromJson(const nlohmann::json& options, std::string& error) {
    if (!options.is_object()) {
        error = "fetch options must be an object";
        return std::nullopt;
    }
    if (!options.contains("url") || !options["url"].is_string()) {
        error = "fetch options require a string url";
        return std::nullopt;
    }
    FetchRequest request{};
    request.url = options["url"].get<std::string>();
    if (options.contains("method") && options["method"].is_string()) {
        request.method = options["method"].get<std::string>();
    }
    if (options.contains("headers") && options["headers"].is_object()) {
        for (const auto& item : options["headers"].items()) {
            if (item.value().is_string()) {
                request.headers[item.key()] = item.value().get<std::string>();
            } else {
                request.headers[item.key()] = item.value().dump();
            }
        }
    }
    if (options.contains("body") && !options["body"].is_null()) {
        const auto& body = options["body"];
        request.body = body.is_string() ? body.get<std::string>() : body.dump();
    }
    return request;
}

nlohmann::json FetchResultToJson(const FetchResult& result) {
    nlohmann::json json = nlohmann::json::object();
    if (result.response) {
        json["status"] = result.response->status;
        json["headers"] = result.response->headers;
        json["body"] = hoya::utils::SanitizeUtf8(result.response->body);
        json["truncated"] = result.response->truncated;
        json["error"] = nullptr;
        return json;
    }
    json["status"] = 0;
    json["headers"] = nlohmann::json::object();
    json["body"] = "";
    json["truncated"] = false;
    if (result.error) {
        json["error"] = {
            {"code", ToString(result.error->kind)},
            {"message", result.error->message}
        };
    } else {
        json["error"] = nullptr;
    }
    return json;
}

}  // namespace hoya::sandbox
