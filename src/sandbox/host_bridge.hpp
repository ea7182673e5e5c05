#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/capture_sink.hpp"
#include "sandbox/execution_types.hpp"

namespace hoya::sandbox {

struct FetchRequest {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

struct FetchResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    bool truncated = false;
};

struct FetchError {
    ErrorKind kind = ErrorKind::kFetchTransportError;
    std::string message;
};

struct FetchResult {
    std::optional<FetchResponse> response;
    std::optional<FetchError> error;

    bool Ok() const { return response.has_value(); }
};

// Everything a host call may touch during one execution. Immutable once built.
struct HostCallContext {
    CaptureSink& sink;
    const hoya::config::FetchPolicyConfig& policy;
    std::chrono::steady_clock::time_point deadline;
};

// Engine-neutral host capabilities. Adapters marshal guest calls into these.
class HostBridge {
public:
    explicit HostBridge(HostCallContext context);

    // "[LEVEL] message" to stderr for warn/error levels, stdout otherwise.
    void Log(const std::string& level, const std::string& message);
    void Write(Stream stream, std::string_view data);
    std::int64_t CurrentUnixTime() const;
    FetchResult Fetch(const FetchRequest& request);

    CaptureSink& Sink() { return context_.sink; }
    std::chrono::steady_clock::time_point Deadline() const { return context_.deadline; }

private:
    HostCallContext context_;
};

// Guest-facing JSON forms shared by both adapters.
// Options: {"url": "...", "method": "GET", "headers": {...}, "body": "..."}.
std::optional<FetchRequest> FetchRequestFromJson(const nlohmann::json& options, std::string& error);
// {"status", "headers", "body", "truncated", "error": {"code", "message"} | null}
nlohmann::json FetchResultToJson(const FetchResult& result);

}  // namespace hoya::sandbox
