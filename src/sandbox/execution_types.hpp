#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace hoya::sandbox {

enum class CodeKind {
    kScript,
    kModule,
    kUnknown
};

// Wire names used in response metadata.
inline const char* ToString(CodeKind kind) {
    switch (kind) {
        case CodeKind::kScript: return "javascript";
        case CodeKind::kModule: return "webassembly";
        case CodeKind::kUnknown: return "unknown";
    }
    return "unknown";
}

enum class ErrorKind {
    kDownloadError,
    kUnsupportedCodeKind,
    kInvalidRequest,
    kSyntaxError,
    kRuntimeError,
    kInstantiationError,
    kTrap,
    kInvalidMemoryAccess,
    kTimeout,
    kFetchPolicyViolation,
    kFetchTransportError,
    kResourceLimitExceeded
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kDownloadError: return "DownloadError";
        case ErrorKind::kUnsupportedCodeKind: return "UnsupportedCodeKind";
        case ErrorKind::kInvalidRequest: return "InvalidRequest";
        case ErrorKind::kSyntaxError: return "SyntaxError";
        case ErrorKind::kRuntimeError: return "RuntimeError";
        case ErrorKind::kInstantiationError: return "InstantiationError";
        case ErrorKind::kTrap: return "Trap";
        case ErrorKind::kInvalidMemoryAccess: return "InvalidMemoryAccess";
        case ErrorKind::kTimeout: return "Timeout";
        case ErrorKind::kFetchPolicyViolation: return "FetchPolicyViolation";
        case ErrorKind::kFetchTransportError: return "FetchTransportError";
        case ErrorKind::kResourceLimitExceeded: return "ResourceLimitExceeded";
    }
    return "InternalError";
}

struct FetchedResource {
    std::vector<std::uint8_t> bytes;
    std::size_t size_bytes = 0;
    CodeKind detected_kind = CodeKind::kUnknown;
    std::string source_url;
};

struct ExecutionRequest {
    FetchedResource resource;
    CodeKind kind = CodeKind::kUnknown;
};

struct ExecutionError {
    ErrorKind kind = ErrorKind::kRuntimeError;
    std::string message;
    // null when there is nothing structured to add
    nlohmann::json details;
};

// What an adapter reports back. Output streams live in the CaptureSink.
struct SandboxResult {
    std::optional<std::string> return_value;
    std::optional<ExecutionError> error;
};

struct ExecutionOutcome {
    std::optional<std::string> return_value;
    std::optional<ExecutionError> error;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool Succeeded() const { return !error.has_value(); }
};

struct ExecutionMetadata {
    std::int64_t execution_time_ms = 0;
    CodeKind code_kind = CodeKind::kUnknown;
    std::string completed_at;
    std::size_t resource_size_bytes = 0;
};

struct ExecutionResult {
    ExecutionOutcome outcome;
    ExecutionMetadata metadata;
};

}  // namespace hoya::sandbox
