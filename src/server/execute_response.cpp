#include "server/execute_response.hpp"

namespace hoya::server {

using hoya::sandbox::ErrorKind;

nlohmann::json BuildResponseJson(const hoya::sandbox::ExecutionResult& result) {
    const auto& outcome = result.outcome;
    const auto& metadata = result.metadata;

    nlohmann::json json = nlohmann::json::object();
    json["status"] = outcome.Succeeded() ? "success" : "error";
    json["output"] = outcome.return_value ? nlohmann::json(*outcome.return_value) : nlohmann::json(nullptr);
    json["stdout"] = outcome.stdout_text;
    json["stderr"] = outcome.stderr_text;
    if (outcome.error) {
        json["error"] = {
            {"code", ToString(outcome.error->kind)},
            {"message", outcome.error->message},
            {"details", outcome.error->details}
        };
    } else {
        json["error"] = nullptr;
    }
    json["metadata"] = {
        {"executionTimeMs", metadata.execution_time_ms},
        {"codeType", ToString(metadata.code_kind)},
        {"timestamp", metadata.completed_at},
        {"resourceSize", metadata.resource_size_bytes}
    };

    nlohmann::json warnings = nlohmann::json::array();
    if (outcome.stdout_truncated) {
        warnings.push_back("stdout_truncated");
    }
    if (outcome.stderr_truncated) {
        warnings.push_back("stderr_truncated");
    }
    if (!warnings.empty()) {
        json["warnings"] = std::move(warnings);
    }
    return json;
}

int HttpStatusFor(const hoya::sandbox::ExecutionResult& result) {
    if (!result.outcome.error) {
        return 200;
    }
    switch (result.outcome.error->kind) {
        case ErrorKind::kDownloadError:
            return 502;
        case ErrorKind::kUnsupportedCodeKind:
        case ErrorKind::kInvalidRequest:
            return 400;
        default:
            return 500;
    }
}

}  // namespace hoya::server
