#pragma once

#include "nlohmann/json.hpp"
#include "sandbox/execution_types.hpp"

namespace hoya::server {

// {status, output, stdout, stderr, error, metadata[, warnings]}
nlohmann::json BuildResponseJson(const hoya::sandbox::ExecutionResult& result);

// 200 success, 400 bad request or unsupported kind, 502 download failure,
// 500 for every execution failure.
int HttpStatusFor(const hoya::sandbox::ExecutionResult& result);

}  // namespace hoya::server
