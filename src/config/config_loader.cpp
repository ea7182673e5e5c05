#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("HOYA_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".hoya" / "config.json";
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (source.contains(key) && source[key].is_number_unsigned()) {
        target = source[key].get<std::size_t>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "workerThreads", config.server.worker_threads);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadInt(sandbox, "timeoutMs", config.sandbox.timeout_ms);
        ReadSize(sandbox, "maxOutputBytes", config.sandbox.max_output_bytes);
        ReadSize(sandbox, "scriptMemoryLimitBytes", config.sandbox.script_memory_limit_bytes);
        ReadSize(sandbox, "scriptStackBytes", config.sandbox.script_stack_bytes);
        ReadSize(sandbox, "moduleMemoryLimitBytes", config.sandbox.module_memory_limit_bytes);
    }

    if (data.contains("fetch") && data["fetch"].is_object()) {
        const auto& fetch = data["fetch"];
        if (fetch.contains("allowedDomains") && fetch["allowedDomains"].is_array()) {
            config.fetch.allowed_domains.clear();
            for (const auto& item : fetch["allowedDomains"]) {
                if (item.is_string()) {
                    config.fetch.allowed_domains.push_back(item.get<std::string>());
                }
            }
        }
        ReadSize(fetch, "maxRequestBodyBytes", config.fetch.max_request_body_bytes);
        ReadSize(fetch, "maxResponseBodyBytes", config.fetch.max_response_body_bytes);
        ReadInt(fetch, "timeoutMs", config.fetch.timeout_ms);
        if (fetch.contains("allowLoopback") && fetch["allowLoopback"].is_boolean()) {
            config.fetch.allow_loopback = fetch["allowLoopback"].get<bool>();
        }
    }

    if (data.contains("download") && data["download"].is_object()) {
        const auto& download = data["download"];
        ReadSize(download, "maxBytes", config.download.max_bytes);
        ReadInt(download, "timeoutMs", config.download.timeout_ms);
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.min_level = hoya::utils::ParseLogLevel(log["level"].get<std::string>());
        }
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = hoya::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto host = GetEnvFallback("HOYA_SERVER__HOST", "HOYA_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("HOYA_SERVER__PORT", "HOYA_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto worker_threads = GetEnv("HOYA_SERVER__WORKER_THREADS");
    if (!worker_threads.empty()) {
        config.server.worker_threads = ParseInt(worker_threads, config.server.worker_threads);
    }

    const auto timeout_ms = GetEnvFallback("HOYA_SANDBOX__TIMEOUT_MS", "HOYA_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.sandbox.timeout_ms = ParseInt(timeout_ms, config.sandbox.timeout_ms);
    }

    const auto max_output = GetEnv("HOYA_SANDBOX__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.sandbox.max_output_bytes = ParseSize(max_output, config.sandbox.max_output_bytes);
    }

    const auto script_memory = GetEnv("HOYA_SANDBOX__SCRIPT_MEMORY_LIMIT_BYTES");
    if (!script_memory.empty()) {
        config.sandbox.script_memory_limit_bytes =
            ParseSize(script_memory, config.sandbox.script_memory_limit_bytes);
    }

    const auto module_memory = GetEnv("HOYA_SANDBOX__MODULE_MEMORY_LIMIT_BYTES");
    if (!module_memory.empty()) {
        config.sandbox.module_memory_limit_bytes =
            ParseSize(module_memory, config.sandbox.module_memory_limit_bytes);
    }

    const auto allowed_domains = GetEnvFallback(
        "HOYA_FETCH__ALLOWED_DOMAINS",
        "HOYA_FETCH_ALLOWED_DOMAINS");
    if (!allowed_domains.empty()) {
        config.fetch.allowed_domains = hoya::utils::SplitCsv(allowed_domains);
    }

    const auto max_request_body = GetEnv("HOYA_FETCH__MAX_REQUEST_BODY_BYTES");
    if (!max_request_body.empty()) {
        config.fetch.max_request_body_bytes =
            ParseSize(max_request_body, config.fetch.max_request_body_bytes);
    }

    const auto max_response_body = GetEnv("HOYA_FETCH__MAX_RESPONSE_BODY_BYTES");
    if (!max_response_body.empty()) {
        config.fetch.max_response_body_bytes =
            ParseSize(max_response_body, config.fetch.max_response_body_bytes);
    }

    const auto fetch_timeout = GetEnv("HOYA_FETCH__TIMEOUT_MS");
    if (!fetch_timeout.empty()) {
        config.fetch.timeout_ms = ParseInt(fetch_timeout, config.fetch.timeout_ms);
    }

    const auto allow_loopback = GetEnv("HOYA_FETCH__ALLOW_LOOPBACK");
    if (!allow_loopback.empty()) {
        config.fetch.allow_loopback = ParseBool(allow_loopback);
    }

    const auto download_max = GetEnv("HOYA_DOWNLOAD__MAX_BYTES");
    if (!download_max.empty()) {
        config.download.max_bytes = ParseSize(download_max, config.download.max_bytes);
    }

    const auto download_timeout = GetEnv("HOYA_DOWNLOAD__TIMEOUT_MS");
    if (!download_timeout.empty()) {
        config.download.timeout_ms = ParseInt(download_timeout, config.download.timeout_ms);
    }

    const auto log_level = GetEnvFallback("HOYA_LOG__LEVEL", "HOYA_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.min_level = hoya::utils::ParseLogLevel(log_level);
    }
}

}  // namespace

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            hoya::utils::Log(hoya::utils::LogLevel::kWarn, "config",
                             "ignoring " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

}  // namespace hoya::config
