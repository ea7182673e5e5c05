#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace hoya::config {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 3000;
    int worker_threads = 8;
};

struct SandboxConfig {
    int timeout_ms = 5000;
    std::size_t max_output_bytes = 1024 * 1024;
    std::size_t script_memory_limit_bytes = 64 * 1024 * 1024;
    std::size_t script_stack_bytes = 1024 * 1024;
    std::size_t module_memory_limit_bytes = 128 * 1024 * 1024;
};

// An empty allowed_domains list lets guests reach any public host.
struct FetchPolicyConfig {
    std::vector<std::string> allowed_domains;
    std::size_t max_request_body_bytes = 1024 * 1024;
    std::size_t max_response_body_bytes = 1024 * 1024;
    int timeout_ms = 10000;
    bool allow_loopback = false;
};

struct DownloadConfig {
    std::size_t max_bytes = 10 * 1024 * 1024;
    int timeout_ms = 20000;
};

struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    FetchPolicyConfig fetch;
    DownloadConfig download;
    hoya::utils::LogConfig log;
};

}  // namespace hoya::config
