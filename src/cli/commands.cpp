#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "server/execute_response.hpp"
#include "server/http_server.hpp"
#include "service/execute_service.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

hoya::config::Config LoadAndApplyConfig() {
    auto config = hoya::config::LoadConfig();
    hoya::utils::SetLogConfig(config.log);
    return config;
}

int PrintResult(const hoya::sandbox::ExecutionResult& result) {
    std::cout << hoya::server::BuildResponseJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.outcome.Succeeded() ? 0 : 1;
}

int RunServer() {
    const auto config = LoadAndApplyConfig();
    hoya::service::ExecuteService service(config);
    hoya::server::HttpServer http_server(config.server, service);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    std::cout << "hoya listening on " << config.server.host << ":" << config.server.port
              << ". Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    while (g_running.load() && !listen_failed.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                // In-flight executions are bounded by the sandbox timeout; give up after that.
                const auto grace = std::chrono::milliseconds(config.sandbox.timeout_ms) + std::chrono::seconds(5);
                std::thread([grace] {
                    std::this_thread::sleep_for(grace);
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunLocal(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "No such file: " << path << std::endl;
        return 1;
    }
    const auto config = LoadAndApplyConfig();
    hoya::service::ExecuteService service(config);
    return PrintResult(service.ExecuteLocal(path));
}

int RunUrl(const std::string& url) {
    const auto config = LoadAndApplyConfig();
    hoya::service::ExecuteService service(config);
    return PrintResult(service.ExecuteUrl(url));
}

void PrintUsage() {
    std::cout << "Usage: hoya serve | hoya run <path.js|path.wasm> | hoya exec <url>" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "serve") {
        return RunServer();
    }
    if (command == "run" && argc >= 3) {
        return RunLocal(argv[2]);
    }
    if (command == "exec" && argc >= 3) {
        return RunUrl(argv[2]);
    }
    PrintUsage();
    return 1;
}
