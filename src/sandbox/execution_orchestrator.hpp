#pragma once

#include <memory>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/sandbox.hpp"

namespace hoya::sandbox {

// Picks the adapter for a request, enforces the wall-clock budget and turns
// whatever the adapter reports into one uniform ExecutionResult.
//
// Thread-safe: each Execute call owns its sink, bridge and adapter. The only
// shared pieces are the read-only config and the watchdog io_context.
class ExecutionOrchestrator {
public:
    explicit ExecutionOrchestrator(const hoya::config::Config& config);
    ~ExecutionOrchestrator();

    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    ExecutionResult Execute(const ExecutionRequest& request);

    // Builds a result for a request that failed before any adapter ran.
    static ExecutionResult Rejected(ExecutionError error, CodeKind kind, std::size_t resource_size_bytes);

private:
    std::unique_ptr<Sandbox> CreateSandbox(CodeKind kind) const;

    const hoya::config::Config& config_;
    boost::asio::io_context watchdog_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> watchdog_guard_;
    std::thread watchdog_thread_;
};

}  // namespace hoya::sandbox
