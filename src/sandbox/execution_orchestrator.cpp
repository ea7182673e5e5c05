#include "sandbox/execution_orchestrator.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "sandbox/capture_sink.hpp"
#include "sandbox/host_bridge.hpp"
#include "sandbox/module_sandbox.hpp"
#include "sandbox/script_sandbox.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::sandbox {
namespace {

// Shared between the executing thread and the watchdog. Once detached, a late
// timer can no longer reach the adapter.
class InterruptLatch {
public:
    explicit InterruptLatch(Sandbox* target)
        : target_(target) {}

    void Fire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!target_) {
            return;
        }
        fired_ = true;
        target_->Interrupt();
    }

    void Detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = nullptr;
    }

    bool Fired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

private:
    mutable std::mutex mutex_;
    Sandbox* target_;
    bool fired_ = false;
};

ExecutionMetadata MakeMetadata(std::chrono::steady_clock::time_point started, CodeKind kind,
                               std::size_t resource_size_bytes) {
    return ExecutionMetadata{
        .execution_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count(),
        .code_kind = kind,
        .completed_at = hoya::utils::FormatIso8601(hoya::utils::Now()),
        .resource_size_bytes = resource_size_bytes};
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(const hoya::config::Config& config)
    : config_(config),
      watchdog_guard_(boost::asio::make_work_guard(watchdog_)),
      watchdog_thread_([this]() { watchdog_.run(); }) {}

ExecutionOrchestrator::~ExecutionOrchestrator() {
    watchdog_guard_.reset();
    watchdog_.stop();
    if (watchdog_thread_.joinable()) {
        watchdog_thread_.join();
    }
}

ExecutionResult ExecutionOrchestrator::Rejected(ExecutionError error, CodeKind kind,
                                                std::size_t resource_size_bytes) {
    ExecutionResult result{};
    result.outcome.error = std::move(error);
    result.metadata = MakeMetadata(std::chrono::steady_clock::now(), kind, resource_size_bytes);
    return result;
}

std::unique_ptr<Sandbox> ExecutionOrchestrator::CreateSandbox(CodeKind kind) const {
    switch (kind) {
        case CodeKind::kScript:
            return std::make_unique<ScriptSandbox>(config_.sandbox);
        case CodeKind::kModule:
            return std::make_unique<ModuleSandbox>(config_.sandbox);
        case CodeKind::kUnknown:
            break;
    }
    return nullptr;
}

ExecutionResult ExecutionOrchestrator::Execute(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    const auto size = request.resource.bytes.size();

    auto sandbox = CreateSandbox(request.kind);
    if (!sandbox) {
        hoya::utils::Log(hoya::utils::LogLevel::kWarn, "execute",
                         "rejected resource of " + std::to_string(size) + " bytes: unsupported code kind");
        return Rejected(ExecutionError{
                            .kind = ErrorKind::kUnsupportedCodeKind,
                            .message = "could not determine whether the resource is JavaScript or WebAssembly",
                            .details = nullptr},
                        request.kind, size);
    }

    CaptureSink sink(config_.sandbox.max_output_bytes);
    const auto deadline = started + std::chrono::milliseconds(config_.sandbox.timeout_ms);
    HostBridge bridge(HostCallContext{.sink = sink, .policy = config_.fetch, .deadline = deadline});

    auto latch = std::make_shared<InterruptLatch>(sandbox.get());
    auto timer = std::make_shared<boost::asio::steady_timer>(watchdog_);
    boost::asio::post(watchdog_, [timer, latch, deadline]() {
        timer->expires_at(deadline);
        timer->async_wait([timer, latch](const boost::system::error_code& ec) {
            if (!ec) {
                latch->Fire();
            }
        });
    });

    hoya::utils::Log(hoya::utils::LogLevel::kDebug, "execute",
                     std::string("start kind=") + ToString(request.kind) + " size=" + std::to_string(size));

    SandboxResult result{};
    try {
        result = sandbox->Execute(request.resource, bridge);
    } catch (const std::exception& ex) {
        hoya::utils::Log(hoya::utils::LogLevel::kError, "execute", std::string("adapter failed: ") + ex.what());
        result.return_value.reset();
        result.error = ExecutionError{
            .kind = ErrorKind::kRuntimeError,
            .message = std::string("internal error: ") + ex.what(),
            .details = nullptr};
    }

    latch->Detach();
    boost::asio::post(watchdog_, [timer]() { timer->cancel(); });
    sandbox.reset();

    ExecutionResult execution{};
    auto& outcome = execution.outcome;
    if (result.error) {
        outcome.error = std::move(result.error);
    } else {
        outcome.return_value = std::move(result.return_value);
    }
    outcome.stdout_text = sink.Drain(Stream::kStdout);
    outcome.stderr_text = sink.Drain(Stream::kStderr);
    outcome.stdout_truncated = sink.Truncated(Stream::kStdout);
    outcome.stderr_truncated = sink.Truncated(Stream::kStderr);
    execution.metadata = MakeMetadata(started, request.kind, size);

    if (outcome.Succeeded()) {
        hoya::utils::Log(hoya::utils::LogLevel::kInfo, "execute",
                         std::string(ToString(request.kind)) + " completed in " +
                         std::to_string(execution.metadata.execution_time_ms) + "ms");
    } else {
        hoya::utils::Log(hoya::utils::LogLevel::kInfo, "execute",
                         std::string(ToString(request.kind)) + " failed with " +
                         ToString(outcome.error->kind) + (latch->Fired() ? " (deadline reached)" : "") +
                         " after " + std::to_string(execution.metadata.execution_time_ms) + "ms");
    }
    return execution;
}

}  // namespace hoya::sandbox
