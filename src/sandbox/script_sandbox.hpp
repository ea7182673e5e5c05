#pragma once

#include <atomic>

#include "config/config_schema.hpp"
#include "sandbox/sandbox.hpp"

struct JSRuntime;
struct JSContext;

namespace hoya::sandbox {

// QuickJS-backed adapter. Each instance owns a private runtime and context,
// so no heap state is shared between executions.
class ScriptSandbox : public Sandbox {
public:
    enum class State {
        kCreated,
        kBound,
        kExecuting,
        kCompleted,
        kFailed
    };

    explicit ScriptSandbox(const hoya::config::SandboxConfig& config);
    ~ScriptSandbox() override;

    ScriptSandbox(const ScriptSandbox&) = delete;
    ScriptSandbox& operator=(const ScriptSandbox&) = delete;

    CodeKind Kind() const override { return CodeKind::kScript; }
    SandboxResult Execute(const FetchedResource& resource, HostBridge& bridge) override;
    void Interrupt() override;

    State CurrentState() const { return state_.load(); }

private:
    static int InterruptHandler(JSRuntime* runtime, void* opaque);

    bool Bind(HostBridge& bridge, ExecutionError& error);
    SandboxResult Fail(ExecutionError error);
    ExecutionError TakeException(ErrorKind kind);

    JSRuntime* runtime_ = nullptr;
    JSContext* context_ = nullptr;
    std::atomic<bool> interrupted_{false};
    std::atomic<State> state_{State::kCreated};
};

}  // namespace hoya::sandbox
