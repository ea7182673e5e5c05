#pragma once

#include <atomic>
#include <memory>

#include "config/config_schema.hpp"
#include "sandbox/sandbox.hpp"

struct wasm_engine_t;

namespace hoya::sandbox {

// Runs one WebAssembly module against the "env" import namespace.
class ModuleSandbox : public Sandbox {
public:
    enum class State {
        kCreated,
        kInstantiated,
        kExecuting,
        kCompleted,
        kFailed
    };

    explicit ModuleSandbox(const hoya::config::SandboxConfig& config);
    ~ModuleSandbox() override;

    ModuleSandbox(const ModuleSandbox&) = delete;
    ModuleSandbox& operator=(const ModuleSandbox&) = delete;

    CodeKind Kind() const override { return CodeKind::kModule; }
    SandboxResult Execute(const FetchedResource& resource, HostBridge& bridge) override;
    void Interrupt() override;

    State CurrentState() const { return state_.load(); }

private:
    SandboxResult Fail(ExecutionError error);

    const hoya::config::SandboxConfig& config_;
    wasm_engine_t* engine_ = nullptr;
    std::atomic<bool> interrupted_{false};
    std::atomic<State> state_{State::kCreated};
};

}  // namespace hoya::sandbox
