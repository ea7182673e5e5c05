#pragma once

#include "sandbox/execution_types.hpp"
#include "sandbox/host_bridge.hpp"

namespace hoya::sandbox {

// One execution engine behind the uniform contract. An instance runs exactly
// one guest and is then discarded.
class Sandbox {
public:
    virtual ~Sandbox() = default;
    virtual CodeKind Kind() const = 0;

    // Never throws for guest faults; every fault comes back as result.error.
    virtual SandboxResult Execute(const FetchedResource& resource, HostBridge& bridge) = 0;

    // Safe to call from any thread while Execute runs. The guest stops at its
    // next safe point and Execute reports ErrorKind::kTimeout.
    virtual void Interrupt() = 0;
};

}  // namespace hoya::sandbox
