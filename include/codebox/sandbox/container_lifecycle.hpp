#pragma once

#include "container_runtime.hpp"

#include <string_view>

namespace codebox::sandbox {

enum class LifecycleState {
    Pending,
    ImageReady,
    Created,
    Started,
    Exited,
    Removed
};

inline std::string_view lifecycle_state_to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Pending: return "pending";
        case LifecycleState::ImageReady: return "image_ready";
        case LifecycleState::Created: return "created";
        case LifecycleState::Started: return "started";
        case LifecycleState::Exited: return "exited";
        case LifecycleState::Removed: return "removed";
    }
    return "unknown";
}

// Owns a created container and force-removes it exactly once, either through
// remove() or on destruction. Removal ignores any deadline: cleanup must run
// even when the run's deadline has already fired.
class ScopedContainer {
public:
    ScopedContainer(ContainerRuntime& runtime, ContainerId id);
    ~ScopedContainer();

    ScopedContainer(const ScopedContainer&) = delete;
    ScopedContainer& operator=(const ScopedContainer&) = delete;

    const ContainerId& id() const { return id_; }
    bool active() const { return !removed_; }

    // Best-effort removal; a failure is logged and returned
    Result<void, Error> remove();

private:
    ContainerRuntime& runtime_;
    ContainerId id_;
    bool removed_ = false;
};

// Outcome of a completed container run
struct ContainerRun {
    ContainerId container_id;
    int64_t exit_code = 0;
    std::string logs;
};

// Drives one container through pull, create, start, wait, logs and removal
// under a single deadline. A non-zero exit code is a successful run.
class ContainerLifecycle {
public:
    explicit ContainerLifecycle(ContainerRuntime& runtime);

    Result<ContainerRun, Error> run(const SandboxContainerConfig& config, Duration timeout);

    // State reached by the most recent run()
    LifecycleState last_state() const { return state_; }

private:
    void transition(LifecycleState next, std::string_view detail);

    ContainerRuntime& runtime_;
    LifecycleState state_ = LifecycleState::Pending;
};

}  // namespace codebox::sandbox
