#include "codebox/sandbox/container_lifecycle.hpp"

#include <spdlog/spdlog.h>

namespace codebox::sandbox {

namespace {

Error deadline_exceeded(std::string_view stage) {
    return Error{ErrorCode::DeadlineExceeded, std::string(stage) + ": deadline exceeded"};
}

}  // namespace

ScopedContainer::ScopedContainer(ContainerRuntime& runtime, ContainerId id)
    : runtime_(runtime)
    , id_(std::move(id))
{
}

ScopedContainer::~ScopedContainer() {
    if (!removed_) {
        // Result already logged inside remove()
        auto result = remove();
        (void)result;
    }
}

Result<void, Error> ScopedContainer::remove() {
    if (removed_) {
        return Result<void, Error>::ok();
    }
    removed_ = true;

    auto result = runtime_.remove_container(Deadline::none(), id_);
    if (result.is_err()) {
        spdlog::warn("Failed to remove container {}: {}", id_, result.error().full_message());
        return Result<void, Error>::err(
            wrap_error(std::move(result).error(), "failed to remove container"));
    }
    spdlog::debug("Removed container {}", id_);
    return Result<void, Error>::ok();
}

ContainerLifecycle::ContainerLifecycle(ContainerRuntime& runtime)
    : runtime_(runtime)
{
}

void ContainerLifecycle::transition(LifecycleState next, std::string_view detail) {
    spdlog::debug("Container {} -> {} ({})",
                  lifecycle_state_to_string(state_), lifecycle_state_to_string(next), detail);
    state_ = next;
}

Result<ContainerRun, Error> ContainerLifecycle::run(const SandboxContainerConfig& config,
                                                   Duration timeout) {
    using R = Result<ContainerRun, Error>;

    state_ = LifecycleState::Pending;
    const Deadline deadline = Deadline::after(timeout);

    // Pull
    if (deadline.expired()) {
        return R::err(deadline_exceeded("failed to pull image"));
    }
    auto pulled = runtime_.ensure_image(deadline, config.image);
    if (pulled.is_err()) {
        return R::err(wrap_error(std::move(pulled).error(), "failed to pull image"));
    }
    transition(LifecycleState::ImageReady, config.image);

    // Create
    if (deadline.expired()) {
        return R::err(deadline_exceeded("failed to create container"));
    }
    auto created = runtime_.create_container(deadline, config);
    if (created.is_err()) {
        return R::err(wrap_error(std::move(created).error(), "failed to create container"));
    }

    // From here on the container exists and must be removed on every path
    ScopedContainer container(runtime_, std::move(created).value());
    transition(LifecycleState::Created, container.id());

    // Start
    if (deadline.expired()) {
        return R::err(deadline_exceeded("failed to start container"));
    }
    auto started = runtime_.start_container(deadline, container.id());
    if (started.is_err()) {
        return R::err(wrap_error(std::move(started).error(), "failed to start container"));
    }
    transition(LifecycleState::Started, container.id());

    // Wait
    if (deadline.expired()) {
        return R::err(deadline_exceeded("failed to wait for container"));
    }
    auto waited = runtime_.wait_container(deadline, container.id());
    if (waited.is_err()) {
        return R::err(wrap_error(std::move(waited).error(), "failed to wait for container"));
    }
    const int64_t exit_code = waited.value();
    transition(LifecycleState::Exited, "exit code " + std::to_string(exit_code));

    // The container has stopped, so logs are collected even past the deadline
    auto logs = runtime_.get_logs(Deadline::none(), container.id());
    if (logs.is_err()) {
        return R::err(wrap_error(std::move(logs).error(), "failed to retrieve logs"));
    }

    ContainerRun run{
        .container_id = container.id(),
        .exit_code = exit_code,
        .logs = std::move(logs).value()
    };

    // Removal failure after a successful run is logged, not reported
    auto removed = container.remove();
    (void)removed;
    transition(LifecycleState::Removed, run.container_id);

    return R::ok(std::move(run));
}

}  // namespace codebox::sandbox
