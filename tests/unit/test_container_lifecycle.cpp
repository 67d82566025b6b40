#include <catch2/catch_test_macros.hpp>
#include "codebox/sandbox/container_lifecycle.hpp"
#include "fakes/fake_container_runtime.hpp"

using namespace codebox::sandbox;
using codebox::testing::FakeContainerRuntime;

namespace {

SandboxContainerConfig python_config() {
    return SandboxContainerConfig::bounded("python:3-slim", {"sh", "-c", "echo 'cHJpbnQoMSsxKQ==' | base64 -d | python3"});
}

}  // namespace

TEST_CASE("Successful run walks every state and removes the container", "[lifecycle]") {
    FakeContainerRuntime runtime;
    runtime.logs = "2\n";
    ContainerLifecycle lifecycle(runtime);

    auto run = lifecycle.run(python_config(), std::chrono::seconds(5));

    REQUIRE(run.is_ok());
    REQUIRE(run.value().exit_code == 0);
    REQUIRE(run.value().logs == "2\n");
    REQUIRE(run.value().container_id == "container-1");
    REQUIRE(lifecycle.last_state() == LifecycleState::Removed);
    REQUIRE(runtime.calls() == std::vector<std::string>{
        "ensure_image", "create_container", "start_container",
        "wait_container", "get_logs", "remove_container"});
    REQUIRE(runtime.removed_ids() == std::vector<std::string>{"container-1"});
}

TEST_CASE("Non-zero exit code is a successful run", "[lifecycle]") {
    FakeContainerRuntime runtime;
    runtime.exit_code = 1;
    runtime.logs = "ValueError: intentional error\n";
    ContainerLifecycle lifecycle(runtime);

    auto run = lifecycle.run(python_config(), std::chrono::seconds(5));

    REQUIRE(run.is_ok());
    REQUIRE(run.value().exit_code == 1);
    REQUIRE(runtime.call_count("remove_container") == 1);
}

TEST_CASE("Remove is called exactly once iff create succeeded", "[lifecycle]") {
    FakeContainerRuntime runtime;
    bool created = true;
    ErrorCode expected = ErrorCode::Ok;
    std::string stage;

    SECTION("image pull fails") {
        runtime.ensure_image_error = Error{ErrorCode::ImagePullFailed, "manifest unknown"};
        created = false;
        expected = ErrorCode::ImagePullFailed;
        stage = "failed to pull image: ";
    }
    SECTION("create fails") {
        runtime.create_error = Error{ErrorCode::ContainerCreateFailed, "no space left on device"};
        created = false;
        expected = ErrorCode::ContainerCreateFailed;
        stage = "failed to create container: ";
    }
    SECTION("start fails") {
        runtime.start_error = Error{ErrorCode::ContainerStartFailed, "OCI runtime error"};
        expected = ErrorCode::ContainerStartFailed;
        stage = "failed to start container: ";
    }
    SECTION("wait fails") {
        runtime.wait_error = Error{ErrorCode::ContainerWaitFailed, "connection reset"};
        expected = ErrorCode::ContainerWaitFailed;
        stage = "failed to wait for container: ";
    }
    SECTION("wait times out") {
        runtime.wait_delay = std::chrono::seconds(5);
        expected = ErrorCode::DeadlineExceeded;
        stage = "failed to wait for container: ";
    }
    SECTION("logs fail") {
        runtime.logs_error = Error{ErrorCode::ContainerLogsFailed, "no such container"};
        expected = ErrorCode::ContainerLogsFailed;
        stage = "failed to retrieve logs: ";
    }
    SECTION("wait succeeds") {
        runtime.logs = "ok\n";
    }

    ContainerLifecycle lifecycle(runtime);
    auto run = lifecycle.run(python_config(), Duration(100));

    if (expected == ErrorCode::Ok) {
        REQUIRE(run.is_ok());
    } else {
        REQUIRE(run.is_err());
        REQUIRE(run.error().code == expected);
        REQUIRE(run.error().message.rfind(stage, 0) == 0);
    }

    if (created) {
        REQUIRE(runtime.call_count("remove_container") == 1);
        REQUIRE(runtime.removed_ids() == runtime.created_ids());
    } else {
        REQUIRE(runtime.call_count("remove_container") == 0);
        REQUIRE(runtime.created_ids().empty());
    }
}

TEST_CASE("Wait past the deadline still removes the container", "[lifecycle]") {
    FakeContainerRuntime runtime;
    runtime.wait_delay = std::chrono::seconds(10);
    ContainerLifecycle lifecycle(runtime);

    const auto start = SteadyClock::now();
    auto run = lifecycle.run(python_config(), Duration(50));

    REQUIRE(SteadyClock::now() - start < std::chrono::seconds(5));
    REQUIRE(run.is_err());
    REQUIRE(run.error().code == ErrorCode::DeadlineExceeded);
    REQUIRE(runtime.removed_ids() == std::vector<std::string>{"container-1"});
    REQUIRE(runtime.call_count("get_logs") == 0);
}

TEST_CASE("Deadline bounds execution but not cleanup or logs", "[lifecycle]") {
    FakeContainerRuntime runtime;
    ContainerLifecycle lifecycle(runtime);

    auto run = lifecycle.run(python_config(), std::chrono::seconds(5));

    REQUIRE(run.is_ok());
    REQUIRE(runtime.bounded("ensure_image") == true);
    REQUIRE(runtime.bounded("create_container") == true);
    REQUIRE(runtime.bounded("start_container") == true);
    REQUIRE(runtime.bounded("wait_container") == true);
    REQUIRE(runtime.bounded("get_logs") == false);
    REQUIRE(runtime.bounded("remove_container") == false);
}

TEST_CASE("Removal failure does not mask the run result", "[lifecycle]") {
    FakeContainerRuntime runtime;
    runtime.logs = "hello\n";
    runtime.remove_error = Error{ErrorCode::ContainerRemoveFailed, "removal already in progress"};

    SECTION("after a successful run") {
        ContainerLifecycle lifecycle(runtime);
        auto run = lifecycle.run(python_config(), std::chrono::seconds(5));

        REQUIRE(run.is_ok());
        REQUIRE(run.value().logs == "hello\n");
    }

    SECTION("after a failed start") {
        runtime.start_error = Error{ErrorCode::ContainerStartFailed, "OCI runtime error"};
        ContainerLifecycle lifecycle(runtime);
        auto run = lifecycle.run(python_config(), std::chrono::seconds(5));

        REQUIRE(run.is_err());
        REQUIRE(run.error().code == ErrorCode::ContainerStartFailed);
    }

    REQUIRE(runtime.call_count("remove_container") == 1);
}

TEST_CASE("Expired deadline skips the remaining bounded steps", "[lifecycle]") {
    FakeContainerRuntime runtime;
    ContainerLifecycle lifecycle(runtime);

    auto run = lifecycle.run(python_config(), Duration::zero());

    REQUIRE(run.is_err());
    REQUIRE(run.error().code == ErrorCode::DeadlineExceeded);
    REQUIRE(runtime.calls().empty());
}

TEST_CASE("Scoped container removes exactly once", "[lifecycle]") {
    FakeContainerRuntime runtime;

    {
        ScopedContainer container(runtime, "abc123");
        REQUIRE(container.active());
        REQUIRE(container.remove().is_ok());
        REQUIRE_FALSE(container.active());
        REQUIRE(container.remove().is_ok());
    }
    REQUIRE(runtime.removed_ids() == std::vector<std::string>{"abc123"});

    {
        ScopedContainer container(runtime, "def456");
    }
    REQUIRE(runtime.removed_ids() == std::vector<std::string>{"abc123", "def456"});
}
