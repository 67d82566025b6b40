#pragma once

#include "codebox/sandbox/container_runtime.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace codebox::testing {

using namespace codebox::core;
using codebox::sandbox::SandboxContainerConfig;

// Scripted ContainerRuntime that records every call. A configured error
// makes the matching step fail; wait_delay makes wait block, honouring the
// deadline it is given the way the real adapter does.
class FakeContainerRuntime : public sandbox::ContainerRuntime {
public:
    std::optional<Error> ensure_image_error;
    std::optional<Error> create_error;
    std::optional<Error> start_error;
    std::optional<Error> wait_error;
    std::optional<Error> logs_error;
    std::optional<Error> remove_error;

    int64_t exit_code = 0;
    std::string logs;
    Duration wait_delay{0};

    Result<void, Error> ensure_image(const Deadline& deadline, const std::string& image) override {
        record("ensure_image", deadline);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pulled_images_.push_back(image);
        }
        if (ensure_image_error) {
            return Result<void, Error>::err(*ensure_image_error);
        }
        return Result<void, Error>::ok();
    }

    Result<ContainerId, Error> create_container(const Deadline& deadline,
                                                const SandboxContainerConfig& config) override {
        record("create_container", deadline);
        if (create_error) {
            return Result<ContainerId, Error>::err(*create_error);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        created_configs_.push_back(config);
        ContainerId id = "container-" + std::to_string(created_configs_.size());
        created_ids_.push_back(id);
        return Result<ContainerId, Error>::ok(id);
    }

    Result<void, Error> start_container(const Deadline& deadline, const ContainerId&) override {
        record("start_container", deadline);
        if (start_error) {
            return Result<void, Error>::err(*start_error);
        }
        return Result<void, Error>::ok();
    }

    Result<int64_t, Error> wait_container(const Deadline& deadline, const ContainerId&) override {
        record("wait_container", deadline);
        if (wait_delay > Duration::zero()) {
            std::this_thread::sleep_for(std::min(wait_delay, deadline.remaining()));
            if (deadline.expired()) {
                return Result<int64_t, Error>::err(ErrorCode::DeadlineExceeded, "context deadline exceeded");
            }
        }
        if (wait_error) {
            return Result<int64_t, Error>::err(*wait_error);
        }
        return Result<int64_t, Error>::ok(exit_code);
    }

    Result<std::string, Error> get_logs(const Deadline& deadline, const ContainerId&) override {
        record("get_logs", deadline);
        if (logs_error) {
            return Result<std::string, Error>::err(*logs_error);
        }
        return Result<std::string, Error>::ok(logs);
    }

    Result<void, Error> remove_container(const Deadline& deadline, const ContainerId& id) override {
        record("remove_container", deadline);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed_ids_.push_back(id);
        }
        if (remove_error) {
            return Result<void, Error>::err(*remove_error);
        }
        return Result<void, Error>::ok();
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t call_count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(calls_.begin(), calls_.end(), name));
    }

    // Whether the named call (first occurrence) was given a bounded deadline
    std::optional<bool> bounded(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < calls_.size(); ++i) {
            if (calls_[i] == name) {
                return bounded_[i];
            }
        }
        return std::nullopt;
    }

    std::vector<SandboxContainerConfig> created_configs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_configs_;
    }

    std::vector<ContainerId> created_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_ids_;
    }

    std::vector<ContainerId> removed_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_ids_;
    }

    std::vector<std::string> pulled_images() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pulled_images_;
    }

private:
    void record(const std::string& name, const Deadline& deadline) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(name);
        bounded_.push_back(deadline.bounded());
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<bool> bounded_;
    std::vector<SandboxContainerConfig> created_configs_;
    std::vector<ContainerId> created_ids_;
    std::vector<ContainerId> removed_ids_;
    std::vector<std::string> pulled_images_;
};

}  // namespace codebox::testing
