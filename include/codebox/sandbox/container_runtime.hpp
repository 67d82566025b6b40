#pragma once

#include "codebox/core/deadline.hpp"
#include "codebox/core/result.hpp"
#include "codebox/core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace codebox::sandbox {

using namespace codebox::core;

// Resource ceilings applied to every sandbox container. These are not
// request parameters.
inline constexpr int64_t kDefaultMemoryLimitBytes = 64LL * 1024 * 1024;  // 64 MiB
inline constexpr int64_t kDefaultCpuLimitNanoCpus = 500'000'000;         // 0.5 CPU
inline constexpr int64_t kDefaultPidsLimit = 64;
inline constexpr int kDefaultTimeoutSeconds = 10;
inline constexpr int kMaxTimeoutSeconds = 30;

// What to run and under which limits
struct SandboxContainerConfig {
    std::string image;
    std::vector<std::string> command;
    int64_t memory_limit_bytes = kDefaultMemoryLimitBytes;
    int64_t cpu_limit_nano_cpus = kDefaultCpuLimitNanoCpus;
    int64_t pids_limit = kDefaultPidsLimit;
    bool network_disabled = true;

    // Limits with the default ceilings and no network
    static SandboxContainerConfig bounded(std::string image, std::vector<std::string> command) {
        SandboxContainerConfig config;
        config.image = std::move(image);
        config.command = std::move(command);
        return config;
    }
};

// Container engine operations used by the sandbox. Every call honours the
// deadline it is given; Deadline::none() means "no bound".
//
// Implementations are shared between concurrent sandbox runs and must not
// keep per-container state.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Pull the image unless it is already present locally
    virtual Result<void, Error> ensure_image(const Deadline& deadline, const std::string& image) = 0;

    virtual Result<ContainerId, Error> create_container(const Deadline& deadline,
                                                        const SandboxContainerConfig& config) = 0;

    virtual Result<void, Error> start_container(const Deadline& deadline, const ContainerId& id) = 0;

    // Blocks until the container stops and returns its exit code
    virtual Result<int64_t, Error> wait_container(const Deadline& deadline, const ContainerId& id) = 0;

    // Combined stdout and stderr
    virtual Result<std::string, Error> get_logs(const Deadline& deadline, const ContainerId& id) = 0;

    // Force-removes the container and its anonymous volumes
    virtual Result<void, Error> remove_container(const Deadline& deadline, const ContainerId& id) = 0;
};

}  // namespace codebox::sandbox
