#pragma once

#include "container_runtime.hpp"
#include "codebox/core/config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace codebox::sandbox {

// ContainerRuntime backed by the Docker Engine REST API, spoken over the
// daemon's unix socket. Each call opens its own connection, so one instance
// can serve concurrent sandbox runs.
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(RuntimeConfig config);

    Result<void, Error> ensure_image(const Deadline& deadline, const std::string& image) override;

    Result<ContainerId, Error> create_container(const Deadline& deadline,
                                                const SandboxContainerConfig& config) override;

    Result<void, Error> start_container(const Deadline& deadline, const ContainerId& id) override;

    Result<int64_t, Error> wait_container(const Deadline& deadline, const ContainerId& id) override;

    Result<std::string, Error> get_logs(const Deadline& deadline, const ContainerId& id) override;

    Result<void, Error> remove_container(const Deadline& deadline, const ContainerId& id) override;

    // Checks that the daemon answers; returns its API version
    Result<std::string, Error> ping(const Deadline& deadline);

    const RuntimeConfig& config() const { return config_; }

private:
    std::string endpoint(std::string_view path) const;

    RuntimeConfig config_;
};

// Body of POST /containers/create for a sandbox container
Json build_create_body(const SandboxContainerConfig& config);

// Splits "name:tag" into (name, tag); the tag defaults to "latest". A
// registry port ("host:5000/name") is not mistaken for a tag, and a digest
// reference is returned whole with an empty tag.
std::pair<std::string, std::string> split_image_reference(const std::string& reference);

// Collapses Docker's multiplexed log stream (8-byte frame header: stream
// type, three zero bytes, big-endian payload size) into combined text in
// arrival order. Input that is not a valid frame stream is returned as is.
std::string demultiplex_logs(std::string_view raw);

// First "error" reported in a newline-delimited JSON progress stream
std::optional<std::string> find_stream_error(std::string_view stream);

}  // namespace codebox::sandbox
