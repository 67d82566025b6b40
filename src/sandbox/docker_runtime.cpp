#include "codebox/sandbox/docker_runtime.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <sys/socket.h>

#include <algorithm>
#include <memory>
#include <sstream>

namespace codebox::sandbox {

namespace {

constexpr size_t kFrameHeaderSize = 8;

// A read timeout this close to the deadline is the deadline firing
constexpr Duration kDeadlineSlack{100};

const httplib::Headers& default_headers() {
    // Docker rejects a Host header naming a filesystem path
    static const httplib::Headers headers = {
        {"Host", "docker"}
    };
    return headers;
}

std::unique_ptr<httplib::Client> make_client(const RuntimeConfig& config, const Deadline& deadline) {
    auto client = std::make_unique<httplib::Client>(config.socket_path);
    client->set_address_family(AF_UNIX);

    const Duration request_bound = deadline.remaining_or(Duration(config.request_timeout_ms));
    const Duration connect_bound = std::min(Duration(config.connect_timeout_ms), request_bound);
    client->set_connection_timeout(connect_bound);
    client->set_read_timeout(request_bound);
    client->set_write_timeout(request_bound);
    return client;
}

// Docker reports failures as {"message": "..."}
std::string daemon_message(const httplib::Result& res) {
    try {
        auto body = Json::parse(res->body);
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    } catch (const Json::exception&) {
        // Not JSON; fall through to the raw body
    }
    std::string text = res->body;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text.empty() ? "HTTP " + std::to_string(res->status) : text;
}

// Failure of the HTTP exchange itself (no response)
Error transport_error(const httplib::Result& res, const Deadline& deadline, ErrorCode code,
                      const std::string& what) {
    const bool timed_out = deadline.expired() ||
        (res.error() == httplib::Error::Read && deadline.bounded() &&
         deadline.remaining() <= kDeadlineSlack);
    if (timed_out) {
        return Error{ErrorCode::DeadlineExceeded, what + ": deadline exceeded"};
    }
    if (res.error() == httplib::Error::Connection) {
        return Error{ErrorCode::RuntimeUnavailable,
                     what + ": cannot connect to the Docker daemon: " + httplib::to_string(res.error())};
    }
    return Error{code, what + ": " + httplib::to_string(res.error())};
}

Error status_error(const httplib::Result& res, ErrorCode code, const std::string& what) {
    return Error{code,
                 what + ": " + daemon_message(res),
                 "HTTP " + std::to_string(res->status)};
}

Error deadline_error(const std::string& what) {
    return Error{ErrorCode::DeadlineExceeded, what + ": deadline exceeded"};
}

uint32_t get_be32(std::string_view data, size_t offset) {
    return (static_cast<uint32_t>(static_cast<unsigned char>(data[offset])) << 24) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 2])) << 8) |
           static_cast<uint32_t>(static_cast<unsigned char>(data[offset + 3]));
}

}  // namespace

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Json build_create_body(const SandboxContainerConfig& config) {
    return Json{
        {"Image", config.image},
        {"Cmd", config.command},
        {"NetworkDisabled", config.network_disabled},
        {"HostConfig", {
            {"Memory", config.memory_limit_bytes},
            {"MemorySwap", config.memory_limit_bytes},
            {"NanoCpus", config.cpu_limit_nano_cpus},
            {"PidsLimit", config.pids_limit},
            {"NetworkMode", "none"},
            {"ReadonlyRootfs", true},
            {"Tmpfs", {{"/tmp", "size=16m,noexec,nosuid"}}},
            {"SecurityOpt", Json::array({"no-new-privileges"})},
            {"CapDrop", Json::array({"ALL"})},
            {"Privileged", false},
            {"AutoRemove", false}
        }}
    };
}

std::pair<std::string, std::string> split_image_reference(const std::string& reference) {
    if (reference.find('@') != std::string::npos) {
        return {reference, ""};
    }
    const size_t slash = reference.rfind('/');
    const size_t colon = reference.rfind(':');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {reference, "latest"};
    }
    return {reference.substr(0, colon), reference.substr(colon + 1)};
}

std::string demultiplex_logs(std::string_view raw) {
    std::string combined;
    size_t offset = 0;

    while (offset < raw.size()) {
        if (raw.size() - offset < kFrameHeaderSize) {
            return std::string(raw);
        }
        const auto stream_type = static_cast<unsigned char>(raw[offset]);
        if (stream_type > 2 || raw[offset + 1] != 0 || raw[offset + 2] != 0 || raw[offset + 3] != 0) {
            return std::string(raw);
        }
        const uint32_t size = get_be32(raw, offset + 4);
        offset += kFrameHeaderSize;
        if (raw.size() - offset < size) {
            return std::string(raw);
        }
        combined.append(raw.substr(offset, size));
        offset += size;
    }

    return combined;
}

std::optional<std::string> find_stream_error(std::string_view stream) {
    std::istringstream lines{std::string(stream)};
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            auto event = Json::parse(line);
            if (event.is_object() && event.contains("error")) {
                const auto& error = event["error"];
                return error.is_string() ? error.get<std::string>() : error.dump();
            }
        } catch (const Json::exception&) {
            spdlog::debug("Ignoring non-JSON progress line: {}", line);
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DockerRuntime
// ---------------------------------------------------------------------------

DockerRuntime::DockerRuntime(RuntimeConfig config)
    : config_(std::move(config))
{
}

std::string DockerRuntime::endpoint(std::string_view path) const {
    if (config_.api_version.empty()) {
        return std::string(path);
    }
    std::string prefix = config_.api_version;
    if (prefix.front() != '/') {
        prefix.insert(prefix.begin(), '/');
    }
    return prefix + std::string(path);
}

Result<void, Error> DockerRuntime::ensure_image(const Deadline& deadline, const std::string& image) {
    const std::string what = "image " + image;
    if (deadline.expired()) {
        return Result<void, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto inspect = client->Get(endpoint("/images/" + image + "/json"), default_headers());
    if (!inspect) {
        return Result<void, Error>::err(transport_error(inspect, deadline, ErrorCode::ImagePullFailed, what));
    }
    if (inspect->status == 200) {
        spdlog::debug("Image {} present locally", image);
        return Result<void, Error>::ok();
    }
    if (inspect->status != 404) {
        return Result<void, Error>::err(status_error(inspect, ErrorCode::ImagePullFailed, what));
    }

    if (deadline.expired()) {
        return Result<void, Error>::err(deadline_error(what));
    }

    auto [name, tag] = split_image_reference(image);
    httplib::Params params{{"fromImage", name}};
    if (!tag.empty()) {
        params.emplace("tag", tag);
    }

    spdlog::info("Pulling image {}", image);
    auto pull_client = make_client(config_, deadline);
    auto pulled = pull_client->Post(
        httplib::append_query_params(endpoint("/images/create"), params),
        default_headers(), "", "application/json");
    if (!pulled) {
        return Result<void, Error>::err(transport_error(pulled, deadline, ErrorCode::ImagePullFailed, what));
    }
    if (pulled->status != 200) {
        return Result<void, Error>::err(status_error(pulled, ErrorCode::ImagePullFailed, what));
    }

    // The daemon answers 200 and reports pull failures inside the stream
    if (auto stream_error = find_stream_error(pulled->body)) {
        return Result<void, Error>::err(ErrorCode::ImagePullFailed, what + ": " + *stream_error);
    }

    spdlog::info("Pulled image {}", image);
    return Result<void, Error>::ok();
}

Result<ContainerId, Error> DockerRuntime::create_container(const Deadline& deadline,
                                                           const SandboxContainerConfig& config) {
    const std::string what = "create from " + config.image;
    if (deadline.expired()) {
        return Result<ContainerId, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Post(endpoint("/containers/create"), default_headers(),
                            build_create_body(config).dump(), "application/json");
    if (!res) {
        return Result<ContainerId, Error>::err(
            transport_error(res, deadline, ErrorCode::ContainerCreateFailed, what));
    }
    if (res->status != 201) {
        return Result<ContainerId, Error>::err(status_error(res, ErrorCode::ContainerCreateFailed, what));
    }

    try {
        auto body = Json::parse(res->body);
        ContainerId id = body.at("Id").get<std::string>();
        if (body.contains("Warnings") && body["Warnings"].is_array()) {
            for (const auto& warning : body["Warnings"]) {
                spdlog::warn("Docker: {}", warning.dump());
            }
        }
        return Result<ContainerId, Error>::ok(std::move(id));
    } catch (const Json::exception& e) {
        return Result<ContainerId, Error>::err(
            ErrorCode::ContainerCreateFailed,
            what + ": invalid response: " + e.what()
        );
    }
}

Result<void, Error> DockerRuntime::start_container(const Deadline& deadline, const ContainerId& id) {
    const std::string what = "start " + id;
    if (deadline.expired()) {
        return Result<void, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Post(endpoint("/containers/" + id + "/start"), default_headers(),
                            "", "application/json");
    if (!res) {
        return Result<void, Error>::err(transport_error(res, deadline, ErrorCode::ContainerStartFailed, what));
    }
    // 304: already started
    if (res->status != 204 && res->status != 304) {
        return Result<void, Error>::err(status_error(res, ErrorCode::ContainerStartFailed, what));
    }
    return Result<void, Error>::ok();
}

Result<int64_t, Error> DockerRuntime::wait_container(const Deadline& deadline, const ContainerId& id) {
    const std::string what = "wait " + id;
    if (deadline.expired()) {
        return Result<int64_t, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Post(endpoint("/containers/" + id + "/wait?condition=not-running"),
                            default_headers(), "", "application/json");
    if (!res) {
        return Result<int64_t, Error>::err(transport_error(res, deadline, ErrorCode::ContainerWaitFailed, what));
    }
    if (res->status != 200) {
        return Result<int64_t, Error>::err(status_error(res, ErrorCode::ContainerWaitFailed, what));
    }

    try {
        auto body = Json::parse(res->body);
        if (body.contains("Error") && body["Error"].is_object()) {
            std::string message = body["Error"].value("Message", "");
            if (!message.empty()) {
                return Result<int64_t, Error>::err(ErrorCode::ContainerWaitFailed, what + ": " + message);
            }
        }
        return Result<int64_t, Error>::ok(body.at("StatusCode").get<int64_t>());
    } catch (const Json::exception& e) {
        return Result<int64_t, Error>::err(
            ErrorCode::ContainerWaitFailed,
            what + ": invalid response: " + e.what()
        );
    }
}

Result<std::string, Error> DockerRuntime::get_logs(const Deadline& deadline, const ContainerId& id) {
    const std::string what = "logs " + id;
    if (deadline.expired()) {
        return Result<std::string, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Get(endpoint("/containers/" + id + "/logs?stdout=1&stderr=1"), default_headers());
    if (!res) {
        return Result<std::string, Error>::err(transport_error(res, deadline, ErrorCode::ContainerLogsFailed, what));
    }
    if (res->status != 200) {
        return Result<std::string, Error>::err(status_error(res, ErrorCode::ContainerLogsFailed, what));
    }
    return Result<std::string, Error>::ok(demultiplex_logs(res->body));
}

Result<void, Error> DockerRuntime::remove_container(const Deadline& deadline, const ContainerId& id) {
    const std::string what = "remove " + id;
    if (deadline.expired()) {
        return Result<void, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Delete(endpoint("/containers/" + id + "?force=1&v=1"), default_headers());
    if (!res) {
        return Result<void, Error>::err(transport_error(res, deadline, ErrorCode::ContainerRemoveFailed, what));
    }
    if (res->status != 204) {
        return Result<void, Error>::err(status_error(res, ErrorCode::ContainerRemoveFailed, what));
    }
    return Result<void, Error>::ok();
}

Result<std::string, Error> DockerRuntime::ping(const Deadline& deadline) {
    const std::string what = "ping " + config_.socket_path;
    if (deadline.expired()) {
        return Result<std::string, Error>::err(deadline_error(what));
    }

    auto client = make_client(config_, deadline);
    auto res = client->Get(endpoint("/_ping"), default_headers());
    if (!res) {
        return Result<std::string, Error>::err(transport_error(res, deadline, ErrorCode::RuntimeUnavailable, what));
    }
    if (res->status != 200) {
        return Result<std::string, Error>::err(status_error(res, ErrorCode::RuntimeUnavailable, what));
    }
    return Result<std::string, Error>::ok(res->get_header_value("Api-Version"));
}

}  // namespace codebox::sandbox
