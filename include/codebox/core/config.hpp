#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codebox::core {

namespace fs = std::filesystem;

// Docker Engine API connection
struct RuntimeConfig {
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version;  // e.g. "v1.43"; empty uses the daemon's default
    int connect_timeout_ms = 5000;
    int request_timeout_ms = 60000;  // Bound for calls made without a deadline
};

// Host shell execution
struct ShellConfig {
    int timeout_ms = 0;  // 0 leaves the bound to the caller
    std::string shell_path = "/bin/sh";
};

// Tool configuration
struct ToolConfig {
    bool enabled = true;
};

struct ToolsConfig {
    std::map<std::string, ToolConfig> builtin;

    ToolsConfig() {
        builtin["shell"] = {true};
        builtin["docker_sandbox"] = {true};
    }
};

// Concurrency configuration
struct ConcurrencyConfig {
    int thread_pool_size = 4;
    int max_parallel_tools = 4;
};

// Security configuration
struct SecurityConfig {
    std::vector<std::string> allowed_commands;  // Empty allows every binary
    std::vector<std::string> blocked_commands;

    SecurityConfig() {
        blocked_commands = {"rm -rf /", "mkfs", "> /dev/sd", "dd if=/dev/zero", ":(){:|:&};:"};
    }
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // debug, info, warn, error
    fs::path log_file;               // Empty logs to stderr only
};

// Main configuration
struct Config {
    RuntimeConfig runtime;
    ShellConfig shell;
    ToolsConfig tools;
    ConcurrencyConfig concurrency;
    SecurityConfig security;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Apply DOCKER_HOST and expand ~ / ${VAR} in paths
    void apply_environment();

    // Validate configuration
    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace codebox::core
