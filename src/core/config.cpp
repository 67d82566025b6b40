#include "codebox/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace codebox::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns; substituted values are not expanded again
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    size_t pos = 0;
    while (std::regex_search(result.cbegin() + static_cast<std::ptrdiff_t>(pos), result.cend(),
                             match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        const size_t start = pos + static_cast<size_t>(match.position(0));
        result.replace(start, static_cast<size_t>(match.length(0)), replacement);
        pos = start + replacement.size();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.codebox/config.yaml")));
}

void Config::apply_environment() {
    // Only unix sockets are supported; tcp:// hosts are left to the config file
    if (const char* host = std::getenv("DOCKER_HOST")) {
        std::string value = host;
        const std::string prefix = "unix://";
        if (value.rfind(prefix, 0) == 0) {
            runtime.socket_path = value.substr(prefix.size());
        }
    }

    runtime.socket_path = expand_path(runtime.socket_path);
    if (!observability.log_file.empty()) {
        observability.log_file = fs::path(expand_path(observability.log_file.string()));
    }
}

Result<void, Error> Config::validate() const {
    if (runtime.socket_path.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "runtime.socket_path must not be empty"
        );
    }

    if (runtime.connect_timeout_ms <= 0 || runtime.request_timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "runtime timeouts must be positive"
        );
    }

    if (shell.timeout_ms < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "shell.timeout_ms must not be negative"
        );
    }

    if (concurrency.thread_pool_size < 1 || concurrency.max_parallel_tools < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "concurrency settings must be at least 1"
        );
    }

    const auto& level = observability.log_level;
    if (level != "debug" && level != "info" && level != "warn" && level != "error") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "observability.log_level must be one of debug, info, warn, error",
            level
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path.string());

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto rt_node = root["runtime"]) {
            config.runtime.socket_path = rt_node["socket_path"].as<std::string>(config.runtime.socket_path);
            config.runtime.api_version = rt_node["api_version"].as<std::string>(config.runtime.api_version);
            config.runtime.connect_timeout_ms = rt_node["connect_timeout_ms"].as<int>(config.runtime.connect_timeout_ms);
            config.runtime.request_timeout_ms = rt_node["request_timeout_ms"].as<int>(config.runtime.request_timeout_ms);
        }

        if (auto shell_node = root["shell"]) {
            config.shell.timeout_ms = shell_node["timeout_ms"].as<int>(config.shell.timeout_ms);
            config.shell.shell_path = shell_node["shell_path"].as<std::string>(config.shell.shell_path);
        }

        if (auto tools_node = root["tools"]) {
            for (const auto& tool : tools_node) {
                std::string name = tool.first.as<std::string>();
                ToolConfig tc;
                if (tool.second.IsMap()) {
                    tc.enabled = tool.second["enabled"].as<bool>(true);
                }
                config.tools.builtin[name] = tc;
            }
        }

        if (auto conc_node = root["concurrency"]) {
            config.concurrency.thread_pool_size = conc_node["thread_pool_size"].as<int>(config.concurrency.thread_pool_size);
            config.concurrency.max_parallel_tools = conc_node["max_parallel_tools"].as<int>(config.concurrency.max_parallel_tools);
        }

        if (auto sec_node = root["security"]) {
            if (auto allowed_node = sec_node["allowed_commands"]) {
                config.security.allowed_commands.clear();
                for (const auto& c : allowed_node) {
                    config.security.allowed_commands.push_back(c.as<std::string>());
                }
            }

            if (auto cmds_node = sec_node["blocked_commands"]) {
                config.security.blocked_commands.clear();
                for (const auto& c : cmds_node) {
                    config.security.blocked_commands.push_back(c.as<std::string>());
                }
            }
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_file = obs_node["log_file"].as<std::string>(config.observability.log_file.string());
        }

        config.apply_environment();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_environment();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    fs::path expanded = expand_path(path.string());

    std::error_code ec;
    if (expanded.has_parent_path()) {
        fs::create_directories(expanded.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to create config directory: " + ec.message(),
                expanded.parent_path().string()
            );
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "runtime" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "socket_path" << YAML::Value << runtime.socket_path;
    out << YAML::Key << "api_version" << YAML::Value << runtime.api_version;
    out << YAML::Key << "connect_timeout_ms" << YAML::Value << runtime.connect_timeout_ms;
    out << YAML::Key << "request_timeout_ms" << YAML::Value << runtime.request_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "shell" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "timeout_ms" << YAML::Value << shell.timeout_ms;
    out << YAML::Key << "shell_path" << YAML::Value << shell.shell_path;
    out << YAML::EndMap;

    out << YAML::Key << "tools" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, tc] : tools.builtin) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << tc.enabled;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "concurrency" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "thread_pool_size" << YAML::Value << concurrency.thread_pool_size;
    out << YAML::Key << "max_parallel_tools" << YAML::Value << concurrency.max_parallel_tools;
    out << YAML::EndMap;

    out << YAML::Key << "security" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "allowed_commands" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : security.allowed_commands) {
        out << c;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "blocked_commands" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : security.blocked_commands) {
        out << c;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
    out << YAML::Key << "log_file" << YAML::Value << observability.log_file.string();
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream file(expanded);
    if (!file) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            "Failed to open config file for writing",
            expanded.string()
        );
    }

    file << out.c_str();
    return Result<void, Error>::ok();
}

}  // namespace codebox::core
