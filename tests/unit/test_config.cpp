#include <catch2/catch_test_macros.hpp>
#include "codebox/core/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace codebox::core;

namespace {

fs::path write_temp_config(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path;
}

}  // namespace

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.runtime.socket_path == "/var/run/docker.sock");
    REQUIRE(config.runtime.api_version.empty());
    REQUIRE(config.shell.timeout_ms == 0);
    REQUIRE(config.shell.shell_path == "/bin/sh");
    REQUIRE(config.security.allowed_commands.empty());
    REQUIRE_FALSE(config.security.blocked_commands.empty());
    REQUIRE(config.observability.log_level == "info");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config tool settings", "[config]") {
    ToolsConfig tools;

    REQUIRE(tools.builtin.count("shell") == 1);
    REQUIRE(tools.builtin.count("docker_sandbox") == 1);
    REQUIRE(tools.builtin["docker_sandbox"].enabled);
}

TEST_CASE("Config concurrency settings", "[config]") {
    ConcurrencyConfig concurrency;

    REQUIRE(concurrency.thread_pool_size > 0);
    REQUIRE(concurrency.max_parallel_tools > 0);
}

TEST_CASE("Config loads YAML sections", "[config]") {
    auto path = write_temp_config("codebox_test_config.yaml", R"(
runtime:
  api_version: v1.43
  request_timeout_ms: 1500
shell:
  timeout_ms: 2000
security:
  allowed_commands: [ls, /usr/bin/git]
  blocked_commands: []
concurrency:
  max_parallel_tools: 2
observability:
  log_level: debug
tools:
  shell:
    enabled: false
)");

    auto result = Config::load(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.runtime.api_version == "v1.43");
    REQUIRE(config.runtime.request_timeout_ms == 1500);
    REQUIRE(config.runtime.connect_timeout_ms == 5000);
    REQUIRE(config.shell.timeout_ms == 2000);
    REQUIRE(config.security.allowed_commands == std::vector<std::string>{"ls", "/usr/bin/git"});
    REQUIRE(config.security.blocked_commands.empty());
    REQUIRE(config.concurrency.max_parallel_tools == 2);
    REQUIRE(config.observability.log_level == "debug");
    REQUIRE_FALSE(config.tools.builtin.at("shell").enabled);

    fs::remove(path);
}

TEST_CASE("Config save and load keep values", "[config]") {
    fs::path path = fs::temp_directory_path() / "codebox_test_saved.yaml";

    Config config;
    config.shell.timeout_ms = 750;
    config.security.allowed_commands = {"echo"};
    REQUIRE(config.save(path).is_ok());

    auto loaded = Config::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().shell.timeout_ms == 750);
    REQUIRE(loaded.value().security.allowed_commands == std::vector<std::string>{"echo"});

    fs::remove(path);
}

TEST_CASE("Saved tool settings hold only the enabled flag", "[config]") {
    fs::path path = fs::temp_directory_path() / "codebox_test_tools.yaml";

    Config config;
    config.tools.builtin["shell"].enabled = false;
    REQUIRE(config.save(path).is_ok());

    std::ifstream file(path);
    std::stringstream text;
    text << file.rdbuf();
    REQUIRE(text.str().find("require_confirm") == std::string::npos);

    auto loaded = Config::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded.value().tools.builtin.at("shell").enabled);
    REQUIRE(loaded.value().tools.builtin.at("docker_sandbox").enabled);

    fs::remove(path);
}

TEST_CASE("Config load errors", "[config]") {
    SECTION("missing file") {
        auto result = Config::load("/nonexistent/codebox.yaml");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigNotFound);
    }

    SECTION("malformed YAML") {
        auto path = write_temp_config("codebox_test_bad.yaml", "runtime: [unclosed\n");
        auto result = Config::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigParseFailed);
        fs::remove(path);
    }

    SECTION("invalid values") {
        auto path = write_temp_config("codebox_test_invalid.yaml", "shell:\n  timeout_ms: -1\n");
        auto result = Config::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
        fs::remove(path);
    }
}

TEST_CASE("Config validation rejects unknown log level", "[config]") {
    Config config;
    config.observability.log_level = "verbose";

    auto result = config.validate();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
}

TEST_CASE("expand_path expands home and variables", "[config]") {
    ::setenv("CODEBOX_TEST_DIR", "/opt/codebox", 1);

    REQUIRE(expand_path("${CODEBOX_TEST_DIR}/run.sock") == "/opt/codebox/run.sock");
    REQUIRE(expand_path("/plain/path") == "/plain/path");

    if (const char* home = std::getenv("HOME")) {
        REQUIRE(expand_path("~/x") == std::string(home) + "/x");
    }
}

TEST_CASE("expand_path does not expand substituted values", "[config]") {
    ::setenv("CODEBOX_TEST_SELF", "${CODEBOX_TEST_SELF}", 1);
    ::setenv("CODEBOX_TEST_DIR", "/opt/codebox", 1);
    ::unsetenv("CODEBOX_TEST_UNSET");

    REQUIRE(expand_path("${CODEBOX_TEST_SELF}/x") == "${CODEBOX_TEST_SELF}/x");
    REQUIRE(expand_path("${CODEBOX_TEST_SELF}:${CODEBOX_TEST_DIR}") == "${CODEBOX_TEST_SELF}:/opt/codebox");
    REQUIRE(expand_path("a${CODEBOX_TEST_UNSET}b${CODEBOX_TEST_DIR}") == "ab/opt/codebox");
}
