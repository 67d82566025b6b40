#include <catch2/catch_test_macros.hpp>
#include "codebox/core/base64.hpp"
#include "codebox/sandbox/languages.hpp"

using namespace codebox::sandbox;

TEST_CASE("Every supported language resolves to a fixed image and interpreter", "[languages]") {
    REQUIRE(supported_languages() == std::vector<std::string>{"python", "bash", "javascript"});

    for (const auto& name : supported_languages()) {
        auto runtime = resolve_runtime(name);
        REQUIRE(runtime.is_ok());
        REQUIRE_FALSE(runtime.value().image.empty());
        REQUIRE_FALSE(runtime.value().interpreter.empty());
    }

    REQUIRE(resolve_runtime(Language::Python).image == "python:3-slim");
    REQUIRE(resolve_runtime(Language::Python).interpreter == "python3");
    REQUIRE(resolve_runtime(Language::Bash).image == "alpine:latest");
    REQUIRE(resolve_runtime(Language::Bash).interpreter == "sh");
    REQUIRE(resolve_runtime(Language::JavaScript).image == "node:20-slim");
    REQUIRE(resolve_runtime(Language::JavaScript).interpreter == "node");
}

TEST_CASE("Unsupported languages fail to resolve", "[languages]") {
    for (const char* name : {"ruby", "", "Python", "cobol"}) {
        auto runtime = resolve_runtime(std::string_view(name));
        REQUIRE(runtime.is_err());
        REQUIRE(runtime.error().code == ErrorCode::UnsupportedLanguage);
    }
}

TEST_CASE("Container command carries the code base64-encoded", "[languages]") {
    const std::string code = "print('it''s') ; rm -rf / `id` $(id)\nexit 3";
    const auto& python = resolve_runtime(Language::Python);

    auto command = build_container_command(python, code);

    REQUIRE(command.size() == 3);
    REQUIRE(command[0] == "sh");
    REQUIRE(command[1] == "-c");
    REQUIRE(command[2] == "echo '" + base64_encode(code) + "' | base64 -d | python3");
    REQUIRE(command[2].find("rm -rf") == std::string::npos);
    REQUIRE(command[2].find("$(id)") == std::string::npos);

    auto encoded = command[2].substr(6, command[2].find("' |") - 6);
    REQUIRE(base64_decode(encoded).value() == code);
}

TEST_CASE("Timeout defaults and ceiling", "[languages]") {
    using std::chrono::seconds;

    REQUIRE(resolve_timeout(std::nullopt) == seconds(10));
    REQUIRE(resolve_timeout(0) == seconds(10));
    REQUIRE(resolve_timeout(-5) == seconds(10));
    REQUIRE(resolve_timeout(5) == seconds(5));
    REQUIRE(resolve_timeout(30) == seconds(30));
    REQUIRE(resolve_timeout(120) == seconds(30));
}

TEST_CASE("Sandbox container config is always bounded and offline", "[languages]") {
    auto config = SandboxContainerConfig::bounded("alpine:latest", {"sh", "-c", "true"});

    REQUIRE(config.network_disabled);
    REQUIRE(config.memory_limit_bytes == 64 * 1024 * 1024);
    REQUIRE(config.cpu_limit_nano_cpus == 500'000'000);
    REQUIRE(config.pids_limit == 64);
}
