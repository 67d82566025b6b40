#include "codebox/tools/sandbox_tool.hpp"

#include "codebox/sandbox/container_lifecycle.hpp"

#include <spdlog/spdlog.h>

namespace codebox::tools {

using sandbox::ContainerLifecycle;
using sandbox::SandboxContainerConfig;

Result<SandboxRequest, Error> SandboxRequest::from_json(const Json& args) {
    using R = Result<SandboxRequest, Error>;

    if (!args.is_object()) {
        return R::err(ErrorCode::ToolValidationFailed, "arguments must be a JSON object");
    }

    if (!args.contains("language") || !args["language"].is_string()) {
        return R::err(ErrorCode::ToolValidationFailed, "language must be a string");
    }
    const auto& name = args["language"].get_ref<const std::string&>();
    auto language = sandbox::language_from_string(name);
    if (!language) {
        return R::err(ErrorCode::UnsupportedLanguage, "unsupported language: " + name);
    }

    if (!args.contains("code") || !args["code"].is_string()) {
        return R::err(ErrorCode::ToolValidationFailed, "code must be a string");
    }
    SandboxRequest request;
    request.language = *language;
    request.code = args["code"].get<std::string>();
    if (request.code.empty()) {
        return R::err(ErrorCode::ToolValidationFailed, "code must not be empty");
    }

    if (args.contains("timeout") && !args["timeout"].is_null()) {
        const auto& timeout = args["timeout"];
        if (!timeout.is_number_integer()) {
            return R::err(ErrorCode::ToolValidationFailed, "timeout must be an integer");
        }
        const auto seconds = timeout.get<int64_t>();
        if (seconds < 1 || seconds > sandbox::kMaxTimeoutSeconds) {
            return R::err(
                ErrorCode::ToolValidationFailed,
                "timeout must be between 1 and " + std::to_string(sandbox::kMaxTimeoutSeconds) + " seconds"
            );
        }
        request.timeout_seconds = static_cast<int>(seconds);
    }

    return R::ok(std::move(request));
}

SandboxTool::SandboxTool(sandbox::ContainerRuntime& runtime)
    : runtime_(runtime)
{
}

ToolSpec SandboxTool::spec() {
    ParamSpec language{"language", "Programming language of the code", ParamType::String, true};
    language.enum_values = sandbox::supported_languages();

    ParamSpec code{"code", "Source code to execute", ParamType::String, true};
    code.min_length = 1;

    ParamSpec timeout{"timeout", "Execution timeout in seconds (default 10)", ParamType::Integer, false};
    timeout.minimum = 1;
    timeout.maximum = sandbox::kMaxTimeoutSeconds;

    return ToolSpec{
        .name = kName,
        .description = "Executes code in a secure, isolated Docker sandbox container with no network access",
        .parameters = {language, code, timeout},
        .keywords = {"sandbox", "docker", "code", "python", "javascript", "bash", "execute", "run"}
    };
}

Result<ToolResult, Error> SandboxTool::call(const Json& args) const {
    auto request = SandboxRequest::from_json(args);
    if (request.is_err()) {
        return Result<ToolResult, Error>::err(
            wrap_error(std::move(request).error(), "input validation failed"));
    }
    return run(request.value());
}

Result<ToolResult, Error> SandboxTool::run(const SandboxRequest& request) const {
    const auto& runtime = sandbox::resolve_runtime(request.language);
    const Duration timeout = sandbox::resolve_timeout(request.timeout_seconds);

    auto config = SandboxContainerConfig::bounded(
        runtime.image,
        sandbox::build_container_command(runtime, request.code));

    spdlog::info("Running {} code in {} (timeout {}ms)",
                 sandbox::language_to_string(request.language), runtime.image, timeout.count());

    ContainerLifecycle lifecycle(runtime_);
    auto completed = lifecycle.run(config, timeout);
    if (completed.is_err()) {
        spdlog::error("Sandbox run failed: {}", completed.error().full_message());
        return Result<ToolResult, Error>::err(std::move(completed).error());
    }

    const auto& outcome = completed.value();
    return Result<ToolResult, Error>::ok(ToolResult{
        .success = true,
        .content = outcome.logs,
        .metadata = {
            {"language", std::string(sandbox::language_to_string(request.language))},
            {"image", runtime.image},
            {"exit_code", std::to_string(outcome.exit_code)}
        }
    });
}

Result<void, Error> register_sandbox_tool(ToolRegistry& registry, std::shared_ptr<SandboxTool> tool) {
    return registry.register_tool(
        SandboxTool::spec(),
        [tool](const Json& args, const ToolContext&) {
            return tool->call(args);
        },
        "builtin"
    );
}

}  // namespace codebox::tools
