#pragma once

#include "tool_registry.hpp"

#include "codebox/sandbox/container_runtime.hpp"
#include "codebox/sandbox/languages.hpp"

#include <memory>
#include <optional>
#include <string>

namespace codebox::tools {

// Validated request to run code in the sandbox
struct SandboxRequest {
    sandbox::Language language = sandbox::Language::Python;
    std::string code;
    std::optional<int> timeout_seconds;

    // Rejects an unknown language, empty code, and a timeout that is not
    // an integer between 1 and the ceiling
    static Result<SandboxRequest, Error> from_json(const Json& args);
};

// Runs untrusted code to completion in a fresh, resource-bounded container
// with no network. The container is always removed. A program that exits
// non-zero is a successful run; its exit code is in the metadata.
//
// Concurrent calls are safe: each one owns its container.
class SandboxTool {
public:
    static constexpr const char* kName = "docker_sandbox";

    explicit SandboxTool(sandbox::ContainerRuntime& runtime);

    static ToolSpec spec();

    Result<ToolResult, Error> call(const Json& args) const;

    Result<ToolResult, Error> run(const SandboxRequest& request) const;

private:
    sandbox::ContainerRuntime& runtime_;
};

Result<void, Error> register_sandbox_tool(ToolRegistry& registry, std::shared_ptr<SandboxTool> tool);

}  // namespace codebox::tools
