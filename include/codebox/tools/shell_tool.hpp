#pragma once

#include "command_policy.hpp"
#include "tool_registry.hpp"

#include "codebox/exec/streaming_runner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace codebox::tools {

// Stdout lines joined by newlines, followed by a "--- stderr ---" section
// when anything was written to stderr
std::string format_shell_output(const std::vector<std::string>& stdout_lines,
                                const std::vector<std::string>& stderr_lines);

// Runs host shell commands that pass the command policy. A command that
// exits non-zero still produces a result; its exit code is in the metadata.
class ShellTool {
public:
    static constexpr const char* kName = "shell";

    ShellTool(CommandPolicy policy, exec::StreamingCommandRunner& runner);

    static ToolSpec spec();

    // Runs the command and returns its collected output
    Result<ToolResult, Error> call(const Json& args) const;

    // Same, also delivering each line to `on_line` as it is produced
    Result<ToolResult, Error> call_streaming(const Json& args, const exec::LineSink& on_line) const;

    CommandPolicy& policy() { return policy_; }
    const CommandPolicy& policy() const { return policy_; }

private:
    Result<ToolResult, Error> run(const Json& args, const exec::LineSink& on_line, bool streaming) const;

    CommandPolicy policy_;
    exec::StreamingCommandRunner& runner_;
};

// Registers `tool` under ShellTool::kName; streams when the context asks for output
Result<void, Error> register_shell_tool(ToolRegistry& registry, std::shared_ptr<ShellTool> tool);

}  // namespace codebox::tools
