#include "codebox/tools/shell_tool.hpp"

#include <spdlog/spdlog.h>

namespace codebox::tools {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace

std::string format_shell_output(const std::vector<std::string>& stdout_lines,
                                const std::vector<std::string>& stderr_lines) {
    std::string output = join_lines(stdout_lines);
    const std::string errors = join_lines(stderr_lines);

    if (!errors.empty()) {
        if (!output.empty()) {
            output += "\n--- stderr ---\n" + errors;
        } else {
            output = "--- stderr ---\n" + errors;
        }
    }
    return output;
}

ShellTool::ShellTool(CommandPolicy policy, exec::StreamingCommandRunner& runner)
    : policy_(std::move(policy))
    , runner_(runner)
{
}

ToolSpec ShellTool::spec() {
    ParamSpec command{"command", "The shell command to execute", ParamType::String, true};
    command.min_length = 1;

    return ToolSpec{
        .name = kName,
        .description = "Executes shell commands on the host system and returns stdout/stderr output",
        .parameters = {command},
        .keywords = {"shell", "command", "execute", "run", "terminal", "bash"}
    };
}

Result<ToolResult, Error> ShellTool::call(const Json& args) const {
    return run(args, nullptr, false);
}

Result<ToolResult, Error> ShellTool::call_streaming(const Json& args,
                                                    const exec::LineSink& on_line) const {
    return run(args, on_line, true);
}

Result<ToolResult, Error> ShellTool::run(const Json& args, const exec::LineSink& on_line,
                                         bool streaming) const {
    auto validation = ToolRegistry::validate_args(spec(), args);
    if (validation.is_err()) {
        return Result<ToolResult, Error>::err(
            wrap_error(std::move(validation).error(), "input validation failed"));
    }
    const std::string command = args.at("command").get<std::string>();

    // Policy is enforced before anything is spawned
    auto allowed = policy_.validate(command);
    if (allowed.is_err()) {
        spdlog::warn("Rejected shell command '{}': {}", command, allowed.error().full_message());
        return Result<ToolResult, Error>::err(std::move(allowed).error());
    }

    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;

    auto exit_code = runner_.run_streaming(command, [&](const exec::OutputLine& line) {
        if (on_line) {
            on_line(line);
        }
        if (line.source == exec::OutputSource::Stdout) {
            stdout_lines.push_back(line.text);
        } else {
            stderr_lines.push_back(line.text);
        }
    });

    if (exit_code.is_err()) {
        return Result<ToolResult, Error>::err(
            wrap_error(std::move(exit_code).error(), "failed to execute command"));
    }

    ToolResult result{
        .success = true,
        .content = format_shell_output(stdout_lines, stderr_lines),
        .metadata = {
            {"command", command},
            {"exit_code", std::to_string(exit_code.value())}
        }
    };
    if (streaming) {
        result.metadata["mode"] = "streaming";
    }
    return Result<ToolResult, Error>::ok(std::move(result));
}

Result<void, Error> register_shell_tool(ToolRegistry& registry, std::shared_ptr<ShellTool> tool) {
    return registry.register_tool(
        ShellTool::spec(),
        [tool](const Json& args, const ToolContext& ctx) -> Result<ToolResult, Error> {
            if (ctx.on_output) {
                return tool->call_streaming(args, ctx.on_output);
            }
            return tool->call(args);
        },
        "builtin"
    );
}

}  // namespace codebox::tools
