#include "codebox/core/config.hpp"
#include "codebox/core/logging.hpp"
#include "codebox/exec/process.hpp"
#include "codebox/exec/streaming_runner.hpp"
#include "codebox/sandbox/docker_runtime.hpp"
#include "codebox/tools/command_policy.hpp"
#include "codebox/tools/sandbox_tool.hpp"
#include "codebox/tools/shell_tool.hpp"
#include "codebox/tools/tool_executor.hpp"
#include "codebox/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace codebox;
using namespace codebox::core;

namespace {

constexpr const char* kCyan = "\033[1;36m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[1;31m";
constexpr const char* kReset = "\033[0m";

void print_usage(std::ostream& out) {
    out << "Usage: codebox [--config PATH] [--log-level LEVEL] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  sandbox <language> [--timeout N] (--file PATH | CODE)\n"
        << "                      Run code in an isolated container (python, bash, javascript)\n"
        << "  shell COMMAND       Run a host shell command, streaming its output\n"
        << "  tools [QUERY]       Print the registered tool schemas\n"
        << "  ping                Check that the Docker daemon answers\n";
}

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::string command;
    std::vector<std::string> args;
};

std::optional<Options> parse_options(int argc, char* argv[]) {
    Options options;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            break;
        }
    }
    if (i >= argc) {
        return std::nullopt;
    }
    options.command = argv[i++];
    for (; i < argc; ++i) {
        options.args.emplace_back(argv[i]);
    }
    return options;
}

Result<Config, Error> load_config(const Options& options) {
    Config config;
    if (options.config_path) {
        auto loaded = Config::load(*options.config_path);
        if (loaded.is_err()) {
            return loaded;
        }
        config = std::move(loaded).value();
    } else {
        config = Config::load_or_default(Config::default_path());
    }

    config.apply_environment();
    if (options.log_level) {
        config.observability.log_level = *options.log_level;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config, Error>::err(std::move(valid).error());
    }
    return Result<Config, Error>::ok(std::move(config));
}

int exit_code_of(const ToolResult& result) {
    auto it = result.metadata.find("exit_code");
    if (it == result.metadata.end()) {
        return 0;
    }
    try {
        const int code = std::stoi(it->second);
        return code >= 0 && code <= 255 ? code : 1;
    } catch (const std::exception&) {
        return 1;
    }
}

int report_error(const Error& error) {
    std::cerr << kRed << "ERROR:" << kReset << " " << error.full_message() << "\n";
    return 1;
}

// Everything a command needs, wired from the configuration
class Application {
public:
    explicit Application(const Config& config)
        : config_(config)
        , docker_(config.runtime)
        , spawner_(config.shell.shell_path)
        , runner_(spawner_, Duration(config.shell.timeout_ms))
        , registry_(config.tools)
        , executor_(registry_, config.concurrency)
    {
    }

    Result<void, Error> register_tools() {
        auto shell = std::make_shared<tools::ShellTool>(
            tools::CommandPolicy::from_config(config_.security), runner_);
        auto registered = tools::register_shell_tool(registry_, shell);
        if (registered.is_err()) {
            return registered;
        }
        return tools::register_sandbox_tool(registry_, std::make_shared<tools::SandboxTool>(docker_));
    }

    int run_sandbox(const std::vector<std::string>& args) {
        if (args.empty()) {
            print_usage(std::cerr);
            return 2;
        }

        Json arguments{{"language", args[0]}};
        std::optional<std::string> code;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--timeout" && i + 1 < args.size()) {
                try {
                    arguments["timeout"] = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid timeout: " << args[i] << "\n";
                    return 2;
                }
            } else if (args[i] == "--file" && i + 1 < args.size()) {
                std::ifstream file(args[++i]);
                if (!file) {
                    return report_error(Error{ErrorCode::FileNotFound, "cannot open " + args[i]});
                }
                std::stringstream buffer;
                buffer << file.rdbuf();
                code = buffer.str();
            } else {
                code = args[i];
            }
        }
        if (!code) {
            print_usage(std::cerr);
            return 2;
        }
        arguments["code"] = *code;

        auto result = executor_.execute(
            ToolCall{.id = "cli-sandbox", .tool_name = tools::SandboxTool::kName, .arguments = arguments},
            tools::ToolContext{});
        if (result.is_err()) {
            return report_error(result.error());
        }

        const auto& output = result.value();
        std::cout << output.content;
        if (!output.content.empty() && output.content.back() != '\n') {
            std::cout << "\n";
        }
        std::cerr << kCyan << "--- " << output.metadata.at("language") << " on "
                  << output.metadata.at("image") << ", exit code "
                  << output.metadata.at("exit_code") << ", "
                  << output.execution_time.count() << "ms ---" << kReset << "\n";
        return exit_code_of(output);
    }

    int run_shell(const std::vector<std::string>& args) {
        if (args.empty()) {
            print_usage(std::cerr);
            return 2;
        }

        std::string command = args[0];
        for (size_t i = 1; i < args.size(); ++i) {
            command += " " + args[i];
        }

        const auto start = SteadyClock::now();
        int line_count = 0;

        tools::ToolContext ctx;
        ctx.on_output = [&](const exec::OutputLine& line) {
            ++line_count;
            const auto elapsed = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
            const bool is_stdout = line.source == exec::OutputSource::Stdout;
            std::cout << (is_stdout ? kGreen : kYellow)
                      << "[" << elapsed.count() << "ms " << exec::output_source_to_string(line.source) << "]"
                      << kReset << " " << line.text << std::endl;
        };

        auto result = executor_.execute(
            ToolCall{.id = "cli-shell", .tool_name = tools::ShellTool::kName, .arguments = {{"command", command}}},
            ctx);
        std::cout << "\n";
        if (result.is_err()) {
            return report_error(result.error());
        }

        const auto& output = result.value();
        std::cout << kCyan << "--- Summary ---" << kReset << "\n"
                  << "  Lines streamed : " << line_count << "\n"
                  << "  Exit code      : " << output.metadata.at("exit_code") << "\n"
                  << "  Mode           : " << output.metadata.at("mode") << "\n"
                  << "  Wall time      : " << output.execution_time.count() << "ms\n";
        return exit_code_of(output);
    }

    int run_tools(const std::vector<std::string>& args) {
        Json schemas = Json::array();
        if (args.empty()) {
            schemas = registry_.to_claude_format();
        } else {
            std::string query;
            for (const auto& word : args) {
                query += word + " ";
            }
            for (const auto& spec : registry_.search(query)) {
                schemas.push_back(spec.to_claude_format());
            }
        }
        std::cout << schemas.dump(2) << "\n";
        return 0;
    }

    int run_ping() {
        auto version = docker_.ping(Deadline::after(Duration(config_.runtime.connect_timeout_ms)));
        if (version.is_err()) {
            return report_error(version.error());
        }
        std::cout << "Docker daemon at " << config_.runtime.socket_path << " is up";
        if (!version.value().empty()) {
            std::cout << " (API " << version.value() << ")";
        }
        std::cout << "\n";
        return 0;
    }

private:
    const Config& config_;
    sandbox::DockerRuntime docker_;
    exec::PosixProcessSpawner spawner_;
    exec::ProcessStreamingRunner runner_;
    tools::ToolRegistry registry_;
    tools::ToolExecutor executor_;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_options(argc, argv);
    if (!options) {
        print_usage(std::cerr);
        return 2;
    }

    auto config = load_config(*options);
    if (config.is_err()) {
        return report_error(config.error());
    }

    auto logging = init_logging(config.value().observability);
    if (logging.is_err()) {
        return report_error(logging.error());
    }

    Application app(config.value());
    auto registered = app.register_tools();
    if (registered.is_err()) {
        return report_error(registered.error());
    }

    const auto& command = options->command;
    if (command == "sandbox") {
        return app.run_sandbox(options->args);
    }
    if (command == "shell") {
        return app.run_shell(options->args);
    }
    if (command == "tools") {
        return app.run_tools(options->args);
    }
    if (command == "ping") {
        return app.run_ping();
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(std::cerr);
    return 2;
}
