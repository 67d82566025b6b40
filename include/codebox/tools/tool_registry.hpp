#pragma once

#include "codebox/core/config.hpp"
#include "codebox/core/result.hpp"
#include "tool_spec.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::tools {

using namespace codebox::core;

// Tool registration entry
struct RegisteredTool {
    ToolSpec spec;
    ToolHandler handler;
    bool enabled = true;
    std::string source;  // "builtin", "plugin"
};

// Tool registry - manages all available tools
class ToolRegistry {
public:
    ToolRegistry() = default;
    explicit ToolRegistry(const ToolsConfig& config);

    // Register a tool
    Result<void, Error> register_tool(const ToolSpec& spec, ToolHandler handler,
                                      const std::string& source = "builtin");

    // Unregister a tool
    Result<void, Error> unregister_tool(const ToolId& id);

    // Check if tool exists
    bool has_tool(const ToolId& id) const;

    // Get tool spec
    std::optional<ToolSpec> get_spec(const ToolId& id) const;

    // Get all tool specs, sorted by name
    std::vector<ToolSpec> get_all_specs() const;

    // Get enabled tool specs only
    std::vector<ToolSpec> get_enabled_specs() const;

    // Enabled tools in function-calling format
    Json to_claude_format() const;

    // Enable/disable tools
    Result<void, Error> enable_tool(const ToolId& id);
    Result<void, Error> disable_tool(const ToolId& id);
    bool is_enabled(const ToolId& id) const;

    // Validate, then run a tool
    Result<ToolResult, Error> execute(const ToolId& id, const Json& args,
                                      const ToolContext& ctx);

    // Search for tools by keywords
    std::vector<ToolSpec> search(const std::string& query) const;

    // Get tool count
    size_t size() const;

    // Validate tool arguments against spec
    static Result<void, Error> validate_args(const ToolSpec& spec, const Json& args);

private:
    mutable std::mutex mutex_;
    std::unordered_map<ToolId, RegisteredTool> tools_;
    ToolsConfig config_;
};

}  // namespace codebox::tools
