#include "codebox/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace codebox::tools {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool sort_by_name(const ToolSpec& a, const ToolSpec& b) {
    return a.name < b.name;
}

}  // namespace

ToolRegistry::ToolRegistry(const ToolsConfig& config)
    : config_(config)
{
}

Result<void, Error> ToolRegistry::register_tool(const ToolSpec& spec, ToolHandler handler,
                                                const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (tools_.count(spec.name)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Tool already registered",
            spec.name
        );
    }

    RegisteredTool tool;
    tool.spec = spec;
    tool.handler = std::move(handler);
    tool.source = source;

    // Check if tool is enabled in config
    auto it = config_.builtin.find(spec.name);
    if (it != config_.builtin.end()) {
        tool.enabled = it->second.enabled;
    } else {
        tool.enabled = true;
    }

    spdlog::debug("Registered tool '{}' ({}{})", spec.name, source, tool.enabled ? "" : ", disabled");
    tools_[spec.name] = std::move(tool);
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::unregister_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!tools_.count(id)) {
        return Result<void, Error>::err(
            ErrorCode::ToolNotFound,
            "Tool not found",
            id
        );
    }

    tools_.erase(id);
    return Result<void, Error>::ok();
}

bool ToolRegistry::has_tool(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(id) > 0;
}

std::optional<ToolSpec> ToolRegistry::get_spec(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return std::nullopt;
    }

    return it->second.spec;
}

std::vector<ToolSpec> ToolRegistry::get_all_specs() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ToolSpec> specs;
    specs.reserve(tools_.size());

    for (const auto& [id, tool] : tools_) {
        specs.push_back(tool.spec);
    }

    std::sort(specs.begin(), specs.end(), sort_by_name);
    return specs;
}

std::vector<ToolSpec> ToolRegistry::get_enabled_specs() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ToolSpec> specs;

    for (const auto& [id, tool] : tools_) {
        if (tool.enabled) {
            specs.push_back(tool.spec);
        }
    }

    std::sort(specs.begin(), specs.end(), sort_by_name);
    return specs;
}

Json ToolRegistry::to_claude_format() const {
    Json tools = Json::array();

    for (const auto& spec : get_enabled_specs()) {
        tools.push_back(spec.to_claude_format());
    }

    return tools;
}

Result<void, Error> ToolRegistry::enable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = true;
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::disable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = false;
    return Result<void, Error>::ok();
}

bool ToolRegistry::is_enabled(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    return it != tools_.end() && it->second.enabled;
}

Result<void, Error> ToolRegistry::validate_args(const ToolSpec& spec, const Json& args) {
    if (!args.is_object()) {
        return Result<void, Error>::err(
            ErrorCode::ToolValidationFailed,
            "Arguments must be a JSON object",
            spec.name
        );
    }

    // Check required parameters
    for (const auto& param : spec.parameters) {
        if (param.required && !args.contains(param.name)) {
            return Result<void, Error>::err(
                ErrorCode::ToolValidationFailed,
                "Missing required parameter: " + param.name,
                spec.name
            );
        }
    }

    // Validate parameter types
    for (const auto& param : spec.parameters) {
        if (!args.contains(param.name)) continue;

        const auto& value = args[param.name];
        bool valid = true;

        switch (param.type) {
            case ParamType::String:
                valid = value.is_string();
                break;
            case ParamType::Integer:
                valid = value.is_number_integer();
                break;
            case ParamType::Number:
                valid = value.is_number();
                break;
            case ParamType::Boolean:
                valid = value.is_boolean();
                break;
            case ParamType::Array:
                valid = value.is_array();
                break;
            case ParamType::Object:
                valid = value.is_object();
                break;
        }

        if (!valid) {
            return Result<void, Error>::err(
                ErrorCode::ToolValidationFailed,
                "Invalid type for parameter: " + param.name,
                spec.name
            );
        }

        // Check enum values
        if (param.enum_values && value.is_string()) {
            const auto& enum_vals = *param.enum_values;
            const auto& str_value = value.get<std::string>();
            if (std::find(enum_vals.begin(), enum_vals.end(), str_value) == enum_vals.end()) {
                return Result<void, Error>::err(
                    ErrorCode::ToolValidationFailed,
                    "Invalid enum value for parameter: " + param.name,
                    spec.name
                );
            }
        }

        if (param.min_length && value.is_string() &&
            value.get_ref<const std::string&>().size() < *param.min_length) {
            return Result<void, Error>::err(
                ErrorCode::ToolValidationFailed,
                "Parameter too short: " + param.name,
                spec.name
            );
        }

        if (value.is_number()) {
            const double number = value.get<double>();
            if ((param.minimum && number < static_cast<double>(*param.minimum)) ||
                (param.maximum && number > static_cast<double>(*param.maximum))) {
                return Result<void, Error>::err(
                    ErrorCode::ToolValidationFailed,
                    "Parameter out of range: " + param.name,
                    spec.name
                );
            }
        }
    }

    return Result<void, Error>::ok();
}

Result<ToolResult, Error> ToolRegistry::execute(const ToolId& id, const Json& args,
                                                const ToolContext& ctx) {
    RegisteredTool tool;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = tools_.find(id);
        if (it == tools_.end()) {
            return Result<ToolResult, Error>::err(
                ErrorCode::ToolNotFound,
                "Tool not found",
                id
            );
        }

        if (!it->second.enabled) {
            return Result<ToolResult, Error>::err(
                ErrorCode::ToolDisabled,
                "Tool is disabled",
                id
            );
        }

        tool = it->second;
    }

    // Validate arguments
    auto validation = validate_args(tool.spec, args);
    if (validation.is_err()) {
        return Result<ToolResult, Error>::err(std::move(validation).error());
    }

    // Execute the tool
    try {
        auto start = std::chrono::steady_clock::now();
        auto result = tool.handler(args, ctx);
        auto end = std::chrono::steady_clock::now();

        if (result.is_ok()) {
            result.value().execution_time = std::chrono::duration_cast<Duration>(end - start);
        }
        return result;

    } catch (const std::exception& e) {
        spdlog::error("Tool '{}' threw: {}", id, e.what());
        return Result<ToolResult, Error>::err(
            ErrorCode::ToolExecutionFailed,
            e.what(),
            id
        );
    }
}

std::vector<ToolSpec> ToolRegistry::search(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Tokenize query
    std::vector<std::string> query_words;
    std::istringstream iss(query);
    std::string word;
    while (iss >> word) {
        query_words.push_back(to_lower(word));
    }

    std::vector<std::pair<int, ToolSpec>> scored;

    for (const auto& [id, tool] : tools_) {
        if (!tool.enabled) continue;

        int score = 0;

        // Check name
        const std::string name_lower = to_lower(tool.spec.name);
        for (const auto& qw : query_words) {
            if (name_lower.find(qw) != std::string::npos) {
                score += 10;
            }
        }

        // Check keywords
        for (const auto& keyword : tool.spec.keywords) {
            const std::string kw_lower = to_lower(keyword);
            for (const auto& qw : query_words) {
                if (kw_lower.find(qw) != std::string::npos) {
                    score += 5;
                }
            }
        }

        // Check description
        const std::string desc_lower = to_lower(tool.spec.description);
        for (const auto& qw : query_words) {
            if (desc_lower.find(qw) != std::string::npos) {
                score += 2;
            }
        }

        if (score > 0) {
            scored.emplace_back(score, tool.spec);
        }
    }

    // Sort by score descending, then by name
    std::sort(scored.begin(), scored.end(),
        [](const auto& a, const auto& b) {
            return a.first != b.first ? a.first > b.first : a.second.name < b.second.name;
        });

    std::vector<ToolSpec> results;
    for (const auto& [_, spec] : scored) {
        results.push_back(spec);
    }

    return results;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

}  // namespace codebox::tools
