#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace codebox::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using SteadyClock = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;

using ToolId = std::string;
using ContainerId = std::string;
using Metadata = std::map<std::string, std::string>;

// Tool call structure
struct ToolCall {
    std::string id;
    ToolId tool_name;
    Json arguments;

    Json to_json() const {
        return Json{
            {"id", id},
            {"name", tool_name},
            {"arguments", arguments}
        };
    }

    static ToolCall from_json(const Json& j) {
        return ToolCall{
            .id = j.value("id", ""),
            .tool_name = j.value("name", ""),
            .arguments = j.value("arguments", Json::object())
        };
    }
};

// Tool result structure. `content` is the tool-facing output text and
// `metadata` the string map describing how it was produced.
struct ToolResult {
    std::string tool_call_id;
    bool success = false;
    std::string content;
    std::optional<std::string> error_message;
    Metadata metadata;
    Duration execution_time{0};

    Json to_json() const {
        Json j{
            {"tool_call_id", tool_call_id},
            {"success", success},
            {"output", content},
            {"metadata", metadata},
            {"execution_time_ms", execution_time.count()}
        };
        if (error_message) {
            j["error"] = *error_message;
        }
        return j;
    }
};

}  // namespace codebox::core
