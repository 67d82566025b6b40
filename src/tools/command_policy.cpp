#include "codebox/tools/command_policy.hpp"

#include <algorithm>

namespace codebox::tools {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view text) {
    const size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string base_name(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    const size_t slash = path.rfind('/');
    if (slash == std::string_view::npos || path.size() == 1) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

}  // namespace

std::string binary_name(std::string_view command) {
    command = trim(command);
    const size_t end = command.find_first_of(" \t");
    return base_name(command.substr(0, end));
}

CommandPolicy::CommandPolicy(std::vector<std::string> allowed, std::vector<std::string> blocked)
    : allowed_(std::move(allowed))
    , blocked_(std::move(blocked))
{
}

CommandPolicy CommandPolicy::from_config(const SecurityConfig& config) {
    return CommandPolicy(config.allowed_commands, config.blocked_commands);
}

void CommandPolicy::allow(std::string_view command) {
    const std::string bin = binary_name(command);
    if (bin.empty()) {
        return;
    }
    auto same_binary = [&bin](const std::string& entry) { return base_name(entry) == bin; };
    if (std::none_of(allowed_.begin(), allowed_.end(), same_binary)) {
        allowed_.push_back(bin);
    }
}

void CommandPolicy::disallow(std::string_view command) {
    const std::string bin = binary_name(command);
    allowed_.erase(
        std::remove_if(allowed_.begin(), allowed_.end(),
            [&bin](const std::string& entry) { return base_name(entry) == bin; }),
        allowed_.end());
}

Result<void, Error> CommandPolicy::validate(std::string_view command) const {
    for (const auto& pattern : blocked_) {
        if (!pattern.empty() && command.find(pattern) != std::string_view::npos) {
            return Result<void, Error>::err(
                ErrorCode::CommandNotAllowed,
                "command is blocked for safety reasons",
                pattern
            );
        }
    }

    if (allowed_.empty()) {
        return Result<void, Error>::ok();
    }

    const std::string bin = binary_name(command);
    if (!bin.empty()) {
        for (const auto& entry : allowed_) {
            if (base_name(entry) == bin) {
                return Result<void, Error>::ok();
            }
        }
    }

    return Result<void, Error>::err(
        ErrorCode::CommandNotAllowed,
        "command not allowed by policy",
        bin
    );
}

}  // namespace codebox::tools
