#pragma once

#include "codebox/core/config.hpp"
#include "codebox/core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codebox::tools {

using namespace codebox::core;

// Base name of the first whitespace-separated token: "/usr/bin/ls -la" -> "ls"
std::string binary_name(std::string_view command);

// Decides whether a shell command may run. Blocked substrings are checked
// first. An empty allowlist then allows every command; otherwise the
// command's binary name must match the binary name of an allowlisted entry.
//
// Not synchronized: configure it before sharing it between threads.
class CommandPolicy {
public:
    CommandPolicy() = default;
    CommandPolicy(std::vector<std::string> allowed, std::vector<std::string> blocked);

    static CommandPolicy from_config(const SecurityConfig& config);

    // Adds the binary name of `command` unless already allowed
    void allow(std::string_view command);

    // Removes every entry with the same binary name as `command`
    void disallow(std::string_view command);

    Result<void, Error> validate(std::string_view command) const;

    const std::vector<std::string>& allowed() const { return allowed_; }
    const std::vector<std::string>& blocked() const { return blocked_; }

private:
    std::vector<std::string> allowed_;
    std::vector<std::string> blocked_;
};

}  // namespace codebox::tools
