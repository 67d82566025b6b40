#include "codebox/sandbox/languages.hpp"

#include "codebox/core/base64.hpp"

#include <algorithm>
#include <array>

namespace codebox::sandbox {

namespace {

const std::array<LanguageRuntime, 3>& runtime_table() {
    static const std::array<LanguageRuntime, 3> table = {{
        {Language::Python, "python:3-slim", "python3"},
        {Language::Bash, "alpine:latest", "sh"},
        {Language::JavaScript, "node:20-slim", "node"},
    }};
    return table;
}

}  // namespace

std::optional<Language> language_from_string(std::string_view name) {
    for (const auto& entry : runtime_table()) {
        if (language_to_string(entry.language) == name) {
            return entry.language;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& supported_languages() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : runtime_table()) {
            out.emplace_back(language_to_string(entry.language));
        }
        return out;
    }();
    return names;
}

const LanguageRuntime& resolve_runtime(Language language) {
    const auto& table = runtime_table();
    auto it = std::find_if(table.begin(), table.end(),
        [language](const LanguageRuntime& entry) { return entry.language == language; });
    return *it;
}

Result<LanguageRuntime, Error> resolve_runtime(std::string_view name) {
    auto language = language_from_string(name);
    if (!language) {
        return Result<LanguageRuntime, Error>::err(
            ErrorCode::UnsupportedLanguage,
            "unsupported language: " + std::string(name)
        );
    }
    return Result<LanguageRuntime, Error>::ok(resolve_runtime(*language));
}

std::vector<std::string> build_container_command(const LanguageRuntime& runtime,
                                                 std::string_view code) {
    const std::string encoded = base64_encode(code);
    return {
        "sh",
        "-c",
        "echo '" + encoded + "' | base64 -d | " + runtime.interpreter
    };
}

Duration resolve_timeout(std::optional<int> timeout_seconds) {
    int seconds = kDefaultTimeoutSeconds;
    if (timeout_seconds && *timeout_seconds > 0) {
        seconds = std::min(*timeout_seconds, kMaxTimeoutSeconds);
    }
    return std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds));
}

}  // namespace codebox::sandbox
