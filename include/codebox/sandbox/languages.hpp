#pragma once

#include "container_runtime.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codebox::sandbox {

enum class Language {
    Python,
    Bash,
    JavaScript
};

inline std::string_view language_to_string(Language language) {
    switch (language) {
        case Language::Python: return "python";
        case Language::Bash: return "bash";
        case Language::JavaScript: return "javascript";
    }
    return "unknown";
}

std::optional<Language> language_from_string(std::string_view name);

// Names accepted by language_from_string, in declaration order
const std::vector<std::string>& supported_languages();

// Image the code runs in, and the interpreter that reads it from stdin
struct LanguageRuntime {
    Language language;
    std::string image;
    std::string interpreter;
};

const LanguageRuntime& resolve_runtime(Language language);

Result<LanguageRuntime, Error> resolve_runtime(std::string_view name);

// The code travels base64-encoded, so nothing in it is ever interpreted by
// the container's shell:  sh -c "echo '<b64>' | base64 -d | <interpreter>"
std::vector<std::string> build_container_command(const LanguageRuntime& runtime,
                                                 std::string_view code);

// Unset or non-positive selects the default; anything above the ceiling is
// clamped to it
Duration resolve_timeout(std::optional<int> timeout_seconds);

}  // namespace codebox::sandbox
