#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace codebox::exec {

// Which process stream a line came from
enum class OutputSource {
    Stdout,
    Stderr
};

inline std::string_view output_source_to_string(OutputSource source) {
    switch (source) {
        case OutputSource::Stdout: return "stdout";
        case OutputSource::Stderr: return "stderr";
    }
    return "unknown";
}

// One line of process output, without its trailing newline
struct OutputLine {
    OutputSource source = OutputSource::Stdout;
    std::string text;
};

// Receives lines in per-stream order. Calls are never concurrent.
using LineSink = std::function<void(const OutputLine&)>;

}  // namespace codebox::exec
