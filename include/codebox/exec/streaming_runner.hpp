#pragma once

#include "line_multiplexer.hpp"
#include "process.hpp"

#include "codebox/core/types.hpp"

#include <string>

namespace codebox::exec {

// Runs a shell command and delivers its output line by line as it is
// produced. The returned value is the process exit code; an error means the
// command could not be run (pipe, start or wait failure, or timeout), never
// that it ran and exited non-zero.
class StreamingCommandRunner {
public:
    virtual ~StreamingCommandRunner() = default;
    virtual Result<int, Error> run_streaming(const std::string& command, const LineSink& on_line) = 0;
};

class ProcessStreamingRunner : public StreamingCommandRunner {
public:
    // A zero timeout leaves the command unbounded
    explicit ProcessStreamingRunner(ProcessSpawner& spawner, Duration timeout = Duration::zero());

    Result<int, Error> run_streaming(const std::string& command, const LineSink& on_line) override;

private:
    ProcessSpawner& spawner_;
    Duration timeout_;
};

}  // namespace codebox::exec
