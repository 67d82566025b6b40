#pragma once

#include "input_stream.hpp"

#include <memory>
#include <string>

namespace codebox::exec {

// How a child process ended
struct ExitStatus {
    bool exited = false;  // Normal termination; exit_code is valid
    int exit_code = 0;
    int signal = 0;       // Terminating signal when !exited
};

// A spawnable child process. Pipes must be requested before start().
class Process {
public:
    virtual ~Process() = default;

    virtual Result<std::unique_ptr<InputStream>, Error> stdout_pipe() = 0;
    virtual Result<std::unique_ptr<InputStream>, Error> stderr_pipe() = 0;

    virtual Result<void, Error> start() = 0;

    // Blocks until the process exits and reaps it
    virtual Result<ExitStatus, Error> wait() = 0;

    // Forcefully terminates the process and its descendants. May be called
    // from another thread while output is being read.
    virtual void kill() = 0;
};

// Creates processes that run `command` through a shell
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;
    virtual std::unique_ptr<Process> create(const std::string& command) = 0;
};

// fork/exec of `<shell> -c <command>`. The child gets stdin from /dev/null
// and runs in its own process group so kill() reaches its descendants.
class PosixProcessSpawner : public ProcessSpawner {
public:
    explicit PosixProcessSpawner(std::string shell_path = "/bin/sh");

    std::unique_ptr<Process> create(const std::string& command) override;

private:
    std::string shell_path_;
};

}  // namespace codebox::exec
