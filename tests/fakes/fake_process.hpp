#pragma once

#include "codebox/exec/process.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace codebox::testing {

using namespace codebox::core;
using codebox::exec::ExitStatus;
using codebox::exec::InputStream;
using codebox::exec::MemoryInputStream;

// What the next spawned FakeProcess does
struct FakeProcessScript {
    std::string stdout_data;
    std::string stderr_data;
    std::optional<Error> stdout_pipe_error;
    std::optional<Error> stderr_pipe_error;
    std::optional<Error> start_error;
    std::optional<Error> wait_error;
    ExitStatus exit_status{.exited = true, .exit_code = 0, .signal = 0};
};

// Records what the runner did with the processes it was given
struct FakeProcessLog {
    std::atomic<int> created{0};
    std::atomic<int> started{0};
    std::atomic<int> waited{0};
    std::atomic<int> killed{0};
    std::string last_command;
};

class FakeProcess : public exec::Process {
public:
    FakeProcess(FakeProcessScript script, FakeProcessLog& log)
        : script_(std::move(script))
        , log_(log)
    {
    }

    Result<std::unique_ptr<InputStream>, Error> stdout_pipe() override {
        if (script_.stdout_pipe_error) {
            return Result<std::unique_ptr<InputStream>, Error>::err(*script_.stdout_pipe_error);
        }
        return Result<std::unique_ptr<InputStream>, Error>::ok(
            std::make_unique<MemoryInputStream>(script_.stdout_data));
    }

    Result<std::unique_ptr<InputStream>, Error> stderr_pipe() override {
        if (script_.stderr_pipe_error) {
            return Result<std::unique_ptr<InputStream>, Error>::err(*script_.stderr_pipe_error);
        }
        return Result<std::unique_ptr<InputStream>, Error>::ok(
            std::make_unique<MemoryInputStream>(script_.stderr_data));
    }

    Result<void, Error> start() override {
        if (script_.start_error) {
            return Result<void, Error>::err(*script_.start_error);
        }
        ++log_.started;
        return Result<void, Error>::ok();
    }

    Result<ExitStatus, Error> wait() override {
        ++log_.waited;
        if (script_.wait_error) {
            return Result<ExitStatus, Error>::err(*script_.wait_error);
        }
        return Result<ExitStatus, Error>::ok(script_.exit_status);
    }

    void kill() override {
        ++log_.killed;
    }

private:
    FakeProcessScript script_;
    FakeProcessLog& log_;
};

class FakeProcessSpawner : public exec::ProcessSpawner {
public:
    FakeProcessScript script;
    FakeProcessLog log;

    std::unique_ptr<exec::Process> create(const std::string& command) override {
        ++log.created;
        log.last_command = command;
        return std::make_unique<FakeProcess>(script, log);
    }
};

}  // namespace codebox::testing
