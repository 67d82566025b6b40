#include "codebox/exec/streaming_runner.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace codebox::exec {

namespace {

// Kills the process if it is still running when the timeout elapses
class Watchdog {
public:
    Watchdog(Process& process, Duration timeout) {
        if (timeout <= Duration::zero()) {
            return;
        }
        thread_ = std::thread([this, &process, timeout] {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, timeout, [this] { return stopped_; })) {
                fired_ = true;
                process.kill();
            }
        });
    }

    ~Watchdog() { stop(); }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool fired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fired_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    bool fired_ = false;
    std::thread thread_;
};

}  // namespace

ProcessStreamingRunner::ProcessStreamingRunner(ProcessSpawner& spawner, Duration timeout)
    : spawner_(spawner)
    , timeout_(timeout)
{
}

Result<int, Error> ProcessStreamingRunner::run_streaming(const std::string& command,
                                                         const LineSink& on_line) {
    auto process = spawner_.create(command);
    if (!process) {
        return Result<int, Error>::err(
            ErrorCode::ProcessStartFailed, "failed to start command: no process", command);
    }

    // Pipes first, so a pipe failure never leaves a started child behind
    auto stdout_stream = process->stdout_pipe();
    if (stdout_stream.is_err()) {
        return Result<int, Error>::err(
            wrap_error(std::move(stdout_stream).error(), "failed to create stdout pipe"));
    }
    auto stderr_stream = process->stderr_pipe();
    if (stderr_stream.is_err()) {
        return Result<int, Error>::err(
            wrap_error(std::move(stderr_stream).error(), "failed to create stderr pipe"));
    }

    auto started = process->start();
    if (started.is_err()) {
        return Result<int, Error>::err(
            wrap_error(std::move(started).error(), "failed to start command"));
    }

    Watchdog watchdog(*process, timeout_);

    // Both readers must reach EOF before wait(), or buffered output is lost
    LineMultiplexer multiplexer;
    multiplexer.run(*stdout_stream.value(), *stderr_stream.value(), on_line);

    // A child can close its pipes and keep running, so the watchdog stays
    // armed until the child is reaped
    auto status = process->wait();
    watchdog.stop();

    if (watchdog.fired()) {
        return Result<int, Error>::err(
            ErrorCode::ToolTimeout,
            "command timed out after " + std::to_string(timeout_.count()) + "ms",
            command
        );
    }

    if (status.is_err()) {
        return Result<int, Error>::err(
            wrap_error(std::move(status).error(), "failed waiting for command"));
    }

    const ExitStatus& exit_status = status.value();
    if (!exit_status.exited) {
        return Result<int, Error>::err(
            ErrorCode::ProcessWaitFailed,
            "failed waiting for command: terminated by signal " + std::to_string(exit_status.signal),
            command
        );
    }

    spdlog::debug("Command exited with code {}: {}", exit_status.exit_code, command);
    return Result<int, Error>::ok(exit_status.exit_code);
}

}  // namespace codebox::exec
