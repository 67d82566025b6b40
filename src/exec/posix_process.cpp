#include "codebox/exec/process.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codebox::exec {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class PosixProcess : public Process {
public:
    PosixProcess(std::string shell_path, std::string command)
        : shell_path_(std::move(shell_path))
        , command_(std::move(command))
    {
    }

    ~PosixProcess() override {
        close_fd(stdout_write_);
        close_fd(stderr_write_);

        // Never leave a running child or a zombie behind
        if (started_ && !reaped_) {
            kill();
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    Result<std::unique_ptr<InputStream>, Error> stdout_pipe() override {
        return make_pipe(stdout_write_, "stdout");
    }

    Result<std::unique_ptr<InputStream>, Error> stderr_pipe() override {
        return make_pipe(stderr_write_, "stderr");
    }

    Result<void, Error> start() override {
        if (started_) {
            return Result<void, Error>::err(ErrorCode::InvalidState, "process already started", command_);
        }

        // Reports exec failure back to the parent; closes on a successful exec
        int status_pipe[2];
        if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
            return Result<void, Error>::err(
                ErrorCode::ProcessStartFailed,
                std::string("status pipe: ") + std::strerror(errno),
                command_
            );
        }

        int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null < 0) {
            int err = errno;
            ::close(status_pipe[0]);
            ::close(status_pipe[1]);
            return Result<void, Error>::err(
                ErrorCode::ProcessStartFailed,
                std::string("open /dev/null: ") + std::strerror(err),
                command_
            );
        }

        // No allocation between fork and exec
        const char* shell = shell_path_.c_str();
        const char* command = command_.c_str();

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            ::close(status_pipe[0]);
            ::close(status_pipe[1]);
            ::close(dev_null);
            return Result<void, Error>::err(
                ErrorCode::ProcessStartFailed,
                std::string("fork: ") + std::strerror(err),
                command_
            );
        }

        if (pid == 0) {
            // Child process
            ::setpgid(0, 0);
            ::dup2(dev_null, STDIN_FILENO);
            if (stdout_write_ >= 0) {
                ::dup2(stdout_write_, STDOUT_FILENO);
            }
            if (stderr_write_ >= 0) {
                ::dup2(stderr_write_, STDERR_FILENO);
            }

            ::execl(shell, shell, "-c", command, static_cast<char*>(nullptr));

            int exec_errno = errno;
            ssize_t written = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
            (void)written;
            ::_exit(127);
        }

        // Parent process
        pid_ = pid;
        ::setpgid(pid, pid);

        ::close(dev_null);
        ::close(status_pipe[1]);
        // Our copies of the write ends must go, or the readers never see EOF
        close_fd(stdout_write_);
        close_fd(stderr_write_);

        int exec_errno = 0;
        ssize_t n;
        do {
            n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        ::close(status_pipe[0]);

        if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
            reaped_ = true;
            return Result<void, Error>::err(
                ErrorCode::ProcessStartFailed,
                "exec " + shell_path_ + ": " + std::strerror(exec_errno),
                command_
            );
        }

        started_ = true;
        spdlog::debug("Started pid {}: {} -c {}", pid_, shell_path_, command_);
        return Result<void, Error>::ok();
    }

    Result<ExitStatus, Error> wait() override {
        if (!started_ || reaped_) {
            return Result<ExitStatus, Error>::err(
                ErrorCode::InvalidState, "process is not running", command_);
        }

        int status = 0;
        while (true) {
            pid_t waited = ::waitpid(pid_, &status, 0);
            if (waited == pid_) {
                break;
            }
            if (waited < 0 && errno == EINTR) {
                continue;
            }
            return Result<ExitStatus, Error>::err(
                ErrorCode::ProcessWaitFailed,
                std::string("waitpid: ") + std::strerror(errno),
                command_
            );
        }
        reaped_ = true;

        ExitStatus exit_status;
        if (WIFEXITED(status)) {
            exit_status.exited = true;
            exit_status.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status.signal = WTERMSIG(status);
        }
        return Result<ExitStatus, Error>::ok(exit_status);
    }

    void kill() override {
        if (!started_ || reaped_) {
            return;
        }
        if (::kill(-pid_, SIGKILL) != 0) {
            ::kill(pid_, SIGKILL);
        }
    }

private:
    Result<std::unique_ptr<InputStream>, Error> make_pipe(int& write_end, const char* name) {
        if (started_) {
            return Result<std::unique_ptr<InputStream>, Error>::err(
                ErrorCode::InvalidState, "pipes must be requested before start", command_);
        }
        if (write_end >= 0) {
            return Result<std::unique_ptr<InputStream>, Error>::err(
                ErrorCode::InvalidState, std::string(name) + " pipe already requested", command_);
        }

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return Result<std::unique_ptr<InputStream>, Error>::err(
                ErrorCode::PipeFailed,
                std::string("pipe2 for ") + name + ": " + std::strerror(errno),
                command_
            );
        }

        write_end = fds[1];
        return Result<std::unique_ptr<InputStream>, Error>::ok(
            std::make_unique<FdInputStream>(fds[0]));
    }

    std::string shell_path_;
    std::string command_;
    int stdout_write_ = -1;
    int stderr_write_ = -1;
    pid_t pid_ = -1;
    bool started_ = false;
    std::atomic<bool> reaped_{false};
};

}  // namespace

PosixProcessSpawner::PosixProcessSpawner(std::string shell_path)
    : shell_path_(std::move(shell_path))
{
}

std::unique_ptr<Process> PosixProcessSpawner::create(const std::string& command) {
    return std::make_unique<PosixProcess>(shell_path_, command);
}

}  // namespace codebox::exec
