/**
 * \file worker/runner/CommandRunner.cpp
 * \brief fork/exec of `/bin/sh -c` with pipe capture, deadline and output cap.
 */
#include "CommandRunner.hpp"
#include "processUtils.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace SysTask::Worker {

namespace {

using Clock = std::chrono::steady_clock;

enum class Violation { None, Timeout, OutputLimit };

/// Read everything currently available; returns false once the pipe reached EOF.
bool drain(int& fd, std::string& sink) {
    if (fd < 0) return false;
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        // EOF or unrecoverable read error
        ProcessUtils::close_fd(fd);
        return false;
    }
}

} // namespace

std::string trim_output(std::string text) {
    const char* ws = " \t\r\n\f\v";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

struct CommandRunner::Execution {
    std::string command;
    Tasks::CommandOptions options;
    pid_t pid{-1};
    int out_fd{-1};
    int err_fd{-1};
    std::string out;
    std::string err;
    Clock::time_point deadline;
    Violation violation{Violation::None};
    bool reaped{false};
    ExitStatus status{};

    ~Execution() {
        ProcessUtils::close_fd(out_fd);
        ProcessUtils::close_fd(err_fd);
        if (pid > 0 && !reaped) {
            ::kill(-pid, SIGKILL);
            int raw = 0;
            while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {
            }
        }
    }

    /// One non-blocking step; true once the command is finished.
    bool poll() {
        bool out_open = drain(out_fd, out);
        bool err_open = drain(err_fd, err);

        if (violation == Violation::None) {
            if (out.size() + err.size() > options.max_output_bytes) {
                violation = Violation::OutputLimit;
                ::kill(-pid, SIGKILL);
            } else if (Clock::now() >= deadline) {
                violation = Violation::Timeout;
                ::kill(-pid, SIGKILL);
            }
        }

        if (!reaped) {
            int raw = 0;
            pid_t r = ::waitpid(pid, &raw, WNOHANG);
            if (r == pid) {
                reaped = true;
                status = ProcessUtils::decode_wait_status(raw);
            } else if (r < 0 && errno != EINTR) {
                // Lost the child (e.g. reaped elsewhere); treat as killed
                reaped = true;
                status.signaled = true;
                status.signal = SIGKILL;
            }
        }
        // Descendants that escaped the group may keep the pipes open; once the
        // group was killed, do not wait for them.
        return reaped && ((!out_open && !err_open) || violation != Violation::None);
    }
};

CommandRunner::CommandRunner(std::shared_ptr<runtime::CoroIoContext> context,
                             std::shared_ptr<Logger> logger,
                             Tasks::CommandOptions defaults)
    : context_(std::move(context)), logger_(std::move(logger)), defaults_(defaults) {
    if (!context_) throw std::invalid_argument("CommandRunner: context cannot be null");
}

runtime::CoTask<std::string> CommandRunner::run(std::string command_line, Tasks::CommandOptions options) {
    auto exec = std::make_shared<Execution>();
    exec->command = std::move(command_line);
    exec->options = options;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw Tasks::CommandError("Command failed: " + exec->command + ": pipe: " + std::strerror(errno), -1);
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ProcessUtils::close_fd(out_pipe[0]);
        ProcessUtils::close_fd(out_pipe[1]);
        throw Tasks::CommandError("Command failed: " + exec->command + ": pipe: " + std::strerror(saved), -1);
    }

    const char* command_cstr = exec->command.c_str();
    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) ProcessUtils::close_fd(*fd);
        throw Tasks::CommandError("Command failed: " + exec->command + ": fork: " + std::strerror(saved), -1);
    }
    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", command_cstr, static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Parent. Set the group here too so a kill cannot race the child's setpgid.
    ::setpgid(pid, pid);
    exec->pid = pid;
    ProcessUtils::close_fd(out_pipe[1]);
    ProcessUtils::close_fd(err_pipe[1]);
    exec->out_fd = out_pipe[0];
    exec->err_fd = err_pipe[0];
    std::error_code ec;
    ProcessUtils::set_nonblocking(exec->out_fd, ec);
    ProcessUtils::set_nonblocking(exec->err_fd, ec);
    if (ec && logger_) logger_->warning("CommandRunner: cannot make pipes non-blocking: " + ec.message());
    exec->deadline = Clock::now() + options.timeout;

    running_.fetch_add(1);
    if (logger_) logger_->debug("CommandRunner: [" + std::to_string(pid) + "] " + exec->command);

    struct ProcessAwaitable {
        std::shared_ptr<runtime::CoroIoContext> context;
        std::shared_ptr<Execution> exec;
        bool await_ready() { return exec->poll(); }
        void await_suspend(std::coroutine_handle<> handle) {
            context->register_pending(runtime::CoroIoContext::PendingOpCategory::Process,
                                      [e = exec]() { return e->poll(); }, handle);
        }
        void await_resume() const noexcept {}
    };
    {
        auto guard = context_->make_work_guard();
        co_await ProcessAwaitable{context_, exec};
    }
    running_.fetch_sub(1);

    const auto& status = exec->status;
    if (logger_) {
        logger_->debug("CommandRunner: [" + std::to_string(pid) + "] " + status.describe());
    }

    switch (exec->violation) {
        case Violation::Timeout:
            throw Tasks::CommandError("Command failed: " + exec->command + ": timed out after " +
                                      std::to_string(options.timeout.count()) + " ms", -1, trim_output(exec->err));
        case Violation::OutputLimit:
            throw Tasks::CommandError("Command failed: " + exec->command + ": output exceeded " +
                                      std::to_string(options.max_output_bytes) + " bytes", -1, trim_output(exec->err));
        case Violation::None:
            break;
    }
    if (!status.clean()) {
        auto stderr_text = trim_output(exec->err);
        std::string message = "Command failed: " + exec->command;
        if (status.signaled) message += ": " + status.describe();
        if (!stderr_text.empty()) message += "\n" + stderr_text;
        throw Tasks::CommandError(message, status.signaled ? -1 : status.code, stderr_text);
    }
    co_return trim_output(std::move(exec->out));
}

} // namespace SysTask::Worker
