/**
 * \file supervisor/ChildWorkerLauncher.cpp
 * \brief fork/exec of the worker with channel handoff and output capture.
 */
#include "ChildWorkerLauncher.hpp"
#include "ipc/FrameChannel.hpp"
#include "ipc/WireCodec.hpp"
#include "processUtils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace SysTask::Supervisor {

namespace {

using Clock = std::chrono::steady_clock;

/// How long to keep draining output after the child was reaped.
constexpr std::chrono::milliseconds drain_grace{250};
/// Longest partial line buffered before it is emitted as is.
constexpr size_t max_line_bytes = 64 * 1024;

class ChildWorkerProcess : public IWorkerProcess, public std::enable_shared_from_this<ChildWorkerProcess> {
public:
    ChildWorkerProcess(pid_t pid, std::shared_ptr<Ipc::FrameChannel> channel, int out_fd, int err_fd,
                       std::shared_ptr<runtime::CoroIoContext> loop, WorkerEvents events,
                       std::shared_ptr<Logger> logger, std::chrono::milliseconds kill_grace)
        : pid_(pid)
        , out_fd_(out_fd)
        , err_fd_(err_fd)
        , loop_(std::move(loop))
        , channel_(std::move(channel))
        , events_(std::move(events))
        , logger_(std::move(logger))
        , kill_grace_(kill_grace)
        , guard_(loop_->make_work_guard())
    {
        std::error_code ec;
        ProcessUtils::set_nonblocking(out_fd_, ec);
        ProcessUtils::set_nonblocking(err_fd_, ec);
        if (ec && logger_) logger_->warning("ChildWorkerLauncher: cannot make output pipes non-blocking: " + ec.message());
    }

    ~ChildWorkerProcess() override {
        ProcessUtils::close_fd(out_fd_);
        ProcessUtils::close_fd(err_fd_);
        if (!reaped_) {
            ::kill(pid_, SIGKILL);
            int raw = 0;
            while (::waitpid(pid_, &raw, 0) < 0 && errno == EINTR) {
            }
        }
    }

    void start() {
        auto self = shared_from_this();
        loop_->register_pending(runtime::CoroIoContext::PendingOpCategory::Process,
                                [self]() { return self->poll_(); }, nullptr);
    }

    int pid() const override { return static_cast<int>(pid_); }

    bool send(const Ipc::Message& message) override {
        if (exited_ || !channel_->is_open()) return false;
        std::error_code ec;
        if (channel_->send(message, ec)) return true;
        if (logger_) logger_->warning("ChildWorkerLauncher: send to worker " + std::to_string(pid_) + " failed: " + ec.message());
        return false;
    }

    void terminate() override {
        if (exited_ || terminating_) return;
        terminating_ = true;
        channel_->close();
        ::kill(pid_, SIGTERM);
        std::weak_ptr<ChildWorkerProcess> weak = shared_from_this();
        kill_timer_ = loop_->schedule_after(kill_grace_, [weak]() {
            auto self = weak.lock();
            if (self && !self->reaped_) {
                if (self->logger_) self->logger_->warning("ChildWorkerLauncher: worker " + std::to_string(self->pid_) + " ignored SIGTERM, killing");
                ::kill(self->pid_, SIGKILL);
            }
        });
    }

private:
    /// One non-blocking step; true once the process is gone and `on_exit` was delivered.
    bool poll_() {
        drain_output_(out_fd_, out_partial_, OutputStream::Stdout);
        drain_output_(err_fd_, err_partial_, OutputStream::Stderr);
        read_channel_();

        if (!reaped_) {
            int raw = 0;
            pid_t r = ::waitpid(pid_, &raw, WNOHANG);
            if (r == pid_) {
                reaped_ = true;
                status_ = ProcessUtils::decode_wait_status(raw);
                reaped_at_ = Clock::now();
            } else if (r < 0 && errno != EINTR) {
                reaped_ = true;
                status_.signaled = true;
                status_.signal = SIGKILL;
                reaped_at_ = Clock::now();
            }
        }
        if (!reaped_) return false;
        // Descendants may still hold the pipes; stop waiting for them after a grace period
        if ((out_fd_ >= 0 || err_fd_ >= 0) && Clock::now() - reaped_at_ < drain_grace) return false;

        finish_();
        return true;
    }

    void drain_output_(int& fd, std::string& partial, OutputStream stream) {
        if (fd < 0) return;
        char buf[8192];
        for (;;) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                partial.append(buf, static_cast<size_t>(n));
                emit_lines_(partial, stream);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            ProcessUtils::close_fd(fd);
            return;
        }
    }

    void emit_lines_(std::string& partial, OutputStream stream) {
        size_t start = 0;
        for (;;) {
            auto nl = partial.find('\n', start);
            if (nl == std::string::npos) break;
            emit_line_(partial.substr(start, nl - start), stream);
            start = nl + 1;
        }
        partial.erase(0, start);
        if (partial.size() > max_line_bytes) {
            emit_line_(partial, stream);
            partial.clear();
        }
    }

    void emit_line_(std::string line, OutputStream stream) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || !events_.on_output) return;
        events_.on_output(stream, line);
    }

    void read_channel_() {
        while (channel_->is_open()) {
            std::error_code ec;
            auto frame = channel_->try_read_frame(ec);
            if (!frame) {
                if (ec) {
                    if (ec != std::errc::connection_reset && logger_) {
                        logger_->warning("ChildWorkerLauncher: channel of worker " + std::to_string(pid_) + " failed: " + ec.message());
                    }
                    channel_->close();
                }
                return;
            }
            Ipc::Message message;
            try {
                message = Ipc::WireCodec::decode(*frame);
            } catch (const Ipc::CodecError& e) {
                if (logger_) logger_->error(std::string("ChildWorkerLauncher: dropping malformed frame: ") + e.what());
                continue;
            }
            if (events_.on_message) events_.on_message(std::move(message));
        }
    }

    void finish_() {
        if (!out_partial_.empty()) emit_line_(std::exchange(out_partial_, {}), OutputStream::Stdout);
        if (!err_partial_.empty()) emit_line_(std::exchange(err_partial_, {}), OutputStream::Stderr);
        ProcessUtils::close_fd(out_fd_);
        ProcessUtils::close_fd(err_fd_);
        channel_->close();
        if (kill_timer_ != 0) loop_->cancel_timer(kill_timer_);
        exited_ = true;
        guard_.reset();
        if (events_.on_exit) events_.on_exit(status_);
    }

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    std::shared_ptr<runtime::CoroIoContext> loop_;
    std::shared_ptr<Ipc::FrameChannel> channel_;
    WorkerEvents events_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds kill_grace_;
    runtime::CoroIoContext::WorkGuard guard_;

    std::string out_partial_;
    std::string err_partial_;
    bool reaped_{false};
    bool exited_{false};
    bool terminating_{false};
    Clock::time_point reaped_at_{};
    ExitStatus status_{};
    runtime::CoroIoContext::TimerId kill_timer_{0};
};

[[noreturn]] void throw_errno(int err, const std::string& what) {
    throw std::system_error(err, std::generic_category(), "ChildWorkerLauncher: " + what);
}

} // namespace

ChildWorkerLauncher::ChildWorkerLauncher(std::filesystem::path worker_path,
                                         std::vector<std::string> worker_args,
                                         std::shared_ptr<Logger> logger)
    : worker_path_(std::move(worker_path))
    , worker_args_(std::move(worker_args))
    , logger_(std::move(logger))
{
}

std::shared_ptr<IWorkerProcess> ChildWorkerLauncher::launch(std::shared_ptr<runtime::CoroIoContext> loop, WorkerEvents events) {
    if (!loop) throw std::invalid_argument("ChildWorkerLauncher: loop cannot be null");
    std::error_code exists_ec;
    if (!std::filesystem::exists(worker_path_, exists_ec)) {
        throw std::runtime_error("ChildWorkerLauncher: worker executable not found: " + worker_path_.string());
    }

    // Prepare everything the child needs before fork; the child may only make
    // async-signal-safe calls.
    std::vector<std::string> args;
    args.push_back(worker_path_.string());
    args.push_back("--channel-fd");
    args.push_back(std::to_string(child_channel_fd));
    args.insert(args.end(), worker_args_.begin(), worker_args_.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    int sv[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* fd : {&sv[0], &sv[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            ProcessUtils::close_fd(*fd);
        }
    };

    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) < 0) {
        throw_errno(errno, "socketpair");
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close_all();
        throw_errno(saved, "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_all();
        throw_errno(saved, "fork");
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (sv[1] == child_channel_fd) {
            int flags = ::fcntl(sv[1], F_GETFD);
            if (flags >= 0) ::fcntl(sv[1], F_SETFD, flags & ~FD_CLOEXEC);
        } else {
            // dup2 clears FD_CLOEXEC on the target
            ::dup2(sv[1], child_channel_fd);
        }
        ::execv(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ProcessUtils::close_fd(sv[1]);
    ProcessUtils::close_fd(out_pipe[1]);
    ProcessUtils::close_fd(err_pipe[1]);
    ProcessUtils::close_fd(exec_pipe[1]);

    // The exec pipe closes on successful exec; otherwise the child reports errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ProcessUtils::close_fd(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {
        }
        close_all();
        throw_errno(exec_errno, "exec " + worker_path_.string());
    }

    std::shared_ptr<ChildWorkerProcess> process;
    try {
        // The channel owns sv[0] from here on, even when its constructor throws
        int channel_fd = std::exchange(sv[0], -1);
        auto channel = std::make_shared<Ipc::FrameChannel>(channel_fd, loop, logger_);
        process = std::make_shared<ChildWorkerProcess>(pid, std::move(channel), out_pipe[0], err_pipe[0], loop,
                                                       std::move(events), logger_, kill_grace_);
    } catch (...) {
        ::kill(pid, SIGKILL);
        int raw = 0;
        while (::waitpid(pid, &raw, 0) < 0 && errno == EINTR) {
        }
        close_all();
        throw;
    }
    // Ownership moved into the process object
    out_pipe[0] = err_pipe[0] = -1;
    process->start();
    if (logger_) logger_->debug("ChildWorkerLauncher: spawned " + worker_path_.string() + " as pid " + std::to_string(pid));
    return process;
}

} // namespace SysTask::Supervisor
