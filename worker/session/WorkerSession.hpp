/**
 * \file worker/session/WorkerSession.hpp
 * \brief Worker-side session: channel read loop feeding the dispatcher.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include "logger.hpp"
#include "runtime/CoTask.hpp"
#include "runtime/CoroIoContext.hpp"
#include "ipc/FrameChannel.hpp"
#include "tasks/registry/TaskRegistry.hpp"
#include "worker/WorkerOptions.hpp"
#include "worker/dispatcher/TaskDispatcher.hpp"
#include "worker/runner/CommandRunner.hpp"

namespace SysTask::Worker {

/**
 * \brief Write one task reply, degrading a completion that cannot go on the wire.
 * \details A completion whose result fails to encode, or whose frame exceeds
 * `FrameChannel::max_frame_size`, is replaced by a task-error reply with code -1
 * so the request still gets exactly one answer.
 * \return false if nothing could be written; `ec` then holds the channel error.
 */
bool send_task_reply(Ipc::FrameChannel& channel, const Ipc::Message& reply, std::error_code& ec);

/**
 * \brief Owns the worker event loop and the supervisor channel.
 * \details `run()` announces readiness, then reads execute-task frames until the
 * supervisor closes the channel, dispatching each one without waiting for the
 * previous ones. Replies are written back on the same channel.
 */
class WorkerSession {
public:
    /**
     * \brief Construct a session for a single worker process.
     * \param opts Channel descriptor and command limits.
     * \param registry Task handlers; must outlive the session.
     * \param logger Shared logger forwarded to dependent components.
     * \throws std::invalid_argument if logger is null.
     */
    WorkerSession(const WorkerOptions& opts, const Tasks::TaskRegistry& registry, std::shared_ptr<Logger> logger);

    /** \brief Run the loop on the calling thread until the channel closes.
     *  \return process exit code: 0 when the supervisor closed the channel, 1 on a channel failure.
     *  \throws std::exception escaping any loop callback; the process is expected to exit.
     */
    int run();

    std::uint64_t frames_received() const { return frames_received_.load(); }
    std::uint64_t tasks_dispatched() const { return tasks_dispatched_.load(); }

private:
    runtime::DetachedTask read_loop_(runtime::CoroIoContext::WorkGuard guard);
    void send_reply_(const Ipc::Message& reply);

    WorkerOptions opts_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<runtime::CoroIoContext> context_;
    std::shared_ptr<Ipc::FrameChannel> channel_;
    CommandRunner runner_;
    TaskDispatcher dispatcher_;
    const Tasks::TaskRegistry& registry_;

    int exit_code_{0};
    std::atomic<std::uint64_t> frames_received_{0};
    std::atomic<std::uint64_t> tasks_dispatched_{0};
};

} // namespace SysTask::Worker
