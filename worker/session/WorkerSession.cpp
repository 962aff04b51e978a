/**
 * \file worker/session/WorkerSession.cpp
 * \brief Implementation of the worker session.
 */
#include "WorkerSession.hpp"
#include "ipc/WireCodec.hpp"
#include "processUtils.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace SysTask::Worker {

WorkerSession::WorkerSession(const WorkerOptions& opts, const Tasks::TaskRegistry& registry, std::shared_ptr<Logger> logger)
    : opts_(opts)
    , logger_(std::move(logger))
    , context_(std::make_shared<runtime::CoroIoContext>())
    , runner_(context_, logger_, opts.command)
    , dispatcher_(registry, runner_, logger_, [this](const Ipc::Message& reply) { send_reply_(reply); })
    , registry_(registry)
{
    if (!logger_) {
        throw std::invalid_argument("WorkerSession: logger cannot be null");
    }
    context_->set_logger(logger_);
    // A handler that can never resume would leave its request unanswered
    context_->set_fail_fast(true);
    channel_ = std::make_shared<Ipc::FrameChannel>(opts_.channel_fd, context_, logger_);
}

int WorkerSession::run() {
    Ipc::WorkerReadyMessage ready;
    ready.pid = ProcessUtils::current_pid();
    ready.tasks = registry_.task_names();
    std::error_code ec;
    if (!channel_->send(ready, ec)) {
        logger_->error("Worker: cannot announce readiness: " + ec.message());
        return 1;
    }
    logger_->info("Worker ready with " + std::to_string(ready.tasks.size()) + " tasks");

    read_loop_(context_->make_work_guard());
    context_->run();

    logger_->info("Worker: " + std::to_string(frames_received()) + " frames, " + std::to_string(tasks_dispatched()) +
                  " tasks dispatched, " + std::to_string(dispatcher_.completed_count()) + " completed, " +
                  std::to_string(dispatcher_.failed_count()) + " failed");
    context_->log_detailed_statistics();
    return exit_code_;
}

runtime::DetachedTask WorkerSession::read_loop_(runtime::CoroIoContext::WorkGuard guard) {
    auto channel = channel_;
    for (;;) {
        std::vector<uint8_t> frame;
        try {
            frame = co_await channel->async_read_frame();
        } catch (const std::system_error& e) {
            if (e.code() == std::errc::connection_reset) {
                logger_->info("Worker: supervisor closed the channel");
                exit_code_ = 0;
            } else {
                logger_->error(std::string("Worker: channel read failed: ") + e.what());
                exit_code_ = 1;
            }
            break;
        }
        frames_received_.fetch_add(1);

        Ipc::Message message;
        try {
            message = Ipc::WireCodec::decode(frame);
        } catch (const Ipc::CodecError& e) {
            logger_->error(std::string("Worker: dropping malformed frame: ") + e.what());
            continue;
        }

        if (auto* request = std::get_if<Ipc::ExecuteTaskMessage>(&message)) {
            tasks_dispatched_.fetch_add(1);
            dispatcher_.dispatch(std::move(*request));
        } else {
            logger_->warning("Worker: ignoring unexpected " + std::string(Ipc::message_type(message)) + " message");
        }
    }
    context_->request_stop();
}

void WorkerSession::send_reply_(const Ipc::Message& reply) {
    std::error_code ec;
    if (send_task_reply(*channel_, reply, ec)) return;
    logger_->error("Worker: cannot send " + std::string(Ipc::message_type(reply)) + " reply: " + ec.message());
}

bool send_task_reply(Ipc::FrameChannel& channel, const Ipc::Message& reply, std::error_code& ec) {
    const auto* complete = std::get_if<Ipc::TaskCompleteMessage>(&reply);
    std::string failure;
    try {
        if (channel.send(reply, ec)) return true;
        if (!complete || ec != std::errc::message_size) return false;
        failure = "reply exceeds frame limit";
    } catch (const Ipc::CodecError& e) {
        if (!complete) throw;
        failure = e.what();
    }
    Ipc::TaskErrorMessage fallback{complete->task_id, "Cannot encode task result: " + failure, -1};
    return channel.send(fallback, ec);
}

} // namespace SysTask::Worker
