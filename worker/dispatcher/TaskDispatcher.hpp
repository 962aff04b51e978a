/**
 * \file worker/dispatcher/TaskDispatcher.hpp
 * \brief Turns execute-task messages into exactly one reply each.
 */
#pragma once

#include "ipc/TaskMessage.hpp"
#include "runtime/CoTask.hpp"
#include "tasks/handlers/ICommandRunner.hpp"
#include "tasks/registry/TaskRegistry.hpp"
#include "logger.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace SysTask::Worker {

/**
 * \brief Looks up the handler for each request, runs it and emits the reply.
 * \details Requests are not queued: every `dispatch()` starts its handler at once,
 * so any number of tasks may be in flight together. They interleave on the loop
 * thread at their `co_await` points.
 */
class TaskDispatcher {
public:
    /** \brief Receives each reply (task-complete or task-error). */
    using ReplySink = std::function<void(const Ipc::Message&)>;

    /**
     * \param registry Handlers; must outlive the dispatcher.
     * \param runner Command runner handed to handlers; must outlive the dispatcher.
     * \param logger Shared logger.
     * \param reply Called on the loop thread once per dispatched request.
     */
    TaskDispatcher(const Tasks::TaskRegistry& registry,
                   Tasks::ICommandRunner& runner,
                   std::shared_ptr<Logger> logger,
                   ReplySink reply);

    /** \brief Start handling `request` without waiting for it. */
    void dispatch(Ipc::ExecuteTaskMessage request);

    /** \brief Handle `request` and yield its reply. Never throws for task failures. */
    runtime::CoTask<Ipc::Message> execute(Ipc::ExecuteTaskMessage request);

    size_t in_flight() const { return in_flight_.load(); }
    std::uint64_t completed_count() const { return completed_.load(); }
    std::uint64_t failed_count() const { return failed_.load(); }

private:
    runtime::DetachedTask run_detached_(Ipc::ExecuteTaskMessage request);

    const Tasks::TaskRegistry& registry_;
    Tasks::ICommandRunner& runner_;
    std::shared_ptr<Logger> logger_;
    ReplySink reply_;

    std::atomic<size_t> in_flight_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
};

} // namespace SysTask::Worker
