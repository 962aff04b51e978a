/**
 * \file worker/dispatcher/TaskDispatcher.cpp
 * \brief Handler lookup, invocation and reply construction.
 */
#include "TaskDispatcher.hpp"

#include <stdexcept>
#include <string>

namespace SysTask::Worker {

TaskDispatcher::TaskDispatcher(const Tasks::TaskRegistry& registry,
                               Tasks::ICommandRunner& runner,
                               std::shared_ptr<Logger> logger,
                               ReplySink reply)
    : registry_(registry), runner_(runner), logger_(std::move(logger)), reply_(std::move(reply)) {
    if (!reply_) throw std::invalid_argument("TaskDispatcher: reply sink cannot be empty");
}

void TaskDispatcher::dispatch(Ipc::ExecuteTaskMessage request) {
    run_detached_(std::move(request));
}

runtime::DetachedTask TaskDispatcher::run_detached_(Ipc::ExecuteTaskMessage request) {
    auto reply = co_await execute(std::move(request));
    reply_(reply);
}

runtime::CoTask<Ipc::Message> TaskDispatcher::execute(Ipc::ExecuteTaskMessage request) {
    const std::string task_id = request.task_id;
    const std::string task_name = request.task_name;

    auto* handler = registry_.find(task_name);
    if (!handler) {
        if (logger_) logger_->warning("Dispatcher: unknown task " + task_name + " (" + task_id + ")");
        failed_.fetch_add(1);
        co_return Ipc::TaskErrorMessage{task_id, "Unknown task: " + task_name, -1};
    }

    in_flight_.fetch_add(1);
    if (logger_) logger_->info("Executing task: " + task_name + " (" + task_id + ")");

    Tasks::TaskContext ctx{runner_, logger_};
    std::string error;
    int code = -1;
    bool ok = false;
    nlohmann::json result;
    try {
        result = co_await handler->run(request.args, ctx);
        ok = true;
    } catch (const Tasks::TaskFailure& e) {
        error = e.what();
        code = e.code();
    } catch (const std::exception& e) {
        error = e.what();
    }
    in_flight_.fetch_sub(1);

    if (ok) {
        completed_.fetch_add(1);
        if (logger_) logger_->info("Task completed: " + task_name + " (" + task_id + ")");
        co_return Ipc::TaskCompleteMessage{task_id, std::move(result)};
    }
    failed_.fetch_add(1);
    if (logger_) logger_->error("Task failed: " + task_name + " (" + task_id + "): " + error);
    co_return Ipc::TaskErrorMessage{task_id, error, code};
}

} // namespace SysTask::Worker
