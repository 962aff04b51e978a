/**
 * @file tasks/handlers/ITaskHandler.hpp
 * @brief Interface for worker-side task handlers.
 *
 * Handlers are coroutines: they await shell commands through the context's
 * command runner and yield a JSON result, or throw TaskFailure.
 */
#pragma once

#include "ICommandRunner.hpp"
#include "runtime/CoTask.hpp"
#include "tasks/registry/TaskIds.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string_view>

class Logger;

namespace SysTask::Tasks {

/// Collaborators available to a running handler.
struct TaskContext {
    ICommandRunner& runner;
    std::shared_ptr<Logger> logger;
};

class ITaskHandler {
public:
    virtual ~ITaskHandler() = default;

    [[nodiscard]] virtual TaskId task_id() const noexcept = 0;

    [[nodiscard]] std::string_view name() const noexcept { return task_name(task_id()); }

    /**
     * @brief Run the task.
     * @param args Positional arguments (JSON array). Must outlive the returned task.
     * @param ctx Runner and logger. Must outlive the returned task.
     * @throws TaskFailure (through the awaited task) on invalid input or command failure.
     */
    virtual runtime::CoTask<nlohmann::json> run(const nlohmann::json& args, TaskContext& ctx) = 0;
};

} // namespace SysTask::Tasks
