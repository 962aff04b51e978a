/**
 * @file tasks/builtins/ManageServiceTask.cpp
 * @brief manage-service: run a whitelisted systemctl action on a unit.
 */
#include "BuiltinTasks.hpp"
#include "ServiceActions.hpp"
#include "TaskArgs.hpp"
#include "logger.hpp"

namespace SysTask::Tasks {

namespace {

class ManageServiceHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::ManageService; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json& args, TaskContext& ctx) override {
        if (!has_arg(args, 0) || !has_arg(args, 1)) {
            throw TaskFailure("Service name and action are required");
        }
        const auto service = arg_text(args, 0);
        const auto action_text = string_arg(args, 1);
        if (!action_text || !parse_service_action(*action_text)) {
            throw TaskFailure("Invalid action. Must be one of: " + service_action_list());
        }
        if (ctx.logger) ctx.logger->info("Service " + service + ": " + *action_text);
        co_await ctx.runner.run("pkexec systemctl " + *action_text + " " + double_quote(service));
        co_return nlohmann::json("Service " + service + " " + *action_text + " completed");
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_manage_service_task() {
    return std::make_unique<ManageServiceHandler>();
}

} // namespace SysTask::Tasks
