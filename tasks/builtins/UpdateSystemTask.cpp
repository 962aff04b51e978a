/**
 * @file tasks/builtins/UpdateSystemTask.cpp
 * @brief update-system: refresh package lists and upgrade everything.
 */
#include "BuiltinTasks.hpp"
#include "logger.hpp"

namespace SysTask::Tasks {

namespace {

/// apt upgrades routinely exceed the default command limit.
constexpr std::chrono::milliseconds update_command_timeout{300000};

class UpdateSystemHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::UpdateSystem; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json&, TaskContext& ctx) override {
        if (ctx.logger) ctx.logger->info("Updating system packages");
        auto options = ctx.runner.default_options();
        options.timeout = update_command_timeout;
        co_await ctx.runner.run("pkexec apt update && pkexec apt upgrade -y", options);
        co_return nlohmann::json("System update completed successfully");
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_update_system_task() {
    return std::make_unique<UpdateSystemHandler>();
}

} // namespace SysTask::Tasks
