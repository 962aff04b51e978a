/**
 * @file tasks/builtins/InstallPackageTask.cpp
 * @brief install-package: install a package from the configured apt sources.
 */
#include "BuiltinTasks.hpp"
#include "TaskArgs.hpp"
#include "logger.hpp"

namespace SysTask::Tasks {

namespace {

class InstallPackageHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::InstallPackage; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json& args, TaskContext& ctx) override {
        auto package = string_arg(args, 0);
        if (!package) throw TaskFailure("Invalid package name provided");
        if (ctx.logger) ctx.logger->info("Installing package: " + *package);
        co_await ctx.runner.run("pkexec apt install -y " + double_quote(*package));
        co_return nlohmann::json("Successfully installed package: " + *package);
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_install_package_task() {
    return std::make_unique<InstallPackageHandler>();
}

} // namespace SysTask::Tasks
