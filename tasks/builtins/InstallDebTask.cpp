/**
 * @file tasks/builtins/InstallDebTask.cpp
 * @brief install-deb: install a local Debian package through dpkg.
 */
#include "BuiltinTasks.hpp"
#include "TaskArgs.hpp"
#include "logger.hpp"

namespace SysTask::Tasks {

namespace {

class InstallDebHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::InstallDeb; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json& args, TaskContext& ctx) override {
        auto path = string_arg(args, 0);
        if (!path) throw TaskFailure("Invalid deb path provided");
        if (path->size() < 4 || path->compare(path->size() - 4, 4, ".deb") != 0) {
            throw TaskFailure("File must be a .deb package");
        }
        if (ctx.logger) ctx.logger->info("Installing deb package: " + *path);
        co_await ctx.runner.run("pkexec dpkg -i " + double_quote(*path));
        co_return nlohmann::json("Successfully installed: " + *path);
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_install_deb_task() {
    return std::make_unique<InstallDebHandler>();
}

} // namespace SysTask::Tasks
