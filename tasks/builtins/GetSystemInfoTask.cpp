/**
 * @file tasks/builtins/GetSystemInfoTask.cpp
 * @brief get-system-info: OS release, memory and CPU summaries.
 */
#include "BuiltinTasks.hpp"
#include "logger.hpp"
#include "timestamp.hpp"

#include <array>
#include <exception>
#include <string>

namespace SysTask::Tasks {

namespace {

class GetSystemInfoHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::GetSystemInfo; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json&, TaskContext& ctx) override {
        // Tasks start eagerly, so the three commands run concurrently.
        std::array<runtime::CoTask<std::string>, 3> commands{
            ctx.runner.run("lsb_release -a 2>/dev/null || cat /etc/os-release"),
            ctx.runner.run("free -h"),
            ctx.runner.run("lscpu | head -20"),
        };

        // Every command is awaited before the first failure is rethrown, so no
        // command frame is destroyed while still in flight.
        std::array<std::string, 3> outputs;
        std::exception_ptr first_error;
        for (size_t i = 0; i < commands.size(); ++i) {
            try {
                auto& command = commands[i];
                outputs[i] = co_await command;
            } catch (const std::exception&) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) std::rethrow_exception(first_error);

        nlohmann::json info;
        info["os"] = outputs[0];
        info["memory"] = outputs[1];
        info["cpu"] = outputs[2];
        info["timestamp"] = format_iso8601_utc();
        if (ctx.logger) ctx.logger->debug("get-system-info collected");
        co_return info;
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_get_system_info_task() {
    return std::make_unique<GetSystemInfoHandler>();
}

} // namespace SysTask::Tasks
