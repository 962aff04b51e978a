/**
 * @file tasks/builtins/CheckDiskSpaceTask.cpp
 * @brief check-disk-space: mounted filesystem usage from df.
 */
#include "BuiltinTasks.hpp"
#include "DiskUsage.hpp"
#include "logger.hpp"

#include <sstream>

namespace SysTask::Tasks {

std::vector<DiskUsageRow> parse_df_output(std::string_view output) {
    std::vector<DiskUsageRow> rows;
    std::istringstream in{std::string(output)};
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (fields >> part) parts.push_back(part);
        if (parts.size() < 6) continue;
        rows.push_back(DiskUsageRow{parts[0], parts[1], parts[2], parts[3], parts[4], parts[5]});
    }
    return rows;
}

void to_json(nlohmann::json& j, const DiskUsageRow& row) {
    j = nlohmann::json{
        {"filesystem", row.filesystem},
        {"size", row.size},
        {"used", row.used},
        {"available", row.available},
        {"usePercent", row.use_percent},
        {"mountPoint", row.mount_point},
    };
}

void from_json(const nlohmann::json& j, DiskUsageRow& row) {
    row.filesystem = j.value("filesystem", "");
    row.size = j.value("size", "");
    row.used = j.value("used", "");
    row.available = j.value("available", "");
    row.use_percent = j.value("usePercent", "");
    row.mount_point = j.value("mountPoint", "");
}

namespace {

class CheckDiskSpaceHandler final : public ITaskHandler {
public:
    TaskId task_id() const noexcept override { return TaskId::CheckDiskSpace; }

    runtime::CoTask<nlohmann::json> run(const nlohmann::json&, TaskContext& ctx) override {
        auto output = co_await ctx.runner.run("df -h");
        auto rows = parse_df_output(output);
        if (ctx.logger) ctx.logger->debug("check-disk-space: " + std::to_string(rows.size()) + " filesystems");
        co_return nlohmann::json(rows);
    }
};

} // namespace

std::unique_ptr<ITaskHandler> make_check_disk_space_task() {
    return std::make_unique<CheckDiskSpaceHandler>();
}

} // namespace SysTask::Tasks
