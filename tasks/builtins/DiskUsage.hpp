/**
 * @file tasks/builtins/DiskUsage.hpp
 * @brief Parsed `df -h` rows.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace SysTask::Tasks {

struct DiskUsageRow {
    std::string filesystem;
    std::string size;
    std::string used;
    std::string available;
    std::string use_percent;
    std::string mount_point;
};

/**
 * @brief Parse `df -h` output.
 *
 * The header line is skipped. Rows with fewer than six whitespace-separated
 * columns are dropped; the mount point is the sixth column.
 */
std::vector<DiskUsageRow> parse_df_output(std::string_view output);

void to_json(nlohmann::json& j, const DiskUsageRow& row);
void from_json(const nlohmann::json& j, DiskUsageRow& row);

} // namespace SysTask::Tasks
