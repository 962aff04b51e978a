/**
 * @file tasks/registry/TaskIds.hpp
 * @brief Compile-time task identifiers and their wire names.
 *
 * Central location for task identities shared by the supervisor-side client and
 * the worker-side registry.
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace SysTask::Tasks {

/**
 * @brief Closed set of tasks the worker can run.
 *
 * Adding an enumerator without a handler case in TaskRegistry::create_builtin()
 * is a -Wswitch diagnostic.
 */
enum class TaskId : uint8_t {
    InstallDeb,
    UpdateSystem,
    InstallPackage,
    ManageService,
    CheckDiskSpace,
    GetSystemInfo,
};

inline constexpr std::array<TaskId, 6> all_task_ids{
    TaskId::InstallDeb,
    TaskId::UpdateSystem,
    TaskId::InstallPackage,
    TaskId::ManageService,
    TaskId::CheckDiskSpace,
    TaskId::GetSystemInfo,
};

/// Wire name carried in execute-task messages.
constexpr std::string_view task_name(TaskId id) noexcept {
    switch (id) {
        case TaskId::InstallDeb:     return "install-deb";
        case TaskId::UpdateSystem:   return "update-system";
        case TaskId::InstallPackage: return "install-package";
        case TaskId::ManageService:  return "manage-service";
        case TaskId::CheckDiskSpace: return "check-disk-space";
        case TaskId::GetSystemInfo:  return "get-system-info";
    }
    return "unknown";
}

constexpr std::optional<TaskId> parse_task_name(std::string_view name) noexcept {
    for (auto id : all_task_ids) {
        if (task_name(id) == name) return id;
    }
    return std::nullopt;
}

} // namespace SysTask::Tasks
