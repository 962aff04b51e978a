/**
 * \file supervisor/TaskClient.hpp
 * \brief Typed, blocking facade over TaskSupervisor for the builtin tasks.
 */
#pragma once

#include "TaskSupervisor.hpp"
#include "tasks/builtins/DiskUsage.hpp"
#include "tasks/builtins/ServiceActions.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SysTask::Supervisor {

/** \brief A task resolved with `success == false`. */
class TaskFailedError : public std::runtime_error {
public:
    TaskFailedError(const std::string& message, std::optional<int> code, TaskFailureKind kind)
        : std::runtime_error(message), code_(code), kind_(kind) {}

    std::optional<int> code() const noexcept { return code_; }
    TaskFailureKind kind() const noexcept { return kind_; }

private:
    std::optional<int> code_;
    TaskFailureKind kind_;
};

using DiskInfo = Tasks::DiskUsageRow;

struct SystemInfo {
    std::string os;
    std::string memory;
    std::string cpu;
    std::string timestamp;
};

void from_json(const nlohmann::json& j, SystemInfo& info);

/**
 * \brief Blocking wrappers, one per builtin task.
 * \details Each call waits for the supervisor's resolution. Failures throw
 * `TaskFailedError`; malformed results throw `nlohmann::json::exception`.
 * Do not call from the supervisor's loop thread.
 */
class TaskClient {
public:
    /// Supervisor timeout used for update-system.
    static constexpr std::chrono::milliseconds update_timeout{300000};

    explicit TaskClient(TaskSupervisor& supervisor);

    std::string install_deb(const std::string& path);
    std::string update_system();
    std::string install_package(const std::string& name);
    std::string manage_service(const std::string& service, Tasks::ServiceAction action);
    std::vector<DiskInfo> check_disk_space();
    SystemInfo get_system_info();

    /** \brief Any task by name; returns the raw result. */
    nlohmann::json execute(const std::string& task_name, nlohmann::json args = nlohmann::json::array(),
                           ExecuteOptions options = {});

    bool is_available() const { return supervisor_.is_available(); }
    std::vector<std::string> get_recent_logs(size_t count = 100) const { return supervisor_.get_recent_logs(count); }
    void dispose() { supervisor_.dispose(); }

private:
    TaskSupervisor& supervisor_;
};

} // namespace SysTask::Supervisor
