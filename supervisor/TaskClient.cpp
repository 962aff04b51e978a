/**
 * \file supervisor/TaskClient.cpp
 * \brief Implementation of the typed task client.
 */
#include "TaskClient.hpp"
#include "tasks/registry/TaskIds.hpp"

namespace SysTask::Supervisor {

namespace {

std::string name_of(Tasks::TaskId id) { return std::string(Tasks::task_name(id)); }

} // namespace

void from_json(const nlohmann::json& j, SystemInfo& info) {
    j.at("os").get_to(info.os);
    j.at("memory").get_to(info.memory);
    j.at("cpu").get_to(info.cpu);
    j.at("timestamp").get_to(info.timestamp);
}

TaskClient::TaskClient(TaskSupervisor& supervisor) : supervisor_(supervisor) {}

nlohmann::json TaskClient::execute(const std::string& task_name, nlohmann::json args, ExecuteOptions options) {
    auto result = supervisor_.execute_with_options(task_name, options, std::move(args)).get();
    if (!result.success) {
        throw TaskFailedError(result.error.empty() ? "Task execution failed" : result.error, result.code, result.failure);
    }
    return std::move(result.data);
}

std::string TaskClient::install_deb(const std::string& path) {
    return execute(name_of(Tasks::TaskId::InstallDeb), nlohmann::json::array({path})).get<std::string>();
}

std::string TaskClient::update_system() {
    return execute(name_of(Tasks::TaskId::UpdateSystem), nlohmann::json::array(), ExecuteOptions{update_timeout})
        .get<std::string>();
}

std::string TaskClient::install_package(const std::string& name) {
    return execute(name_of(Tasks::TaskId::InstallPackage), nlohmann::json::array({name})).get<std::string>();
}

std::string TaskClient::manage_service(const std::string& service, Tasks::ServiceAction action) {
    return execute(name_of(Tasks::TaskId::ManageService),
                   nlohmann::json::array({service, std::string(Tasks::to_string(action))}))
        .get<std::string>();
}

std::vector<DiskInfo> TaskClient::check_disk_space() {
    return execute(name_of(Tasks::TaskId::CheckDiskSpace)).get<std::vector<DiskInfo>>();
}

SystemInfo TaskClient::get_system_info() {
    return execute(name_of(Tasks::TaskId::GetSystemInfo)).get<SystemInfo>();
}

} // namespace SysTask::Supervisor
