/**
 * @file tasks/registry/TaskRegistry.cpp
 * @brief Implementation of the immutable TaskRegistry.
 */
#include "TaskRegistry.hpp"
#include "tasks/builtins/BuiltinTasks.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace SysTask::Tasks {

namespace {

TaskDescriptor make_builtin_descriptor(TaskId id) {
    switch (id) {
        case TaskId::InstallDeb:
            return TaskDescriptor::create(make_install_deb_task(), "Install a local .deb package with dpkg");
        case TaskId::UpdateSystem:
            return TaskDescriptor::create(make_update_system_task(), "apt update followed by apt upgrade");
        case TaskId::InstallPackage:
            return TaskDescriptor::create(make_install_package_task(), "Install a package from the apt repositories");
        case TaskId::ManageService:
            return TaskDescriptor::create(make_manage_service_task(), "Run a systemctl action on a service");
        case TaskId::CheckDiskSpace:
            return TaskDescriptor::create(make_check_disk_space_task(), "Report mounted filesystem usage from df");
        case TaskId::GetSystemInfo:
            return TaskDescriptor::create(make_get_system_info_task(), "Collect OS, memory and CPU information");
    }
    throw std::logic_error("TaskRegistry: no builtin handler for task id " + std::to_string(static_cast<int>(id)));
}

} // namespace

TaskRegistry::TaskRegistry(std::vector<TaskDescriptor> descriptors, std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)), descriptors_(std::move(descriptors)) {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        const auto& desc = descriptors_[i];
        if (!desc.handler) {
            throw std::invalid_argument("TaskRegistry: task '" + desc.name + "' has no handler");
        }
        if (!by_name_.emplace(desc.name, i).second) {
            throw std::invalid_argument("TaskRegistry: duplicate task name '" + desc.name + "'");
        }
        log_debug("[TaskRegistry] registered " + desc.name);
    }
}

std::unique_ptr<TaskRegistry> TaskRegistry::create_builtin(std::shared_ptr<Logger> logger) {
    std::vector<TaskDescriptor> descriptors;
    descriptors.reserve(all_task_ids.size());
    for (auto id : all_task_ids) {
        descriptors.push_back(make_builtin_descriptor(id));
    }
    return std::make_unique<TaskRegistry>(std::move(descriptors), std::move(logger));
}

bool TaskRegistry::has_task(std::string_view name) const {
    return by_name_.find(std::string(name)) != by_name_.end();
}

ITaskHandler* TaskRegistry::find(std::string_view name) const {
    const auto* desc = descriptor(name);
    return desc ? desc->handler.get() : nullptr;
}

const TaskDescriptor* TaskRegistry::descriptor(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        log_debug("[TaskRegistry] unknown task " + std::string(name));
        return nullptr;
    }
    return &descriptors_[it->second];
}

std::vector<std::string> TaskRegistry::task_names() const {
    std::vector<std::string> names;
    names.reserve(descriptors_.size());
    for (const auto& desc : descriptors_) {
        names.push_back(desc.name);
    }
    return names;
}

void TaskRegistry::log_debug(const std::string& message) const {
    if (logger_) logger_->debug(message);
}

} // namespace SysTask::Tasks
