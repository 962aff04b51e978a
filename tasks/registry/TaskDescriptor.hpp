/**
 * @file tasks/registry/TaskDescriptor.hpp
 * @brief Task definition: identity, description and handler.
 */
#pragma once

#include "tasks/handlers/ITaskHandler.hpp"
#include "TaskIds.hpp"

#include <memory>
#include <string>
#include <utility>

namespace SysTask::Tasks {

struct TaskDescriptor {
    TaskId id{TaskId::InstallDeb};
    std::string name;                       ///< Wire name, equal to task_name(id)
    std::string description;
    std::unique_ptr<ITaskHandler> handler;

    TaskDescriptor() = default;
    TaskDescriptor(TaskDescriptor&&) = default;
    TaskDescriptor& operator=(TaskDescriptor&&) = default;
    TaskDescriptor(const TaskDescriptor&) = delete;
    TaskDescriptor& operator=(const TaskDescriptor&) = delete;

    static TaskDescriptor create(std::unique_ptr<ITaskHandler> handler, std::string description) {
        TaskDescriptor desc;
        desc.id = handler->task_id();
        desc.name = std::string(task_name(desc.id));
        desc.description = std::move(description);
        desc.handler = std::move(handler);
        return desc;
    }
};

} // namespace SysTask::Tasks
