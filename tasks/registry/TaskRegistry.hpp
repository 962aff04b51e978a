/**
 * @file tasks/registry/TaskRegistry.hpp
 * @brief Lookup from task name to handler.
 *
 * Built once at worker boot and immutable afterwards, so lookups need no lock.
 */
#pragma once

#include "TaskDescriptor.hpp"
#include "TaskIds.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class Logger;

namespace SysTask::Tasks {

/**
 * @brief Immutable registry of task descriptors.
 *
 * Constructed either from an explicit descriptor list (tests) or through
 * create_builtin(), which covers every TaskId.
 */
class TaskRegistry {
public:
    /**
     * @brief Construct from descriptors.
     * @throws std::invalid_argument on a duplicate name or a descriptor without handler.
     */
    TaskRegistry(std::vector<TaskDescriptor> descriptors, std::shared_ptr<Logger> logger = nullptr);

    /// Registry holding a handler for every TaskId.
    static std::unique_ptr<TaskRegistry> create_builtin(std::shared_ptr<Logger> logger = nullptr);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;
    TaskRegistry(TaskRegistry&&) = delete;
    TaskRegistry& operator=(TaskRegistry&&) = delete;

    [[nodiscard]] bool has_task(std::string_view name) const;

    /// Handler for `name`, or nullptr if unknown.
    [[nodiscard]] ITaskHandler* find(std::string_view name) const;

    [[nodiscard]] const TaskDescriptor* descriptor(std::string_view name) const;

    /// Registered names in TaskId order.
    [[nodiscard]] std::vector<std::string> task_names() const;

    [[nodiscard]] size_t task_count() const { return by_name_.size(); }

private:
    void log_debug(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    std::vector<TaskDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace SysTask::Tasks
