/**
 * @file tasks/builtins/BuiltinTasks.hpp
 * @brief Factories for the built-in task handlers, one per source file.
 */
#pragma once

#include "tasks/handlers/ITaskHandler.hpp"

#include <memory>

namespace SysTask::Tasks {

std::unique_ptr<ITaskHandler> make_install_deb_task();
std::unique_ptr<ITaskHandler> make_update_system_task();
std::unique_ptr<ITaskHandler> make_install_package_task();
std::unique_ptr<ITaskHandler> make_manage_service_task();
std::unique_ptr<ITaskHandler> make_check_disk_space_task();
std::unique_ptr<ITaskHandler> make_get_system_info_task();

} // namespace SysTask::Tasks
