/**
 * \file supervisor/SupervisorOptions.hpp
 * \brief CLI and configuration options for processes that host a TaskSupervisor.
 */
#pragma once

#include "TaskSupervisor.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace SysTask {

/** \brief Aggregated supervisor-side configuration. */
struct SupervisorOptions {
    std::filesystem::path worker_path;             ///< Worker executable.
    std::string worker_log_level{"info"};          ///< Forwarded to the worker as `--log-level`.
    Supervisor::SupervisorConfig config{};         ///< Timeouts, restart policy, log directory.
};

/** \brief Helper API for accessing supervisor CLI and config options. */
namespace supervisor_opts {
    std::optional<std::string> get_worker_path();
    std::optional<std::string> get_log_dir();
    std::optional<long long> get_task_timeout_ms();
    std::optional<int> get_max_restarts();
    std::optional<long long> get_restart_delay_ms();
    std::optional<long long> get_max_restart_delay_ms();
    std::optional<std::string> get_worker_log_level();
    void register_options();

    /**
     * \brief Resolve cached options (after parsing) into `SupervisorOptions`.
     * \details A relative log directory from a config file is taken relative to that file.
     */
    SupervisorOptions resolve();

    /** \brief `systask-worker` next to the running executable. */
    std::filesystem::path default_worker_path();
}

} // namespace SysTask
