/**
 * \file worker/WorkerOptions.hpp
 * \brief Shared option types and accessors for the worker process.
 */
#pragma once

#include "logger.hpp"
#include "tasks/handlers/ICommandRunner.hpp"

#include <optional>
#include <string>

namespace SysTask {

/** \brief Environment variable through which the supervisor passes the channel descriptor. */
inline constexpr const char* channel_fd_env = "SYSTASK_CHANNEL_FD";

/** \brief Aggregated worker runtime configuration. */
struct WorkerOptions {
    int channel_fd{3};                          ///< Connected socket to the supervisor.
    LogLevel log_level{LogLevel::Info};         ///< Minimum level written to stdout.
    Tasks::CommandOptions command{};            ///< Default per-command limits.
};

/** \brief Helper API for accessing worker-specific CLI and config options. */
namespace worker_opts {
    std::optional<int> get_channel_fd();
    std::optional<std::string> get_log_level();
    std::optional<long long> get_command_timeout_ms();
    std::optional<long long> get_max_output_bytes();
    void register_options();

    /** \brief Resolve cached options (after parsing) into a `WorkerOptions`. */
    WorkerOptions resolve();
}

} // namespace SysTask
