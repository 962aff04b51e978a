/**
 * \file cli/CliOptions.hpp
 * \brief Subcommands of the `systask` front-end.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace SysTask {

enum class CliCommand {
    None,
    InstallDeb,       ///< install-deb <path>
    UpdateSystem,     ///< update-system
    InstallPackage,   ///< install-package <name>
    Service,          ///< service <name> <action>
    Disk,             ///< disk
    SysInfo,          ///< sysinfo
    Run,              ///< run <task> [json-args...]
    Logs,             ///< logs [n]
};

/** \brief Parsed subcommand with its positional arguments. */
struct CliRequest {
    CliCommand command{CliCommand::None};
    std::vector<std::string> args;     ///< Positional arguments in order (task name first for `run`).
    std::size_t log_lines{50};         ///< Line count for `logs`.
};

namespace cli_opts {
    void register_options();

    /** \brief The subcommand selected by the last parse. */
    CliRequest resolve();
}

} // namespace SysTask
