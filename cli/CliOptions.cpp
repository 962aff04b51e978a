/**
 * \file cli/CliOptions.cpp
 * \brief CLI11 subcommand registration for the `systask` front-end.
 */

#include "CliOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>

namespace SysTask { namespace cli_opts {

/// Request filled by subcommand callbacks during parsing.
static CliRequest g_request;

// Positional storage, one slot per subcommand argument
static std::string g_deb_path;
static std::string g_package;
static std::string g_service;
static std::string g_action;
static std::string g_task;
static std::vector<std::string> g_task_args;
static std::size_t g_log_lines = 50;

CliRequest resolve() { return g_request; }

void register_options() {
    static std::atomic<bool> registered{false};
    if (registered.exchange(true)) return;

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        g_request = CliRequest{};
        g_deb_path.clear();
        g_package.clear();
        g_service.clear();
        g_action.clear();
        g_task.clear();
        g_task_args.clear();
        g_log_lines = 50;
        if (j.contains("cli") && j["cli"].is_object()) {
            const auto& c = j["cli"];
            if (c.contains("log_lines") && c["log_lines"].is_number_unsigned()) g_log_lines = c["log_lines"].get<std::size_t>();
        }

        app.require_subcommand(1);
        app.fallthrough();

        auto* deb = app.add_subcommand("install-deb", "Install a local .deb package");
        deb->add_option("path", g_deb_path, "Path to the .deb file")->required();
        deb->callback([]() { g_request.command = CliCommand::InstallDeb; g_request.args = {g_deb_path}; });

        auto* update = app.add_subcommand("update-system", "apt update && apt upgrade");
        update->callback([]() { g_request.command = CliCommand::UpdateSystem; });

        auto* package = app.add_subcommand("install-package", "Install a package with apt");
        package->add_option("name", g_package, "Package name")->required();
        package->callback([]() { g_request.command = CliCommand::InstallPackage; g_request.args = {g_package}; });

        auto* service = app.add_subcommand("service", "Control a systemd service");
        service->add_option("name", g_service, "Service name")->required();
        service->add_option("action", g_action, "start|stop|restart|status|enable|disable")->required();
        service->callback([]() { g_request.command = CliCommand::Service; g_request.args = {g_service, g_action}; });

        auto* disk = app.add_subcommand("disk", "Show disk usage");
        disk->callback([]() { g_request.command = CliCommand::Disk; });

        auto* sysinfo = app.add_subcommand("sysinfo", "Show OS, memory and CPU information");
        sysinfo->callback([]() { g_request.command = CliCommand::SysInfo; });

        auto* run = app.add_subcommand("run", "Run any task by name");
        run->add_option("task", g_task, "Task name")->required();
        run->add_option("args", g_task_args, "Arguments; each is parsed as JSON, or taken as a string");
        run->callback([]() {
            g_request.command = CliCommand::Run;
            g_request.args = {g_task};
            g_request.args.insert(g_request.args.end(), g_task_args.begin(), g_task_args.end());
        });

        auto* logs = app.add_subcommand("logs", "Print the tail of the newest session log");
        logs->add_option("lines", g_log_lines, "Number of lines")->check(CLI::PositiveNumber);
        logs->callback([]() { g_request.command = CliCommand::Logs; g_request.log_lines = g_log_lines; });
    });
}

} } // namespace SysTask::cli_opts
