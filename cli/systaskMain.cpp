// systaskMain.cpp - Front-end that runs system tasks through a supervised worker process.
#include "CliOptions.hpp"
#include "supervisor/ChildWorkerLauncher.hpp"
#include "supervisor/SupervisorOptions.hpp"
#include "supervisor/TaskClient.hpp"
#include "supervisor/TaskSupervisor.hpp"
#include "tasks/builtins/ServiceActions.hpp"
#include "fileSink.hpp"
#include "logger.hpp"
#include <options/Options.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>

namespace {

using namespace SysTask;
using Supervisor::TaskClient;
using Supervisor::TaskFailedError;

constexpr auto ready_timeout = std::chrono::seconds(10);

nlohmann::json parse_task_args(const std::vector<std::string>& raw) {
    auto args = nlohmann::json::array();
    for (const auto& text : raw) {
        auto value = nlohmann::json::parse(text, nullptr, false);
        args.push_back(value.is_discarded() ? nlohmann::json(text) : value);
    }
    return args;
}

void print_disk_table(const std::vector<Supervisor::DiskInfo>& rows) {
    std::cout << std::left << std::setw(24) << "Filesystem" << std::setw(8) << "Size" << std::setw(8) << "Used"
              << std::setw(8) << "Avail" << std::setw(6) << "Use%" << "Mounted on" << "\n";
    for (const auto& row : rows) {
        std::cout << std::left << std::setw(24) << row.filesystem << std::setw(8) << row.size << std::setw(8) << row.used
                  << std::setw(8) << row.available << std::setw(6) << row.use_percent << row.mount_point << "\n";
    }
}

int print_logs(const std::filesystem::path& dir, std::size_t count) {
    auto latest = LogFiles::find_latest(dir);
    if (!latest) {
        std::cout << "No session logs in " << dir.string() << std::endl;
        return 0;
    }
    for (const auto& line : LogFiles::read_recent_lines(*latest, count)) {
        std::cout << line << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int run_command(const CliRequest& request, TaskClient& client) {
    switch (request.command) {
        case CliCommand::InstallDeb:
            std::cout << client.install_deb(request.args.at(0)) << std::endl;
            return 0;
        case CliCommand::UpdateSystem:
            std::cout << client.update_system() << std::endl;
            return 0;
        case CliCommand::InstallPackage:
            std::cout << client.install_package(request.args.at(0)) << std::endl;
            return 0;
        case CliCommand::Service: {
            auto action = Tasks::parse_service_action(request.args.at(1));
            if (action) {
                std::cout << client.manage_service(request.args.at(0), *action) << std::endl;
            } else {
                // Let the worker produce the canonical validation error
                std::cout << client.execute("manage-service", nlohmann::json::array({request.args.at(0), request.args.at(1)}))
                                 .get<std::string>() << std::endl;
            }
            return 0;
        }
        case CliCommand::Disk:
            print_disk_table(client.check_disk_space());
            return 0;
        case CliCommand::SysInfo: {
            auto info = client.get_system_info();
            std::cout << "== OS ==\n" << info.os << "\n\n== Memory ==\n" << info.memory << "\n\n== CPU ==\n"
                      << info.cpu << "\n\nCollected at " << info.timestamp << std::endl;
            return 0;
        }
        case CliCommand::Run: {
            std::vector<std::string> raw(request.args.begin() + 1, request.args.end());
            auto result = client.execute(request.args.at(0), parse_task_args(raw));
            if (result.is_string()) {
                std::cout << result.get<std::string>() << std::endl;
            } else {
                std::cout << result.dump(2) << std::endl;
            }
            return 0;
        }
        case CliCommand::Logs:
        case CliCommand::None:
            break;
    }
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("systask");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Warning); // results go to stdout; details to the session log
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---
        supervisor_opts::register_options();
        cli_opts::register_options();
        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err, "systask");
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        auto request = cli_opts::resolve();
        auto options = supervisor_opts::resolve();

        if (request.command == CliCommand::Logs) {
            return print_logs(options.config.log_dir, request.log_lines);
        }

        // --- Stage 3: Bring up the supervised worker ---
        auto launcher = std::make_shared<Supervisor::ChildWorkerLauncher>(
            options.worker_path, std::vector<std::string>{"--log-level", options.worker_log_level}, logger);
        Supervisor::TaskSupervisor supervisor(options.config, launcher, logger);
        if (!supervisor.wait_until_available(ready_timeout)) {
            logger->error("Worker did not become available (state " +
                          std::string(Supervisor::to_string(supervisor.state())) + "); see " +
                          supervisor.get_log_file_path().string());
            return 3;
        }

        // --- Stage 4: Run the requested task ---
        TaskClient client(supervisor);
        int rc = 1;
        try {
            rc = run_command(request, client);
        } catch (const TaskFailedError& e) {
            std::cerr << "Task failed";
            if (e.code()) std::cerr << " (code " << *e.code() << ")";
            std::cerr << ": " << e.what() << std::endl;
            rc = 1;
        }
        client.dispose();
        return rc;
    } catch (const std::exception& e) {
        logger->critical(std::string("systask error: ") + e.what());
        return 1;
    }
}
