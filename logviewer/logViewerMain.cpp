// logViewerMain.cpp - Prints or follows the newest supervisor session log.
#include "LogViewer.hpp"
#include <options/Options.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

static std::string g_log_dir = "logs";
static std::string g_view_argument;

int main(int argc, char* argv[]) {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        if (j.contains("logs") && j["logs"].is_object() && j["logs"].contains("log_dir") && j["logs"]["log_dir"].is_string()) {
            g_log_dir = j["logs"]["log_dir"].get<std::string>();
        } else if (j.contains("supervisor") && j["supervisor"].is_object() && j["supervisor"].contains("log_dir") &&
                   j["supervisor"]["log_dir"].is_string()) {
            g_log_dir = j["supervisor"]["log_dir"].get<std::string>();
        }
        app.add_option("--log-dir", g_log_dir, "Directory holding session logs")->group("Logs");
        app.add_option("view", g_view_argument, "Line count, 'all', or 'watch'");
    });

    std::string opts_err;
    auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err, "systask-logs");
    if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
        return 0;
    } else if (parse_res == shared_opts::Options::ParseResult::Error) {
        std::cerr << "Failed to parse options: " << opts_err << std::endl;
        return 2;
    }

    try {
        std::cout << "systask log viewer\n" << std::endl;
        SysTask::Logs::LogViewer viewer(g_log_dir, std::cout);
        auto file = viewer.locate();
        if (!file) return 0;

        auto request = SysTask::Logs::parse_view_argument(g_view_argument);
        switch (request.mode) {
            case SysTask::Logs::ViewRequest::Mode::Watch:
                std::signal(SIGINT, signal_handler);
                std::signal(SIGTERM, signal_handler);
                viewer.watch(*file, shutdown_requested);
                std::cout << "\nGoodbye!" << std::endl;
                break;
            case SysTask::Logs::ViewRequest::Mode::All:
                viewer.show(*file, std::nullopt);
                break;
            case SysTask::Logs::ViewRequest::Mode::Tail:
                viewer.show(*file, request.lines);
                viewer.print_usage();
                break;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error reading log file: " << e.what() << std::endl;
        return 1;
    }
}
