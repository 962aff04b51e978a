/**
 * \file supervisor/SupervisorOptions.cpp
 * \brief Implementation of supervisor CLI and configuration option helpers.
 */

#include "SupervisorOptions.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>

namespace SysTask { namespace supervisor_opts {

static std::optional<std::string> g_worker_path;
static std::optional<std::string> g_log_dir;
static std::optional<long long> g_task_timeout_ms;
static std::optional<int> g_max_restarts;
static std::optional<long long> g_restart_delay_ms;
static std::optional<long long> g_max_restart_delay_ms;
static std::optional<std::string> g_worker_log_level;
/// True when the log directory came from the config file rather than the command line.
static bool g_log_dir_from_config = false;

std::optional<std::string> get_worker_path() { return g_worker_path; }
std::optional<std::string> get_log_dir() { return g_log_dir; }
std::optional<long long> get_task_timeout_ms() { return g_task_timeout_ms; }
std::optional<int> get_max_restarts() { return g_max_restarts; }
std::optional<long long> get_restart_delay_ms() { return g_restart_delay_ms; }
std::optional<long long> get_max_restart_delay_ms() { return g_max_restart_delay_ms; }
std::optional<std::string> get_worker_log_level() { return g_worker_log_level; }

std::filesystem::path default_worker_path() {
    return ProcessUtils::get_executable_dir() / "systask-worker";
}

void register_options() {
    static std::atomic<bool> registered{false};
    if (registered.exchange(true)) return;

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::string worker_path_default = default_worker_path().string();
        std::string log_dir_default = "logs";
        long long timeout_default = 30000;
        int max_restarts_default = 5;
        long long delay_default = 1000;
        long long max_delay_default = 10000;
        std::string worker_level_default = "info";
        g_log_dir_from_config = false;
        if (j.contains("supervisor") && j["supervisor"].is_object()) {
            const auto& s = j["supervisor"];
            if (s.contains("worker_path") && s["worker_path"].is_string()) worker_path_default = s["worker_path"].get<std::string>();
            if (s.contains("log_dir") && s["log_dir"].is_string()) {
                log_dir_default = s["log_dir"].get<std::string>();
                g_log_dir_from_config = true;
            }
            if (s.contains("task_timeout_ms") && s["task_timeout_ms"].is_number_integer()) timeout_default = s["task_timeout_ms"].get<long long>();
            if (s.contains("max_restarts") && s["max_restarts"].is_number_integer()) max_restarts_default = s["max_restarts"].get<int>();
            if (s.contains("restart_delay_ms") && s["restart_delay_ms"].is_number_integer()) delay_default = s["restart_delay_ms"].get<long long>();
            if (s.contains("max_restart_delay_ms") && s["max_restart_delay_ms"].is_number_integer()) max_delay_default = s["max_restart_delay_ms"].get<long long>();
            if (s.contains("worker_log_level") && s["worker_log_level"].is_string()) worker_level_default = s["worker_log_level"].get<std::string>();
        }
        g_worker_path = worker_path_default;
        g_log_dir = log_dir_default;
        g_task_timeout_ms = timeout_default;
        g_max_restarts = max_restarts_default;
        g_restart_delay_ms = delay_default;
        g_max_restart_delay_ms = max_delay_default;
        g_worker_log_level = worker_level_default;

        app.add_option("--worker-path", g_worker_path, "Worker executable (default: systask-worker next to this program)")
            ->group("Supervisor");
        app.add_option_function<std::string>("--log-dir", [](const std::string& dir) {
                g_log_dir = dir;
                g_log_dir_from_config = false;
            }, "Directory for session log files")
            ->group("Supervisor");
        app.add_option("--task-timeout-ms", g_task_timeout_ms, "Default time to wait for a task reply")
            ->check(CLI::PositiveNumber)
            ->group("Supervisor");
        app.add_option("--max-restarts", g_max_restarts, "Consecutive failed restarts before cooldown")
            ->check(CLI::NonNegativeNumber)
            ->group("Supervisor");
        app.add_option("--restart-delay-ms", g_restart_delay_ms, "Restart delay per attempt")
            ->check(CLI::PositiveNumber)
            ->group("Supervisor");
        app.add_option("--max-restart-delay-ms", g_max_restart_delay_ms, "Upper bound for the restart delay")
            ->check(CLI::PositiveNumber)
            ->group("Supervisor");
        app.add_option("--worker-log-level", g_worker_log_level, "Minimum level the worker logs: debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}))
            ->group("Supervisor");
    });
}

SupervisorOptions resolve() {
    SupervisorOptions opts;
    opts.worker_path = g_worker_path.value_or(default_worker_path().string());
    std::filesystem::path log_dir = g_log_dir.value_or("logs");
    if (g_log_dir_from_config && log_dir.is_relative()) {
        if (auto dir = shared_opts::Options::get_config_dir()) log_dir = *dir / log_dir;
    }
    opts.config.log_dir = log_dir;
    opts.config.default_timeout = std::chrono::milliseconds(g_task_timeout_ms.value_or(30000));
    opts.config.restart.max_attempts = g_max_restarts.value_or(5);
    opts.config.restart.base_delay = std::chrono::milliseconds(g_restart_delay_ms.value_or(1000));
    opts.config.restart.max_delay = std::chrono::milliseconds(g_max_restart_delay_ms.value_or(10000));
    opts.worker_log_level = g_worker_log_level.value_or("info");
    return opts;
}

} } // namespace SysTask::supervisor_opts
