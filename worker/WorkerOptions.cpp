/**
 * \file worker/WorkerOptions.cpp
 * \brief Implementation of worker CLI and configuration option helpers.
 */

#include "WorkerOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>
#include <cstdlib>
#include <optional>
#include <string>

namespace SysTask { namespace worker_opts {

/// Cached channel descriptor from CLI, config or environment.
static std::optional<int> g_channel_fd;
/// Cached stdout log level.
static std::optional<std::string> g_log_level;
/// Cached default command timeout.
static std::optional<long long> g_command_timeout_ms;
/// Cached default output cap.
static std::optional<long long> g_max_output_bytes;

std::optional<int> get_channel_fd() { return g_channel_fd; }
std::optional<std::string> get_log_level() { return g_log_level; }
std::optional<long long> get_command_timeout_ms() { return g_command_timeout_ms; }
std::optional<long long> get_max_output_bytes() { return g_max_output_bytes; }

void register_options() {
    static std::atomic<bool> registered{false};
    if (registered.exchange(true)) return;

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        int fd_default = 3;
        if (const char* env = std::getenv(channel_fd_env)) {
            fd_default = std::atoi(env);
        }
        std::string level_default = "info";
        long long timeout_default = 30000;
        long long max_output_default = 10LL * 1024 * 1024;
        if (j.contains("worker") && j["worker"].is_object()) {
            const auto& w = j["worker"];
            if (w.contains("log_level") && w["log_level"].is_string()) level_default = w["log_level"].get<std::string>();
            if (w.contains("command_timeout_ms") && w["command_timeout_ms"].is_number_integer()) timeout_default = w["command_timeout_ms"].get<long long>();
            if (w.contains("max_output_bytes") && w["max_output_bytes"].is_number_integer()) max_output_default = w["max_output_bytes"].get<long long>();
        }
        g_channel_fd = fd_default;
        g_log_level = level_default;
        g_command_timeout_ms = timeout_default;
        g_max_output_bytes = max_output_default;

        app.add_option("--channel-fd", g_channel_fd, "Descriptor of the supervisor channel (default from SYSTASK_CHANNEL_FD)")
            ->group("Worker");
        app.add_option("--log-level", g_log_level, "Minimum log level: debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}))
            ->group("Worker");
        app.add_option("--command-timeout-ms", g_command_timeout_ms, "Default per-command timeout")
            ->check(CLI::PositiveNumber)
            ->group("Worker");
        app.add_option("--max-output-bytes", g_max_output_bytes, "Default cap on combined stdout/stderr per command")
            ->check(CLI::PositiveNumber)
            ->group("Worker");
    });
}

WorkerOptions resolve() {
    WorkerOptions opts;
    opts.channel_fd = g_channel_fd.value_or(3);
    opts.log_level = parse_log_level(g_log_level.value_or("info")).value_or(LogLevel::Info);
    opts.command.timeout = std::chrono::milliseconds(g_command_timeout_ms.value_or(30000));
    opts.command.max_output_bytes = static_cast<std::size_t>(g_max_output_bytes.value_or(10LL * 1024 * 1024));
    return opts;
}

} } // namespace SysTask::worker_opts
