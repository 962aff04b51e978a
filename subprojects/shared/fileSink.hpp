/**
 * \file fileSink.hpp
 * \brief Session log file sink and helpers for reading log files back.
 * \details Each line has the form `[ISO-timestamp] [ROLE PID:n] [LEVEL] message`.
 * The file is opened once, appended to, and flushed after every line.
 */
#pragma once

#include "logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/** \brief Appends timestamped, role-tagged lines to a single session log file. */
class FileSink : public LogSink {
public:
    /**
     * \brief Open (create) `path` for appending.
     * \param path Log file path; parent directories are created.
     * \param role Role tag used by `log()` (e.g. MAIN).
     * \param pid Process id used by `log()`.
     * \throws std::runtime_error if the file cannot be opened.
     */
    FileSink(std::filesystem::path path, std::string role, int pid);

    void log(LogLevel level, const std::string& message) override;

    /** \brief Write a line on behalf of another process (e.g. captured worker output). */
    void write_record(LogLevel level, std::string_view role, int pid, std::string_view message);

    const std::filesystem::path& path() const { return path_; }

    /** \brief `worker-<UTC stamp>-<pid>.log` inside `dir`, with a `-<n>` suffix if that name is taken. */
    static std::filesystem::path make_session_path(const std::filesystem::path& dir, int pid);

    static std::string format_line(std::chrono::system_clock::time_point when, LogLevel level,
                                   std::string_view role, int pid, std::string_view message);

private:
    std::filesystem::path path_;
    std::string role_;
    int pid_;
    std::mutex mutex_;
    std::ofstream out_;
};

/** \brief Read-side helpers for session log files. */
class LogFiles {
public:
    /** \brief Last `count` non-empty lines of `path`, oldest first. Empty if the file is missing. */
    static std::vector<std::string> read_recent_lines(const std::filesystem::path& path, size_t count);

    /** \brief All non-empty lines of `path`. */
    static std::vector<std::string> read_all_lines(const std::filesystem::path& path);

    /** \brief Most recently modified `worker-*.log` in `dir`, if any. */
    static std::optional<std::filesystem::path> find_latest(const std::filesystem::path& dir);

    /** \brief Level token of a formatted line (third bracket group), if present. */
    static std::optional<LogLevel> level_of(std::string_view line);
};
