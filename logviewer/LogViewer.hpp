/**
 * \file logviewer/LogViewer.hpp
 * \brief Terminal viewer for supervisor session logs.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace SysTask::Logs {

/** \brief What the viewer was asked to show. */
struct ViewRequest {
    enum class Mode { Tail, All, Watch };
    Mode mode{Mode::Tail};
    std::size_t lines{50};
};

/**
 * \brief Interpret the positional argument: a line count, `all`, or
 * `watch` / `tail` / `follow`. Anything else falls back to the last 50 lines.
 */
ViewRequest parse_view_argument(std::string_view argument);

/** \brief Wrap `line` in the ANSI colour of its level token; unchanged when it has none. */
std::string colorize(std::string_view line);

class LogViewer {
public:
    LogViewer(std::filesystem::path log_dir, std::ostream& out);

    /** \brief Newest `worker-*.log`, or nullopt after printing a hint. */
    std::optional<std::filesystem::path> locate();

    /** \brief Print the last `count` lines (all when nullopt), then the total line count. */
    void show(const std::filesystem::path& file, std::optional<std::size_t> count);

    /**
     * \brief Print lines appended to `file` until `stop` is set, checking every `interval`.
     * \details Starts from the beginning of the file.
     */
    void watch(const std::filesystem::path& file, const std::atomic<bool>& stop,
               std::chrono::milliseconds interval = std::chrono::seconds(1));

    void print_usage();

private:
    std::filesystem::path log_dir_;
    std::ostream& out_;
};

} // namespace SysTask::Logs
