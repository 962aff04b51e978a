/**
 * \file logviewer/LogViewer.cpp
 * \brief Implementation of the session log viewer.
 */
#include "LogViewer.hpp"
#include "fileSink.hpp"

#include <charconv>
#include <system_error>
#include <fstream>
#include <thread>

namespace SysTask::Logs {

namespace {

constexpr std::string_view reset_colour = "\x1b[0m";
constexpr std::size_t rule_width = 80;

std::string_view colour_of(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
        case LogLevel::Critical: return "\x1b[31m";
        case LogLevel::Warning:  return "\x1b[33m";
        case LogLevel::Info:     return "\x1b[32m";
        case LogLevel::Debug:    return "\x1b[36m";
    }
    return {};
}

} // namespace

ViewRequest parse_view_argument(std::string_view argument) {
    ViewRequest request;
    if (argument == "all") {
        request.mode = ViewRequest::Mode::All;
    } else if (argument == "watch" || argument == "tail" || argument == "follow") {
        request.mode = ViewRequest::Mode::Watch;
    } else {
        std::size_t count = 0;
        auto [ptr, ec] = std::from_chars(argument.data(), argument.data() + argument.size(), count);
        if (ec == std::errc() && ptr == argument.data() + argument.size() && count > 0) {
            request.lines = count;
        }
    }
    return request;
}

std::string colorize(std::string_view line) {
    auto level = LogFiles::level_of(line);
    if (!level) return std::string(line);
    std::string out(colour_of(*level));
    out += line;
    out += reset_colour;
    return out;
}

LogViewer::LogViewer(std::filesystem::path log_dir, std::ostream& out)
    : log_dir_(std::move(log_dir)), out_(out) {}

std::optional<std::filesystem::path> LogViewer::locate() {
    std::error_code ec;
    if (!std::filesystem::is_directory(log_dir_, ec)) {
        out_ << "No logs directory found at " << log_dir_.string() << ". Start systask to generate logs." << std::endl;
        return std::nullopt;
    }
    auto latest = LogFiles::find_latest(log_dir_);
    if (!latest) {
        out_ << "No session logs in " << log_dir_.string() << ". Start systask to generate logs." << std::endl;
    }
    return latest;
}

void LogViewer::show(const std::filesystem::path& file, std::optional<std::size_t> count) {
    auto all = LogFiles::read_all_lines(file);
    std::size_t first = 0;
    if (count && *count < all.size()) first = all.size() - *count;

    out_ << "Worker process logs (last " << (all.size() - first) << " lines)\n";
    out_ << "File: " << file.string() << "\n";
    out_ << std::string(rule_width, '-') << "\n";
    for (std::size_t i = first; i < all.size(); ++i) {
        out_ << colorize(all[i]) << "\n";
    }
    out_ << std::string(rule_width, '-') << "\n";
    out_ << "Total lines in file: " << all.size() << std::endl;
}

void LogViewer::watch(const std::filesystem::path& file, const std::atomic<bool>& stop, std::chrono::milliseconds interval) {
    out_ << "Watching logs: " << file.string() << "\nPress Ctrl+C to stop...\n" << std::endl;
    std::uintmax_t offset = 0;
    std::string partial;
    while (!stop.load(std::memory_order_relaxed)) {
        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        if (!ec && size < offset) {
            // Replaced by a new file of the same name
            offset = 0;
            partial.clear();
        }
        if (!ec && size > offset) {
            std::ifstream in(file, std::ios::binary);
            if (in) {
                in.seekg(static_cast<std::streamoff>(offset));
                std::string chunk(static_cast<std::size_t>(size - offset), '\0');
                in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                chunk.resize(static_cast<std::size_t>(in.gcount()));
                offset += chunk.size();
                partial += chunk;
                std::size_t start = 0;
                for (auto nl = partial.find('\n'); nl != std::string::npos; nl = partial.find('\n', start)) {
                    std::string_view line(partial.data() + start, nl - start);
                    if (line.find_first_not_of(" \t\r") != std::string_view::npos) out_ << colorize(line) << "\n";
                    start = nl + 1;
                }
                partial.erase(0, start);
                out_ << std::flush;
            }
        }
        std::this_thread::sleep_for(interval);
    }
}

void LogViewer::print_usage() {
    out_ << "\nUsage:\n"
         << "  systask-logs [lines]    Show the last N lines (default: 50)\n"
         << "  systask-logs all        Show all lines\n"
         << "  systask-logs watch      Follow the log as it grows\n";
}

} // namespace SysTask::Logs
