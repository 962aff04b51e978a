#include "fileSink.hpp"
#include "timestamp.hpp"

#include <deque>
#include <iterator>
#include <stdexcept>
#include <system_error>

FileSink::FileSink(std::filesystem::path path, std::string role, int pid)
    : path_(std::move(path)), role_(std::move(role)), pid_(pid) {
    min_level_ = LogLevel::Debug;
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("FileSink: cannot create log directory " +
                                     path_.parent_path().string() + ": " + ec.message());
        }
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("FileSink: cannot open log file " + path_.string());
    }
}

void FileSink::log(LogLevel level, const std::string& message) {
    write_record(level, role_, pid_, message);
}

void FileSink::write_record(LogLevel level, std::string_view role, int pid, std::string_view message) {
    if (level < min_level_) return;
    auto line = format_line(std::chrono::system_clock::now(), level, role, pid, message);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

std::filesystem::path FileSink::make_session_path(const std::filesystem::path& dir, int pid) {
    const std::string stem = "worker-" + format_compact_utc(std::chrono::system_clock::now()) + "-" + std::to_string(pid);
    auto path = dir / (stem + ".log");
    // Another session from this process in the same second
    for (int n = 2; std::filesystem::exists(path); ++n) {
        path = dir / (stem + "-" + std::to_string(n) + ".log");
    }
    return path;
}

std::string FileSink::format_line(std::chrono::system_clock::time_point when, LogLevel level,
                                  std::string_view role, int pid, std::string_view message) {
    std::string line;
    line.reserve(message.size() + 64);
    line += '[';
    line += format_iso8601_utc(when);
    line += "] [";
    line += role;
    line += " PID:";
    line += std::to_string(pid);
    line += "] [";
    line += to_string(level);
    line += "] ";
    line += message;
    return line;
}

std::vector<std::string> LogFiles::read_recent_lines(const std::filesystem::path& path, size_t count) {
    if (count == 0) return {};
    std::ifstream in(path);
    if (!in) return {};
    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        window.push_back(std::move(line));
        if (window.size() > count) window.pop_front();
    }
    return {std::make_move_iterator(window.begin()), std::make_move_iterator(window.end())};
}

std::vector<std::string> LogFiles::read_all_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    if (!in) return lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<std::filesystem::path> LogFiles::find_latest(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return std::nullopt;

    std::optional<std::filesystem::path> best;
    std::filesystem::file_time_type best_time{};
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        const auto name = entry.path().filename().string();
        if (name.rfind("worker-", 0) != 0 || entry.path().extension() != ".log") continue;
        std::error_code time_ec;
        auto mtime = entry.last_write_time(time_ec);
        if (time_ec) continue;
        if (!best || mtime > best_time) {
            best = entry.path();
            best_time = mtime;
        }
    }
    return best;
}

std::optional<LogLevel> LogFiles::level_of(std::string_view line) {
    // [timestamp] [ROLE PID:n] [LEVEL] ...
    size_t pos = 0;
    for (int group = 0; group < 3; ++group) {
        auto open = line.find('[', pos);
        if (open == std::string_view::npos) return std::nullopt;
        auto close = line.find(']', open);
        if (close == std::string_view::npos) return std::nullopt;
        if (group == 2) return parse_log_level(line.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
    return std::nullopt;
}
