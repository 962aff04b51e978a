#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

// Accepts both the upper-case tokens written by sinks and lower-case CLI spellings.
inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "CRITICAL") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

// Writes `[LEVEL] message` to stdout. The supervisor recognizes the level token
// when it captures a worker's stdout.
class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << to_string(level) << "] " << message << std::endl;
    }
private:
    std::mutex mutex_;
};

class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << message;
        lines_.push_back(oss.str());
    }

    // True if any captured line contains `needle`.
    bool contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

class Logger {
public:
    Logger() : name_("Default") {}

    Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        std::vector<std::shared_ptr<LogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sinks = sinks_;
        }
        for (const auto& sink : sinks) {
            sink->log(level, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

// Passes every record on to another logger, whose sinks do their own filtering.
class ForwardingSink : public LogSink {
public:
    explicit ForwardingSink(std::shared_ptr<Logger> target) : target_(std::move(target)) {
        min_level_ = LogLevel::Debug;
    }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        target_->log(level, message);
    }
private:
    std::shared_ptr<Logger> target_;
};
