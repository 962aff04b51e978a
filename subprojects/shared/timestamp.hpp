#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T09:30:12.045Z.
inline std::string format_iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto since_epoch = tp.time_since_epoch();
    const auto secs = duration_cast<seconds>(since_epoch);
    auto millis = duration_cast<milliseconds>(since_epoch - secs).count();
    if (millis < 0) millis += 1000;
    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    return buf;
}

inline std::string format_iso8601_utc() {
    return format_iso8601_utc(std::chrono::system_clock::now());
}

// Compact form safe for file names, e.g. 20240501T093012Z.
inline std::string format_compact_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[24];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}
