#include "fileSink.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <regex>

using systask_test::TempDir;

TEST(FileSinkTest, FormatsRoleTaggedLine) {
    auto when = std::chrono::system_clock::time_point(std::chrono::milliseconds(1714555812045));
    EXPECT_EQ(FileSink::format_line(when, LogLevel::Warning, "WORKER", 812, "disk almost full"),
              "[2024-05-01T09:30:12.045Z] [WORKER PID:812] [WARNING] disk almost full");
}

TEST(FileSinkTest, SessionPathEmbedsStampAndPid) {
    auto path = FileSink::make_session_path("/var/log/systask", 77);
    EXPECT_EQ(path.parent_path(), std::filesystem::path("/var/log/systask"));
    EXPECT_TRUE(std::regex_match(path.filename().string(), std::regex(R"(worker-\d{8}T\d{6}Z-77\.log)")));
}

TEST(FileSinkTest, AppendsAndReadsBack) {
    TempDir dir("systask-filesink-test");
    auto path = dir.path() / "nested" / "worker-20240501T093012Z-1.log";
    {
        FileSink sink(path, "MAIN", 1);
        sink.log(LogLevel::Debug, "debug is kept");
        sink.log(LogLevel::Info, "first");
        sink.write_record(LogLevel::Error, "WORKER", 2, "from the worker");
    }
    auto lines = LogFiles::read_all_lines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find("[MAIN PID:1] [DEBUG] debug is kept"), std::string::npos);
    EXPECT_NE(lines[2].find("[WORKER PID:2] [ERROR] from the worker"), std::string::npos);

    // Reopening appends
    {
        FileSink sink(path, "MAIN", 1);
        sink.log(LogLevel::Info, "second session");
    }
    EXPECT_EQ(LogFiles::read_all_lines(path).size(), 4u);
}

TEST(FileSinkTest, HonoursMinimumLevel) {
    TempDir dir("systask-filesink-test");
    auto path = dir.path() / "worker-x.log";
    FileSink sink(path, "MAIN", 1);
    sink.set_level(LogLevel::Warning);
    sink.log(LogLevel::Info, "dropped");
    sink.log(LogLevel::Critical, "kept");
    auto lines = LogFiles::read_all_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(LogFiles::level_of(lines[0]), LogLevel::Critical);
}

TEST(FileSinkTest, UnwritableLocationThrows) {
    TempDir dir("systask-filesink-test");
    auto blocker = dir.path() / "not-a-dir";
    std::ofstream(blocker) << "x";
    EXPECT_THROW(FileSink(blocker / "worker.log", "MAIN", 1), std::runtime_error);
}

TEST(LogFilesTest, RecentLinesSkipBlanksAndKeepOrder) {
    TempDir dir("systask-logfiles-test");
    auto path = dir.path() / "worker-a.log";
    std::ofstream(path) << "one\n\ntwo\nthree\n\n";
    EXPECT_EQ(LogFiles::read_recent_lines(path, 2), (std::vector<std::string>{"two", "three"}));
    EXPECT_EQ(LogFiles::read_recent_lines(path, 10).size(), 3u);
    EXPECT_TRUE(LogFiles::read_recent_lines(path, 0).empty());
    EXPECT_TRUE(LogFiles::read_recent_lines(dir.path() / "missing.log", 5).empty());
}

TEST(LogFilesTest, FindLatestPicksNewestSessionLog) {
    TempDir dir("systask-logfiles-test");
    EXPECT_FALSE(LogFiles::find_latest(dir.path() / "absent").has_value());
    EXPECT_FALSE(LogFiles::find_latest(dir.path()).has_value());

    auto older = dir.path() / "worker-20240101T000000Z-1.log";
    auto newer = dir.path() / "worker-20240102T000000Z-2.log";
    std::ofstream(older) << "a\n";
    std::ofstream(newer) << "b\n";
    std::ofstream(dir.path() / "other.log") << "c\n";
    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(older, now - std::chrono::hours(1));
    std::filesystem::last_write_time(newer, now);
    std::filesystem::last_write_time(dir.path() / "other.log", now + std::chrono::hours(1));

    auto latest = LogFiles::find_latest(dir.path());
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->filename(), newer.filename());
}

TEST(LogFilesTest, LevelOfReadsThirdBracketGroup) {
    EXPECT_EQ(LogFiles::level_of("[2024-05-01T09:30:12.045Z] [MAIN PID:1] [ERROR] boom"), LogLevel::Error);
    EXPECT_EQ(LogFiles::level_of("[t] [WORKER PID:2] [DEBUG] x"), LogLevel::Debug);
    EXPECT_FALSE(LogFiles::level_of("[t] [MAIN PID:1] no level").has_value());
    EXPECT_FALSE(LogFiles::level_of("plain text").has_value());
    EXPECT_FALSE(LogFiles::level_of("[t] [MAIN PID:1] [LOUD] x").has_value());
}

TEST(LogLevelTest, ParsesBothSpellings) {
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("Critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_EQ(to_string(LogLevel::Info), "INFO");
}
