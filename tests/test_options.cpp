#include "cli/CliOptions.hpp"
#include "supervisor/SupervisorOptions.hpp"
#include "worker/WorkerOptions.hpp"
#include "TestSupport.hpp"
#include <options/Options.hpp>

#include <gtest/gtest.h>
#include <fstream>
#include <initializer_list>

using namespace SysTask;
using namespace std::chrono_literals;
using shared_opts::Options;

namespace {

/// Owns a mutable argv for CLI11.
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) pointers_.push_back(arg.data());
        pointers_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }
private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        worker_opts::register_options();
        supervisor_opts::register_options();
        cli_opts::register_options();
    }

    Options::ParseResult parse(std::initializer_list<std::string> args) {
        Argv argv(args);
        error.clear();
        return Options::load_and_parse(argv.argc(), argv.argv(), error, "systask");
    }

    std::string error;
};

TEST_F(OptionsTest, DefaultsWithoutFlags) {
    ASSERT_EQ(parse({"systask", "disk"}), Options::ParseResult::Ok) << error;
    auto supervisor = supervisor_opts::resolve();
    EXPECT_EQ(supervisor.config.log_dir, std::filesystem::path("logs"));
    EXPECT_EQ(supervisor.config.default_timeout, 30000ms);
    EXPECT_EQ(supervisor.config.restart.max_attempts, 5);
    EXPECT_EQ(supervisor.config.restart.base_delay, 1000ms);
    EXPECT_EQ(supervisor.config.restart.max_delay, 10000ms);
    EXPECT_EQ(supervisor.worker_path.filename(), "systask-worker");
    EXPECT_EQ(supervisor.worker_log_level, "info");

    auto worker = worker_opts::resolve();
    EXPECT_EQ(worker.log_level, LogLevel::Info);
    EXPECT_EQ(worker.command.timeout, 30000ms);
    EXPECT_EQ(worker.command.max_output_bytes, 10u * 1024 * 1024);

    EXPECT_EQ(cli_opts::resolve().command, CliCommand::Disk);
}

TEST_F(OptionsTest, SupervisorFlagsOverrideDefaults) {
    ASSERT_EQ(parse({"systask", "--worker-path", "/opt/systask/worker", "--log-dir", "/var/log/systask",
                     "--task-timeout-ms", "500", "--max-restarts", "2", "--restart-delay-ms", "50",
                     "--max-restart-delay-ms", "80", "--worker-log-level", "debug", "sysinfo"}),
              Options::ParseResult::Ok) << error;
    auto opts = supervisor_opts::resolve();
    EXPECT_EQ(opts.worker_path, std::filesystem::path("/opt/systask/worker"));
    EXPECT_EQ(opts.config.log_dir, std::filesystem::path("/var/log/systask"));
    EXPECT_EQ(opts.config.default_timeout, 500ms);
    EXPECT_EQ(opts.config.restart.max_attempts, 2);
    EXPECT_EQ(opts.config.restart.delay_for(2), 80ms);
    EXPECT_EQ(opts.worker_log_level, "debug");
}

TEST_F(OptionsTest, WorkerFlags) {
    ASSERT_EQ(parse({"systask", "--channel-fd", "7", "--log-level", "warning", "--command-timeout-ms", "1500",
                     "--max-output-bytes", "4096", "disk"}),
              Options::ParseResult::Ok) << error;
    auto opts = worker_opts::resolve();
    EXPECT_EQ(opts.channel_fd, 7);
    EXPECT_EQ(opts.log_level, LogLevel::Warning);
    EXPECT_EQ(opts.command.timeout, 1500ms);
    EXPECT_EQ(opts.command.max_output_bytes, 4096u);
}

TEST_F(OptionsTest, ServiceSubcommandCollectsArguments) {
    ASSERT_EQ(parse({"systask", "service", "nginx", "restart"}), Options::ParseResult::Ok) << error;
    auto request = cli_opts::resolve();
    EXPECT_EQ(request.command, CliCommand::Service);
    EXPECT_EQ(request.args, (std::vector<std::string>{"nginx", "restart"}));
}

TEST_F(OptionsTest, RunSubcommandKeepsTaskNameFirst) {
    ASSERT_EQ(parse({"systask", "run", "manage-service", "ssh", "status"}), Options::ParseResult::Ok) << error;
    auto request = cli_opts::resolve();
    EXPECT_EQ(request.command, CliCommand::Run);
    EXPECT_EQ(request.args, (std::vector<std::string>{"manage-service", "ssh", "status"}));
}

TEST_F(OptionsTest, LogsSubcommandTakesLineCount) {
    ASSERT_EQ(parse({"systask", "logs", "5"}), Options::ParseResult::Ok) << error;
    EXPECT_EQ(cli_opts::resolve().command, CliCommand::Logs);
    EXPECT_EQ(cli_opts::resolve().log_lines, 5u);

    ASSERT_EQ(parse({"systask", "logs"}), Options::ParseResult::Ok) << error;
    EXPECT_EQ(cli_opts::resolve().log_lines, 50u);
}

TEST_F(OptionsTest, ParentFlagsAfterSubcommand) {
    ASSERT_EQ(parse({"systask", "install-package", "curl", "--task-timeout-ms", "900"}), Options::ParseResult::Ok) << error;
    EXPECT_EQ(supervisor_opts::resolve().config.default_timeout, 900ms);
    EXPECT_EQ(cli_opts::resolve().args, (std::vector<std::string>{"curl"}));
}

TEST_F(OptionsTest, RejectsBadCommandLines) {
    EXPECT_EQ(parse({"systask"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"systask", "service", "nginx"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"systask", "--worker-log-level", "loud", "disk"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"systask", "--task-timeout-ms", "-5", "disk"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"systask", "reboot"}), Options::ParseResult::Error);
    EXPECT_FALSE(error.empty());
}

TEST_F(OptionsTest, ConfigFileSuppliesDefaults) {
    systask_test::TempDir dir("systask-options-test");
    auto config = dir.path() / "systask.json";
    {
        std::ofstream out(config);
        out << R"({
            "supervisor": {"log_dir": "session-logs", "task_timeout_ms": 1234, "max_restarts": 2},
            "worker": {"log_level": "error", "command_timeout_ms": 5000},
            "cli": {"log_lines": 20}
        })";
    }

    ASSERT_EQ(parse({"systask", "-c", config.string(), "logs"}), Options::ParseResult::Ok) << error;
    ASSERT_TRUE(Options::get_config_file().has_value());
    EXPECT_EQ(Options::get_config_file()->filename(), "systask.json");

    auto supervisor = supervisor_opts::resolve();
    EXPECT_EQ(supervisor.config.log_dir, dir.path() / "session-logs");
    EXPECT_EQ(supervisor.config.default_timeout, 1234ms);
    EXPECT_EQ(supervisor.config.restart.max_attempts, 2);
    EXPECT_EQ(worker_opts::resolve().log_level, LogLevel::Error);
    EXPECT_EQ(worker_opts::resolve().command.timeout, 5000ms);
    EXPECT_EQ(cli_opts::resolve().log_lines, 20u);

    // A command-line directory is used as given
    ASSERT_EQ(parse({"systask", "-c", config.string(), "--log-dir", "relative-logs", "disk"}), Options::ParseResult::Ok) << error;
    EXPECT_EQ(supervisor_opts::resolve().config.log_dir, std::filesystem::path("relative-logs"));
}

TEST_F(OptionsTest, MissingOrMalformedConfigIsAnError) {
    EXPECT_EQ(parse({"systask", "-c", "/nonexistent/systask.json", "disk"}), Options::ParseResult::Error);
    EXPECT_NE(error.find("cannot open config file"), std::string::npos);

    systask_test::TempDir dir("systask-options-test");
    auto config = dir.path() / "broken.json";
    std::ofstream(config) << "{ not json";
    EXPECT_EQ(parse({"systask", "-c", config.string(), "disk"}), Options::ParseResult::Error);
    EXPECT_NE(error.find("malformed config file"), std::string::npos);
}
