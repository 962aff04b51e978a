#include "supervisor/TaskSupervisor.hpp"
#include "FakeWorkerLauncher.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <regex>

using namespace SysTask;
using namespace SysTask::Supervisor;
using namespace std::chrono_literals;
using systask_test::FakeWorkerLauncher;
using systask_test::TempDir;
using systask_test::wait_for;

namespace {

Ipc::Message echo_reply(const Ipc::ExecuteTaskMessage& request) {
    if (request.task_name == "fail") {
        return Ipc::TaskErrorMessage{request.task_id, "handler failed", 100};
    }
    return Ipc::TaskCompleteMessage{request.task_id, "done:" + request.task_name};
}

TaskResult get(std::future<TaskResult>& future, std::chrono::milliseconds timeout = 3000ms) {
    if (future.wait_for(timeout) != std::future_status::ready) {
        ADD_FAILURE() << "task did not resolve in time";
        return TaskResult::failed(TaskFailureKind::None, "unresolved");
    }
    return future.get();
}

bool any_line_contains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

} // namespace

class TaskSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);
        config.log_dir = logs.path();
        config.default_timeout = 2000ms;
        config.restart = RestartPolicy{5, 20ms, 100ms};
    }

    std::unique_ptr<TaskSupervisor> start(bool wait_ready = true) {
        auto supervisor = std::make_unique<TaskSupervisor>(config, launcher, logger);
        if (wait_ready) {
            EXPECT_TRUE(supervisor->wait_until_available(2s));
        }
        return supervisor;
    }

    TempDir logs{"systask-supervisor-test"};
    SupervisorConfig config;
    std::shared_ptr<FakeWorkerLauncher> launcher = std::make_shared<FakeWorkerLauncher>();
    std::shared_ptr<Logger> logger = std::make_shared<Logger>("supervisor-test");
    std::shared_ptr<VectorSink> sink = std::make_shared<VectorSink>();
};

TEST_F(TaskSupervisorTest, BecomesAvailableOnWorkerReady) {
    auto supervisor = start();
    EXPECT_EQ(supervisor->state(), WorkerState::Running);
    EXPECT_EQ(supervisor->worker_pid(), 4242);
    EXPECT_EQ(supervisor->worker_tasks(), (std::vector<std::string>{"install-deb", "manage-service"}));
    EXPECT_EQ(launcher->launch_count(), 1u);
}

TEST_F(TaskSupervisorTest, ResolvesWithWorkerReply) {
    launcher->set_responder(echo_reply);
    auto supervisor = start();

    auto future = supervisor->execute("install-package", {"curl"});
    auto result = get(future);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.data, "done:install-package");
    EXPECT_EQ(result.failure, TaskFailureKind::None);

    auto requests = launcher->latest()->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(std::regex_match(requests[0].task_id, std::regex(R"(task-1-\d+)")));
    EXPECT_EQ(requests[0].args, nlohmann::json::array({"curl"}));
    EXPECT_EQ(supervisor->pending_count(), 0u);
}

TEST_F(TaskSupervisorTest, TaskErrorCarriesCode) {
    launcher->set_responder(echo_reply);
    auto supervisor = start();
    auto future = supervisor->execute("fail");
    auto result = get(future);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, TaskFailureKind::TaskError);
    EXPECT_EQ(result.error, "handler failed");
    EXPECT_EQ(result.code, 100);
}

TEST_F(TaskSupervisorTest, RepliesAreMatchedById) {
    auto supervisor = start();
    auto first = supervisor->execute("install-deb", {"/tmp/a.deb"});
    auto second = supervisor->execute("install-deb", {"/tmp/b.deb"});
    auto worker = launcher->latest();
    ASSERT_TRUE(wait_for([&]() { return worker->requests().size() == 2; }));
    auto requests = worker->requests();
    EXPECT_NE(requests[0].task_id, requests[1].task_id);

    worker->deliver(Ipc::TaskCompleteMessage{requests[1].task_id, "second"});
    worker->deliver(Ipc::TaskCompleteMessage{requests[0].task_id, "first"});
    EXPECT_EQ(get(first).data, "first");
    EXPECT_EQ(get(second).data, "second");
}

TEST_F(TaskSupervisorTest, TimesOutNoEarlierThanConfigured) {
    auto supervisor = start();
    auto started = std::chrono::steady_clock::now();
    auto future = supervisor->execute_with_options("update-system", ExecuteOptions{150ms});
    auto result = get(future);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.failure, TaskFailureKind::Timeout);
    EXPECT_EQ(result.error, "Task timeout");
    EXPECT_EQ(result.code, -1);
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 1500ms);
    EXPECT_EQ(supervisor->pending_count(), 0u);
    EXPECT_EQ(supervisor->pending_timer_count(), 0u);
}

TEST_F(TaskSupervisorTest, LateReplyIsDiscarded) {
    auto supervisor = start();
    auto future = supervisor->execute_with_options("update-system", ExecuteOptions{50ms});
    EXPECT_EQ(get(future).failure, TaskFailureKind::Timeout);

    auto worker = launcher->latest();
    auto task_id = worker->requests().at(0).task_id;
    worker->deliver(Ipc::TaskCompleteMessage{task_id, "too late"});
    EXPECT_TRUE(wait_for([&]() { return sink->contains("discarding reply for unknown task " + task_id); }));
    EXPECT_TRUE(supervisor->is_available());
}

TEST_F(TaskSupervisorTest, SendFailureIsTransportError) {
    auto supervisor = start();
    launcher->latest()->close_channel();
    auto future = supervisor->execute("check-disk-space");
    auto result = get(future);
    EXPECT_EQ(result.failure, TaskFailureKind::Transport);
    EXPECT_EQ(result.error.rfind("Cannot send task to worker", 0), 0u);
    EXPECT_EQ(supervisor->pending_timer_count(), 0u);
}

TEST_F(TaskSupervisorTest, RejectsMalformedCalls) {
    auto supervisor = start();
    EXPECT_THROW(supervisor->execute(""), std::invalid_argument);
    EXPECT_THROW(supervisor->execute("install-deb", nlohmann::json::object()), std::invalid_argument);
    EXPECT_THROW(supervisor->execute_async("install-deb", nlohmann::json::array(), {}, nullptr), std::invalid_argument);
}

TEST_F(TaskSupervisorTest, NullCollaboratorsAreRejected) {
    EXPECT_THROW(TaskSupervisor(config, nullptr, logger), std::invalid_argument);
    EXPECT_THROW(TaskSupervisor(config, launcher, nullptr), std::invalid_argument);
}

TEST_F(TaskSupervisorTest, DisposeFailsOutstandingTasks) {
    auto supervisor = start();
    auto first = supervisor->execute("update-system");
    auto second = supervisor->execute("check-disk-space");
    ASSERT_TRUE(wait_for([&]() { return supervisor->pending_count() == 2; }));

    supervisor->dispose();
    for (auto* future : {&first, &second}) {
        auto result = get(*future, 100ms);
        EXPECT_EQ(result.failure, TaskFailureKind::Shutdown);
        EXPECT_EQ(result.error, "Task executor shutting down");
    }
    EXPECT_EQ(supervisor->state(), WorkerState::Terminated);
    EXPECT_EQ(supervisor->pending_count(), 0u);
    EXPECT_EQ(supervisor->pending_timer_count(), 0u);
    EXPECT_FALSE(supervisor->is_available());

    EXPECT_NO_THROW(supervisor->dispose());
    auto after = supervisor->execute("check-disk-space");
    ASSERT_EQ(after.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(after.get().failure, TaskFailureKind::Shutdown);
}

TEST_F(TaskSupervisorTest, CrashedWorkerIsRestarted) {
    auto supervisor = start();
    launcher->set_responder(echo_reply);
    launcher->latest()->exit_with(ExitStatus{0, SIGKILL, true});

    ASSERT_TRUE(wait_for([&]() { return launcher->launch_count() == 2 && supervisor->is_available(); }));
    EXPECT_EQ(supervisor->restart_attempts(), 0);
    EXPECT_EQ(supervisor->worker_pid(), 4243);
    EXPECT_TRUE(sink->contains("restarting worker in 20 ms (attempt 1 of 5)"));

    auto future = supervisor->execute("install-deb", {"/tmp/x.deb"});
    EXPECT_EQ(get(future).data, "done:install-deb");
}

TEST_F(TaskSupervisorTest, CleanExitDoesNotRestart) {
    auto supervisor = start();
    launcher->latest()->exit_with(ExitStatus{0, 0, false});
    ASSERT_TRUE(wait_for([&]() { return supervisor->state() == WorkerState::Absent; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(launcher->launch_count(), 1u);

    auto future = supervisor->execute("check-disk-space");
    auto result = get(future);
    EXPECT_EQ(result.failure, TaskFailureKind::Unavailable);
    EXPECT_EQ(result.error, "worker unavailable");
}

TEST_F(TaskSupervisorTest, CoolsDownAfterRestartBudget) {
    launcher->crash_on_launch = true;
    auto supervisor = start(false);

    ASSERT_TRUE(wait_for([&]() { return supervisor->state() == WorkerState::CooledDown; }));
    // Initial launch plus five restarts
    EXPECT_EQ(launcher->launch_count(), 6u);
    auto times = launcher->launch_times();
    for (size_t i = 1; i < times.size(); ++i) {
        EXPECT_GE(times[i] - times[i - 1], config.restart.delay_for(static_cast<int>(i))) << "restart " << i;
    }
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(launcher->launch_count(), 6u);
    EXPECT_TRUE(sink->contains("cooling down"));

    auto future = supervisor->execute("check-disk-space");
    auto result = get(future);
    EXPECT_EQ(result.failure, TaskFailureKind::Unavailable);
    EXPECT_NE(result.error.find("cooldown"), std::string::npos);

    launcher->crash_on_launch = false;
    supervisor->restart_worker();
    EXPECT_TRUE(supervisor->wait_until_available(2s));
    EXPECT_EQ(supervisor->restart_attempts(), 0);
}

TEST_F(TaskSupervisorTest, InitialSpawnFailureLeavesWorkerAbsent) {
    launcher->fail_launch = true;
    auto supervisor = start(false);
    EXPECT_EQ(supervisor->state(), WorkerState::Absent);
    EXPECT_FALSE(supervisor->wait_until_available(100ms));
    EXPECT_EQ(launcher->launch_count(), 1u);

    auto future = supervisor->execute("check-disk-space");
    EXPECT_EQ(get(future).failure, TaskFailureKind::Unavailable);

    launcher->fail_launch = false;
    supervisor->restart_worker();
    EXPECT_TRUE(supervisor->wait_until_available(2s));
}

TEST_F(TaskSupervisorTest, SpawnFailureDuringRestartCountsAsAttempt) {
    auto supervisor = start();
    launcher->fail_launch = true;
    launcher->latest()->exit_with(ExitStatus{1, 0, false});

    ASSERT_TRUE(wait_for([&]() { return supervisor->state() == WorkerState::CooledDown; }));
    EXPECT_EQ(launcher->launch_count(), 6u);
    EXPECT_TRUE(sink->contains("failed to spawn worker: fake launch failure"));
}

TEST_F(TaskSupervisorTest, WorkerOutputIsWrittenToSessionLog) {
    auto supervisor = start();
    auto worker = launcher->latest();
    worker->emit_output(OutputStream::Stdout, "[WARNING] disk almost full");
    worker->emit_output(OutputStream::Stdout, "plain stdout line");
    worker->emit_output(OutputStream::Stderr, "something broke");

    const std::string tag = "[WORKER PID:" + std::to_string(worker->pid()) + "] ";
    ASSERT_TRUE(wait_for([&]() { return any_line_contains(supervisor->get_recent_logs(), "something broke"); }));
    auto lines = supervisor->get_recent_logs();
    EXPECT_TRUE(any_line_contains(lines, tag + "[WARNING] disk almost full"));
    EXPECT_TRUE(any_line_contains(lines, tag + "[INFO] plain stdout line"));
    EXPECT_TRUE(any_line_contains(lines, tag + "[ERROR] something broke"));
    EXPECT_TRUE(any_line_contains(lines, "[MAIN PID:" + std::to_string(ProcessUtils::current_pid()) + "] [INFO]"));

    auto tail = supervisor->get_recent_logs(2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_NE(tail.back().find("something broke"), std::string::npos);
}

TEST_F(TaskSupervisorTest, SessionLogIsNamedAfterStartTimeAndPid) {
    auto supervisor = start(false);
    auto path = supervisor->get_log_file_path();
    EXPECT_EQ(path.parent_path(), logs.path());
    EXPECT_TRUE(std::regex_match(path.filename().string(),
                                 std::regex(R"(worker-\d{8}T\d{6}Z-)" + std::to_string(ProcessUtils::current_pid()) + R"(\.log)")));
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(TaskSupervisorTest, SupervisorsSharingALoggerKeepSeparateSessionFiles) {
    auto first = start();
    auto second = std::make_unique<TaskSupervisor>(config, std::make_shared<FakeWorkerLauncher>(), logger);
    ASSERT_TRUE(second->wait_until_available(2s));

    const auto first_path = first->get_log_file_path();
    const auto second_path = second->get_log_file_path();
    ASSERT_NE(first_path, second_path);

    auto first_lines = LogFiles::read_all_lines(first_path);
    auto second_lines = LogFiles::read_all_lines(second_path);
    EXPECT_TRUE(any_line_contains(first_lines, "session log " + first_path.string()));
    EXPECT_FALSE(any_line_contains(first_lines, "session log " + second_path.string()));
    EXPECT_TRUE(any_line_contains(second_lines, "session log " + second_path.string()));
    EXPECT_FALSE(any_line_contains(second_lines, "session log " + first_path.string()));

    // The shared logger still sees both
    EXPECT_TRUE(sink->contains("session log " + first_path.string()));
    EXPECT_TRUE(sink->contains("session log " + second_path.string()));

    first.reset();
    second.reset();
    logger->info("logged after both supervisors are gone");
    EXPECT_FALSE(any_line_contains(LogFiles::read_all_lines(first_path), "after both supervisors"));
    EXPECT_FALSE(any_line_contains(LogFiles::read_all_lines(second_path), "after both supervisors"));
    EXPECT_TRUE(sink->contains("after both supervisors"));
}

TEST(RestartPolicyTest, DelayGrowsLinearlyAndIsCapped) {
    RestartPolicy policy;
    EXPECT_EQ(policy.delay_for(1), 1000ms);
    EXPECT_EQ(policy.delay_for(3), 3000ms);
    EXPECT_EQ(policy.delay_for(5), 5000ms);
    EXPECT_EQ(policy.delay_for(20), 10000ms);
    EXPECT_FALSE(policy.exhausted(5));
    EXPECT_TRUE(policy.exhausted(6));
}
