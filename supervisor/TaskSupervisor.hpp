/**
 * \file supervisor/TaskSupervisor.hpp
 * \brief Owner of the worker process, the request table and the session log.
 */
#pragma once

#include "PendingRequest.hpp"
#include "RestartPolicy.hpp"
#include "TaskResult.hpp"
#include "WorkerLauncher.hpp"
#include "fileSink.hpp"
#include "logger.hpp"
#include "runtime/CoroIoContext.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace SysTask::Supervisor {

/** \defgroup supervisor_module Task Supervisor
 *  \brief Worker lifecycle, request correlation, timeouts and restarts.
 */

/** \brief Lifecycle of the supervised worker. \ingroup supervisor_module */
enum class WorkerState {
    Absent,       ///< no process (never started, spawn failed, or exited cleanly)
    Starting,     ///< spawned, waiting for worker-ready
    Running,      ///< accepting dispatches
    Restarting,   ///< crashed; restart timer armed
    CooledDown,   ///< restart budget exhausted
    Terminated,   ///< disposed
};

std::string_view to_string(WorkerState state);

/** \brief Supervisor settings. \ingroup supervisor_module */
struct SupervisorConfig {
    std::filesystem::path log_dir{"logs"};
    std::chrono::milliseconds default_timeout{30000};
    RestartPolicy restart{};
};

/** \brief Per-call overrides for `execute_with_options`. */
struct ExecuteOptions {
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * \brief Runs tasks in a supervised worker process.
 * \details All state lives on a private event-loop thread; public methods may be
 * called from any thread and marshal onto it. Every `execute*` call resolves
 * exactly once: with the worker's reply, on timeout, immediately when the worker
 * is unavailable, or with a shutdown failure from `dispose()`.
 * \ingroup supervisor_module
 */
class TaskSupervisor {
public:
    /**
     * \brief Open the session log and spawn the worker.
     * \param config Timeouts, restart policy and log directory.
     * \param launcher Worker spawner.
     * \param logger Receives supervisor logs. The session file is written through a
     *        supervisor-owned logger that also forwards here; `logger` itself is not modified.
     * \throws std::invalid_argument if `launcher` or `logger` is null.
     * \throws std::runtime_error if the session log cannot be created.
     */
    TaskSupervisor(SupervisorConfig config, std::shared_ptr<IWorkerLauncher> launcher, std::shared_ptr<Logger> logger);
    ~TaskSupervisor();

    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    /**
     * \brief Dispatch `task_name` with positional `args` using the default timeout.
     * \throws std::invalid_argument for an empty name or non-array args.
     */
    std::future<TaskResult> execute(std::string task_name, nlohmann::json args = nlohmann::json::array());

    /** \brief As `execute`, with per-call options. */
    std::future<TaskResult> execute_with_options(std::string task_name, ExecuteOptions options,
                                                 nlohmann::json args = nlohmann::json::array());

    /**
     * \brief Callback form. `done` runs on the supervisor loop thread; it must not block.
     * \throws std::invalid_argument for an empty name, non-array args or empty callback.
     */
    void execute_async(std::string task_name, nlohmann::json args, ExecuteOptions options, Completion done);

    /** \brief True iff the worker announced readiness and has not exited. */
    bool is_available() const { return state_.load() == WorkerState::Running; }

    /**
     * \brief Block until the worker is running, the state settles elsewhere
     * (absent, cooled down, terminated) or `timeout` elapses.
     * \return `is_available()` at return.
     */
    bool wait_until_available(std::chrono::milliseconds timeout) const;

    /** \brief Last `count` non-empty lines of the session log, oldest first. */
    std::vector<std::string> get_recent_logs(size_t count = 100) const;

    std::filesystem::path get_log_file_path() const { return file_sink_->path(); }

    /**
     * \brief Leave cooldown (or the absent state) and spawn a fresh worker with a
     * reset restart budget. No-op in any other state.
     */
    void restart_worker();

    /**
     * \brief Fail outstanding requests with a shutdown error, cancel timers and
     * pending restarts, terminate the worker and stop the loop. Idempotent.
     */
    void dispose();

    // --- Introspection ---
    WorkerState state() const { return state_.load(); }
    std::optional<int> worker_pid() const;
    size_t pending_count() const { return pending_count_.load(); }
    int restart_attempts() const { return attempts_.load(); }
    /** \brief Task names announced by the current worker. */
    std::vector<std::string> worker_tasks() const;
    /** \brief Number of armed timers on the supervisor loop (request timeouts and restarts). */
    size_t pending_timer_count() const { return loop_->pending_timer_count(); }

private:
    struct Request {
        std::string task_name;
        nlohmann::json args;
        std::chrono::milliseconds timeout;
        Completion done;
    };

    void run_on_loop_(std::function<void()> fn);
    void submit_(Request request);

    // Loop-thread only
    void dispatch_(Request request);
    void resolve_(const std::string& task_id, TaskResult result);
    void on_timeout_(const std::string& task_id);
    void spawn_(bool is_restart);
    void schedule_restart_();
    void shutdown_();
    void on_worker_message_(std::uint64_t generation, Ipc::Message message);
    void on_worker_output_(std::uint64_t generation, int pid, OutputStream stream, const std::string& line);
    void on_worker_exit_(std::uint64_t generation, ExitStatus status);
    std::string next_task_id_();
    void set_state_(WorkerState state);

    SupervisorConfig config_;
    std::shared_ptr<IWorkerLauncher> launcher_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<FileSink> file_sink_;
    std::shared_ptr<runtime::CoroIoContext> loop_;
    std::optional<runtime::CoroIoContext::WorkGuard> loop_guard_;

    // Owned by the loop thread
    std::unordered_map<std::string, PendingRequest> pending_;
    std::shared_ptr<IWorkerProcess> worker_;
    std::uint64_t generation_{0};
    std::uint64_t task_counter_{0};
    runtime::CoroIoContext::TimerId restart_timer_{0};

    std::atomic<WorkerState> state_{WorkerState::Absent};
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    std::atomic<int> attempts_{0};
    std::atomic<size_t> pending_count_{0};
    std::atomic<int> worker_pid_{0};

    mutable std::mutex tasks_mutex_;
    std::vector<std::string> worker_tasks_;

    /// Serializes "accept a call" against "begin disposal".
    std::mutex dispose_mutex_;
    bool disposed_{false};
};

} // namespace SysTask::Supervisor
