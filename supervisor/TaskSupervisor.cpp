/**
 * \file supervisor/TaskSupervisor.cpp
 * \brief Implementation of the task supervisor.
 */
#include "TaskSupervisor.hpp"
#include "ipc/WireCodec.hpp"
#include "processUtils.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace SysTask::Supervisor {

namespace {

constexpr std::string_view worker_role = "WORKER";

/// Split a captured worker line into its `[LEVEL]` prefix and message, if it has one.
std::pair<std::optional<LogLevel>, std::string_view> split_level_prefix(std::string_view line) {
    if (line.size() < 3 || line.front() != '[') return {std::nullopt, line};
    auto close = line.find(']');
    if (close == std::string_view::npos) return {std::nullopt, line};
    auto level = parse_log_level(line.substr(1, close - 1));
    if (!level) return {std::nullopt, line};
    auto rest = line.substr(close + 1);
    if (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    return {level, rest};
}

} // namespace

std::string_view to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Absent:     return "absent";
        case WorkerState::Starting:   return "starting";
        case WorkerState::Running:    return "running";
        case WorkerState::Restarting: return "restarting";
        case WorkerState::CooledDown: return "cooled-down";
        case WorkerState::Terminated: return "terminated";
    }
    return "unknown";
}

TaskSupervisor::TaskSupervisor(SupervisorConfig config, std::shared_ptr<IWorkerLauncher> launcher, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , launcher_(std::move(launcher))
{
    if (!launcher_) {
        throw std::invalid_argument("TaskSupervisor: launcher cannot be null");
    }
    if (!logger) {
        throw std::invalid_argument("TaskSupervisor: logger cannot be null");
    }
    // The session file hangs off a logger of our own so it sees only this supervisor
    const int pid = ProcessUtils::current_pid();
    file_sink_ = std::make_shared<FileSink>(FileSink::make_session_path(config_.log_dir, pid), "MAIN", pid);
    logger_ = std::make_shared<Logger>(logger->name());
    logger_->add_sink(std::make_shared<ForwardingSink>(std::move(logger)));
    logger_->add_sink(file_sink_);
    logger_->info("TaskSupervisor: session log " + file_sink_->path().string());

    loop_ = std::make_shared<runtime::CoroIoContext>();
    loop_->set_logger(logger_);
    loop_guard_.emplace(loop_->make_work_guard());
    loop_->start();

    // Spawn synchronously so the state is settled when the constructor returns
    std::promise<void> spawned;
    auto spawned_future = spawned.get_future();
    loop_->post([this, &spawned]() {
        spawn_(false);
        spawned.set_value();
    });
    spawned_future.wait();
}

TaskSupervisor::~TaskSupervisor() {
    dispose();
    loop_->stop();
}

std::future<TaskResult> TaskSupervisor::execute(std::string task_name, nlohmann::json args) {
    return execute_with_options(std::move(task_name), ExecuteOptions{}, std::move(args));
}

std::future<TaskResult> TaskSupervisor::execute_with_options(std::string task_name, ExecuteOptions options, nlohmann::json args) {
    auto promise = std::make_shared<std::promise<TaskResult>>();
    auto future = promise->get_future();
    execute_async(std::move(task_name), std::move(args), options,
                  [promise](TaskResult result) { promise->set_value(std::move(result)); });
    return future;
}

void TaskSupervisor::execute_async(std::string task_name, nlohmann::json args, ExecuteOptions options, Completion done) {
    if (task_name.empty()) {
        throw std::invalid_argument("TaskSupervisor: task name cannot be empty");
    }
    if (!args.is_array()) {
        throw std::invalid_argument("TaskSupervisor: task arguments must be a JSON array");
    }
    if (!done) {
        throw std::invalid_argument("TaskSupervisor: completion cannot be empty");
    }
    Request request{std::move(task_name), std::move(args), options.timeout.value_or(config_.default_timeout), std::move(done)};
    submit_(std::move(request));
}

void TaskSupervisor::submit_(Request request) {
    std::unique_lock<std::mutex> lock(dispose_mutex_);
    if (disposed_) {
        lock.unlock();
        request.done(TaskResult::failed(TaskFailureKind::Shutdown, std::string(FailureMessages::Shutdown)));
        return;
    }
    if (loop_->in_loop_thread()) {
        lock.unlock();
        dispatch_(std::move(request));
        return;
    }
    // Posted while holding the lock so it is queued ahead of any disposal
    auto shared = std::make_shared<Request>(std::move(request));
    loop_->post([this, shared]() { dispatch_(std::move(*shared)); });
}

void TaskSupervisor::run_on_loop_(std::function<void()> fn) {
    if (loop_->in_loop_thread()) {
        fn();
    } else {
        loop_->post(std::move(fn));
    }
}

std::vector<std::string> TaskSupervisor::get_recent_logs(size_t count) const {
    return LogFiles::read_recent_lines(file_sink_->path(), count);
}

std::optional<int> TaskSupervisor::worker_pid() const {
    int pid = worker_pid_.load();
    if (pid <= 0) return std::nullopt;
    return pid;
}

std::vector<std::string> TaskSupervisor::worker_tasks() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return worker_tasks_;
}

void TaskSupervisor::restart_worker() {
    {
        std::lock_guard<std::mutex> lock(dispose_mutex_);
        if (disposed_) return;
    }
    run_on_loop_([this]() {
        auto state = state_.load();
        if (state != WorkerState::CooledDown && state != WorkerState::Absent) return;
        logger_->info("TaskSupervisor: manual restart requested in state " + std::string(to_string(state)));
        attempts_ = 0;
        spawn_(false);
    });
}

void TaskSupervisor::dispose() {
    {
        std::lock_guard<std::mutex> lock(dispose_mutex_);
        if (disposed_) return;
        disposed_ = true;
    }
    if (loop_->in_loop_thread()) {
        shutdown_();
    } else {
        std::promise<void> done;
        auto done_future = done.get_future();
        loop_->post([this, &done]() {
            shutdown_();
            done.set_value();
        });
        done_future.wait();
    }
    // The loop exits once the worker process has been reaped
    loop_guard_.reset();
    loop_->request_stop();
}

// --- Loop thread ---

void TaskSupervisor::dispatch_(Request request) {
    const auto state = state_.load();
    if (state == WorkerState::Terminated) {
        request.done(TaskResult::failed(TaskFailureKind::Shutdown, std::string(FailureMessages::Shutdown)));
        return;
    }
    if (state == WorkerState::CooledDown) {
        request.done(TaskResult::failed(TaskFailureKind::Unavailable,
            std::string(FailureMessages::Unavailable) + ": cooldown after " + std::to_string(config_.restart.max_attempts) +
            " failed restarts"));
        return;
    }
    if (state != WorkerState::Running || !worker_) {
        request.done(TaskResult::failed(TaskFailureKind::Unavailable, std::string(FailureMessages::Unavailable)));
        return;
    }

    const std::string task_id = next_task_id_();
    PendingRequest pending;
    pending.task_id = task_id;
    pending.task_name = request.task_name;
    pending.completion = std::move(request.done);
    pending.created = std::chrono::steady_clock::now();
    pending.timeout = request.timeout;
    pending.timer = loop_->schedule_after(request.timeout, [this, task_id]() { on_timeout_(task_id); });
    pending_.emplace(task_id, std::move(pending));
    pending_count_ = pending_.size();

    logger_->debug("TaskSupervisor: dispatching " + request.task_name + " as " + task_id);

    Ipc::ExecuteTaskMessage message{task_id, request.task_name, std::move(request.args)};
    std::string failure;
    try {
        if (!worker_->send(message)) failure = "channel closed";
    } catch (const Ipc::CodecError& e) {
        failure = e.what();
    }
    if (!failure.empty()) {
        logger_->error("TaskSupervisor: cannot send " + task_id + " to worker: " + failure);
        resolve_(task_id, TaskResult::failed(TaskFailureKind::Transport, "Cannot send task to worker: " + failure));
    }
}

void TaskSupervisor::resolve_(const std::string& task_id, TaskResult result) {
    auto it = pending_.find(task_id);
    if (it == pending_.end()) return;
    auto completion = std::move(it->second.completion);
    if (it->second.timer != 0) loop_->cancel_timer(it->second.timer);
    pending_.erase(it);
    pending_count_ = pending_.size();
    try {
        completion(std::move(result));
    } catch (const std::exception& e) {
        logger_->error("TaskSupervisor: completion for " + task_id + " threw: " + e.what());
    }
}

void TaskSupervisor::on_timeout_(const std::string& task_id) {
    auto it = pending_.find(task_id);
    if (it == pending_.end()) return;
    // The timer has fired; do not cancel it again
    it->second.timer = 0;
    logger_->warning("TaskSupervisor: " + it->second.task_name + " (" + task_id + ") timed out after " +
                     std::to_string(it->second.timeout.count()) + " ms");
    resolve_(task_id, TaskResult::failed(TaskFailureKind::Timeout, std::string(FailureMessages::Timeout), -1));
}

void TaskSupervisor::spawn_(bool is_restart) {
    set_state_(WorkerState::Starting);
    const auto generation = ++generation_;
    WorkerEvents events;
    events.on_message = [this, generation](Ipc::Message message) {
        on_worker_message_(generation, std::move(message));
    };
    std::shared_ptr<int> pid_slot = std::make_shared<int>(0);
    events.on_output = [this, generation, pid_slot](OutputStream stream, const std::string& line) {
        on_worker_output_(generation, *pid_slot, stream, line);
    };
    events.on_exit = [this, generation](ExitStatus status) {
        on_worker_exit_(generation, status);
    };

    try {
        worker_ = launcher_->launch(loop_, std::move(events));
    } catch (const std::exception& e) {
        worker_.reset();
        logger_->error(std::string("TaskSupervisor: failed to spawn worker: ") + e.what());
        if (is_restart) {
            schedule_restart_();
        } else {
            set_state_(WorkerState::Absent);
        }
        return;
    }
    *pid_slot = worker_->pid();
    worker_pid_ = worker_->pid();
    logger_->info("TaskSupervisor: worker spawned with pid " + std::to_string(worker_->pid()));
}

void TaskSupervisor::schedule_restart_() {
    const int attempt = ++attempts_;
    if (config_.restart.exhausted(attempt)) {
        logger_->critical("TaskSupervisor: worker failed " + std::to_string(attempt - 1) +
                          " restarts in a row; cooling down");
        set_state_(WorkerState::CooledDown);
        return;
    }
    const auto delay = config_.restart.delay_for(attempt);
    set_state_(WorkerState::Restarting);
    logger_->warning("TaskSupervisor: restarting worker in " + std::to_string(delay.count()) + " ms (attempt " +
                     std::to_string(attempt) + " of " + std::to_string(config_.restart.max_attempts) + ")");
    restart_timer_ = loop_->schedule_after(delay, [this]() {
        restart_timer_ = 0;
        if (state_.load() != WorkerState::Restarting) return;
        spawn_(true);
    });
}

void TaskSupervisor::shutdown_() {
    logger_->info("TaskSupervisor: disposing with " + std::to_string(pending_.size()) + " outstanding tasks");
    set_state_(WorkerState::Terminated);

    auto outstanding = std::move(pending_);
    pending_.clear();
    pending_count_ = 0;
    for (auto& [task_id, pending] : outstanding) {
        if (pending.timer != 0) loop_->cancel_timer(pending.timer);
        try {
            pending.completion(TaskResult::failed(TaskFailureKind::Shutdown, std::string(FailureMessages::Shutdown)));
        } catch (const std::exception& e) {
            logger_->error("TaskSupervisor: completion for " + task_id + " threw: " + e.what());
        }
    }

    if (restart_timer_ != 0) {
        loop_->cancel_timer(restart_timer_);
        restart_timer_ = 0;
    }
    if (worker_) {
        logger_->info("TaskSupervisor: terminating worker " + std::to_string(worker_->pid()));
        worker_->terminate();
    }
}

void TaskSupervisor::on_worker_message_(std::uint64_t generation, Ipc::Message message) {
    if (generation != generation_) return;

    if (auto* ready = std::get_if<Ipc::WorkerReadyMessage>(&message)) {
        if (state_.load() != WorkerState::Starting) {
            logger_->warning("TaskSupervisor: unexpected worker-ready in state " + std::string(to_string(state_.load())));
            return;
        }
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            worker_tasks_ = ready->tasks;
        }
        attempts_ = 0;
        set_state_(WorkerState::Running);
        logger_->info("TaskSupervisor: worker " + std::to_string(ready->pid) + " ready with " +
                      std::to_string(ready->tasks.size()) + " tasks");
    } else if (auto* complete = std::get_if<Ipc::TaskCompleteMessage>(&message)) {
        if (!pending_.count(complete->task_id)) {
            logger_->debug("TaskSupervisor: discarding reply for unknown task " + complete->task_id);
            return;
        }
        logger_->debug("TaskSupervisor: " + complete->task_id + " completed");
        resolve_(complete->task_id, TaskResult::ok(std::move(complete->result)));
    } else if (auto* error = std::get_if<Ipc::TaskErrorMessage>(&message)) {
        if (!pending_.count(error->task_id)) {
            logger_->debug("TaskSupervisor: discarding error for unknown task " + error->task_id);
            return;
        }
        logger_->debug("TaskSupervisor: " + error->task_id + " failed: " + error->error);
        resolve_(error->task_id, TaskResult::failed(TaskFailureKind::TaskError, std::move(error->error), error->code));
    } else {
        logger_->warning("TaskSupervisor: ignoring unexpected " + std::string(Ipc::message_type(message)) + " message");
    }
}

void TaskSupervisor::on_worker_output_(std::uint64_t /*generation*/, int pid, OutputStream stream, const std::string& line) {
    auto [level, text] = split_level_prefix(line);
    const LogLevel fallback = stream == OutputStream::Stdout ? LogLevel::Info : LogLevel::Error;
    file_sink_->write_record(level.value_or(fallback), worker_role, pid, text);
}

void TaskSupervisor::on_worker_exit_(std::uint64_t generation, ExitStatus status) {
    if (generation != generation_) return;
    const int pid = worker_ ? worker_->pid() : 0;
    worker_.reset();
    worker_pid_ = 0;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        worker_tasks_.clear();
    }

    const auto state = state_.load();
    if (state == WorkerState::Terminated) {
        logger_->info("TaskSupervisor: worker " + std::to_string(pid) + " stopped: " + status.describe());
        return;
    }
    if (status.clean()) {
        logger_->info("TaskSupervisor: worker " + std::to_string(pid) + " exited cleanly");
        set_state_(WorkerState::Absent);
        return;
    }
    logger_->error("TaskSupervisor: worker " + std::to_string(pid) + " " + status.describe());
    schedule_restart_();
}

std::string TaskSupervisor::next_task_id_() {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "task-" + std::to_string(++task_counter_) + "-" + std::to_string(millis);
}

bool TaskSupervisor::wait_until_available(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this]() {
        auto s = state_.load();
        return s == WorkerState::Running || s == WorkerState::Absent ||
               s == WorkerState::CooledDown || s == WorkerState::Terminated;
    });
    return is_available();
}

void TaskSupervisor::set_state_(WorkerState state) {
    WorkerState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_.exchange(state);
    }
    state_cv_.notify_all();
    if (previous != state) {
        logger_->debug("TaskSupervisor: worker state " + std::string(to_string(previous)) + " -> " +
                       std::string(to_string(state)));
    }
}

} // namespace SysTask::Supervisor
