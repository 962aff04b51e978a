/**
 * \file CoroIoContext.cpp
 * \brief Operational implementation for `runtime::CoroIoContext`.
 * \details One pass of the loop runs posted callbacks, fires expired timers and
 * polls pending operations. Between passes the thread sleeps until notified, the
 * next timer deadline, or `poll_interval_` while operations are pending.
 * - Pending operations are stolen in one batch (swap with a local vector) so
 *   predicates run outside the lock; unfinished ones are requeued.
 * - Callbacks scheduled from inside a callback run on the next pass.
 */
#include "CoroIoContext.hpp"
#include "processUtils.hpp"
#include <algorithm>
#include <string>

namespace runtime {

CoroIoContext::CoroIoContext() = default;

CoroIoContext::~CoroIoContext() {
    stop();
    if (loop_thread_.joinable()) {
        // Destroyed from inside the loop thread; nothing left to join against.
        loop_thread_.detach();
    }
}

void CoroIoContext::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    stop_requested_ = false;
    loop_thread_ = std::thread([this] {
        ProcessUtils::set_current_thread_name("CoroIoContext");
        run_loop_();
    });
    if (logger_) logger_->debug("CoroIoContext started");
}

void CoroIoContext::run() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    stop_requested_ = false;
    run_loop_();
}

void CoroIoContext::request_stop() {
    stop_requested_ = true;
    wake_();
}

void CoroIoContext::stop() {
    request_stop();
    if (loop_thread_.joinable() && !in_loop_thread()) {
        loop_thread_.join();
        if (logger_) logger_->debug("CoroIoContext stopped");
    }
}

bool CoroIoContext::is_running() const { return running_ && !stop_requested_; }

bool CoroIoContext::in_loop_thread() const {
    return loop_thread_id_.load() == std::this_thread::get_id();
}

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }

void CoroIoContext::set_fail_fast(bool enabled) { fail_fast_ = enabled; }

void CoroIoContext::wake_() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        notified_ = true;
    }
    cv_.notify_one();
}

void CoroIoContext::run_loop_() {
    loop_thread_id_ = std::this_thread::get_id();
    while (!stop_requested_ || outstanding_work_.load(std::memory_order_acquire) > 0) {
        try {
            run_posted_();
            run_due_timers_();
            process_pending_ops_();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in event loop: " + std::string(e.what()));
            if (fail_fast_) {
                loop_thread_id_ = std::thread::id{};
                running_ = false;
                throw;
            }
        }
        wait_for_work_();
    }
    loop_thread_id_ = std::thread::id{};
    running_ = false;
}

void CoroIoContext::wait_for_work_() {
    std::unique_lock<std::mutex> lk(mutex_);
    if (notified_ || !posted_.empty()) {
        notified_ = false;
        return;
    }
    auto timeout = std::chrono::duration_cast<Clock::duration>(std::chrono::hours(1));
    if (!pending_ops_.empty()) timeout = poll_interval_;
    if (!timers_.empty()) {
        auto next = std::min_element(timers_.begin(), timers_.end(), [](const auto& a, const auto& b) {
            return a.second.deadline < b.second.deadline;
        });
        auto until = next->second.deadline - Clock::now();
        if (until < timeout) timeout = until;
    }
    if (timeout > Clock::duration::zero()) {
        cv_.wait_for(lk, timeout, [this] { return notified_; });
    }
    notified_ = false;
}

void CoroIoContext::run_posted_() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        batch.swap(posted_);
    }
    for (auto& fn : batch) {
        try {
            fn();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in posted callback: " + std::string(e.what()));
            if (fail_fast_) throw;
        }
    }
}

void CoroIoContext::run_due_timers_() {
    std::vector<std::function<void()>> due;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        const auto now = Clock::now();
        std::vector<std::pair<Clock::time_point, TimerId>> expired;
        for (const auto& [id, timer] : timers_) {
            if (timer.deadline <= now) expired.emplace_back(timer.deadline, id);
        }
        // Fire in deadline order, ties by schedule order
        std::sort(expired.begin(), expired.end());
        for (const auto& entry : expired) {
            auto it = timers_.find(entry.second);
            due.push_back(std::move(it->second.fn));
            timers_.erase(it);
        }
    }
    if (due.empty()) return;
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        timers_fired_ += due.size();
        operations_by_category_[static_cast<size_t>(PendingOpCategory::Timer)] += due.size();
    }
    for (auto& fn : due) {
        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in timer callback: " + std::string(e.what()));
            if (fail_fast_) throw;
        }
    }
}

void CoroIoContext::process_pending_ops_() {
    std::vector<PendingOp> fetched;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (pending_ops_.empty()) return;
        fetched.swap(pending_ops_);
    }

    std::vector<PendingOp> requeue;
    for (auto& op : fetched) {
        bool completed = false;
        try {
            if (op.try_complete) completed = op.try_complete();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("Error in try_complete: ") + e.what());
            if (fail_fast_) throw;
            completed = true; // drop on exception
        }
        if (!completed) {
            requeue.push_back(std::move(op));
            continue;
        }
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            total_operations_processed_++;
            size_t cat_idx = static_cast<size_t>(op.category);
            if (cat_idx >= category_count_) cat_idx = 0;
            operations_by_category_[cat_idx]++;
        }
        auto h = op.handle;
        if (h && !h.done()) {
            h.resume();
        }
    }

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(mutex_);
        pending_ops_.reserve(pending_ops_.size() + requeue.size());
        for (auto& op : requeue) {
            pending_ops_.push_back(std::move(op));
        }
    }
}

void CoroIoContext::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        posted_.push_back(std::move(fn));
        notified_ = true;
    }
    cv_.notify_one();
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete), handle);
}

void CoroIoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        PendingOp op{};
        op.try_complete = std::move(try_complete);
        op.handle = handle;
        op.category = category;
        pending_ops_.push_back(std::move(op));
        notified_ = true;
    }
    cv_.notify_one();
}

CoroIoContext::TimerId CoroIoContext::schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        id = next_timer_id_++;
        timers_.emplace(id, Timer{Clock::now() + delay, std::move(fn)});
        notified_ = true;
    }
    cv_.notify_one();
    return id;
}

bool CoroIoContext::cancel_timer(TimerId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    return timers_.erase(id) > 0;
}

size_t CoroIoContext::pending_timer_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return timers_.size();
}

std::string CoroIoContext::format_detailed_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto cat_name = [](PendingOpCategory c) -> const char* {
        switch (c) {
            case PendingOpCategory::Generic: return "Generic";
            case PendingOpCategory::Read: return "Read";
            case PendingOpCategory::Write: return "Write";
            case PendingOpCategory::Process: return "Process";
            case PendingOpCategory::Timer: return "Timer";
            default: return "Unknown";
        }
    };
    std::string out;
    out += "CoroIoContext Detailed Statistics\n";
    out += "Total operations processed: " + std::to_string(total_operations_processed_) + "\n";
    out += "Timers fired: " + std::to_string(timers_fired_) + "\n";
    for (size_t cat = 0; cat < category_count_; ++cat) {
        if (operations_by_category_[cat] == 0) continue;
        out += std::string("  ") + cat_name(static_cast<PendingOpCategory>(cat)) + " : " +
               std::to_string(operations_by_category_[cat]) + "\n";
    }
    return out;
}

void CoroIoContext::log_detailed_statistics() const {
    if (!logger_) return;
    logger_->debug(format_detailed_statistics());
}

size_t CoroIoContext::get_total_operations_processed() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return total_operations_processed_;
}

std::array<size_t, CoroIoContext::category_count_> CoroIoContext::get_operations_by_category() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return operations_by_category_;
}

size_t CoroIoContext::get_timers_fired() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return timers_fired_;
}

// WorkGuard
CoroIoContext::WorkGuard::WorkGuard(std::shared_ptr<CoroIoContext> loop) : loop_(std::move(loop)) { increment_(); }
CoroIoContext::WorkGuard::WorkGuard(WorkGuard&& other) noexcept : loop_(std::move(other.loop_)), active_(other.active_) { other.active_ = false; }
CoroIoContext::WorkGuard& CoroIoContext::WorkGuard::operator=(WorkGuard&& other) noexcept {
    if (this != &other) {
        decrement_();
        loop_ = std::move(other.loop_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}
CoroIoContext::WorkGuard::~WorkGuard() { decrement_(); }
void CoroIoContext::WorkGuard::increment_() { if (loop_ && active_) { loop_->outstanding_work_.fetch_add(1, std::memory_order_relaxed); } }
void CoroIoContext::WorkGuard::decrement_() { if (loop_ && active_) { active_ = false; if (loop_->outstanding_work_.fetch_sub(1, std::memory_order_acq_rel) == 1) loop_->wake_(); } }

} // namespace runtime
