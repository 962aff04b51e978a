/**
 * \file CoroIoContext.hpp
 * \brief Coroutine-aware event loop with pending operations, posted work and timers.
 * \details Pending operations register non-blocking `try_complete()` functors and are
 * polled until ready, then the associated coroutine handle is resumed. Posted
 * callbacks and expired timers run on the same loop thread, so state owned by the
 * loop needs no locking. Use `WorkGuard` to keep the loop alive while work is in
 * flight.
 */
#pragma once

#include "logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace runtime {

/** \defgroup runtime_context Event Loop
 *  \ingroup runtime_module
 *  \brief Single-threaded loop for coroutine scheduling, posted work and timers.
 */

/** \brief Coroutine-aware event loop.
 *  \details One loop thread, either owned (`start()`) or borrowed (`run()`).
 *  Thread-safe entry points: `post`, `register_pending`, `schedule_after`,
 *  `cancel_timer`, `stop`, `request_stop`.
 *  \ingroup runtime_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	using Clock = std::chrono::steady_clock;
	using TimerId = std::uint64_t;

	CoroIoContext();
	~CoroIoContext();

	CoroIoContext(const CoroIoContext&) = delete;
	CoroIoContext& operator=(const CoroIoContext&) = delete;

	// --- Types ---
	/** \brief Classification for per-category completion counters. */
	enum class PendingOpCategory : uint8_t { Generic = 0, Read, Write, Process, Timer, Count };
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Lifecycle ---
	/** \brief Start the loop on an owned thread. No-op if already running. */
	void start();
	/** \brief Run the loop on the calling thread until stopped and no work remains. */
	void run();
	/** \brief Ask the loop to exit once outstanding work drains; does not wait. */
	void request_stop();
	/** \brief Request shutdown and join the owned thread (unless called from it). */
	void stop();
	/** \brief True if the loop is accepting work and has not been stopped. */
	bool is_running() const;
	/** \brief True when called on the loop thread. */
	bool in_loop_thread() const;

	// --- Logger ---
	void set_logger(std::shared_ptr<Logger> logger);
	/** \brief When enabled, an exception escaping a callback, timer or pending-op check
	 *  is logged and then rethrown out of `run()` instead of being dropped. */
	void set_fail_fast(bool enabled);

	// --- Work submission ---
	/** \brief Queue `fn` to run on the loop thread. */
	void post(std::function<void()> fn);

	/** \brief Register a pending operation; resumes `handle` (if any) when the predicate returns true.
	 *  \details A null handle is allowed for background operations that only need polling.
	 */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle);

	// --- Timers ---
	/** \brief Run `fn` on the loop thread after `delay`. Returns an id for `cancel_timer`. */
	TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> fn);
	/** \brief Cancel a timer that has not fired. Returns false if it already ran or never existed. */
	bool cancel_timer(TimerId id);
	/** \brief Number of armed timers. */
	size_t pending_timer_count() const;

	/** \brief Awaitable that resumes the caller after `delay`. */
	auto sleep_for(std::chrono::milliseconds delay) {
		struct SleepAwaitable {
			std::shared_ptr<CoroIoContext> loop;
			std::chrono::milliseconds delay;
			bool await_ready() const noexcept { return delay.count() <= 0; }
			void await_suspend(std::coroutine_handle<> handle) {
				loop->schedule_after(delay, [handle]() { handle.resume(); });
			}
			void await_resume() const noexcept {}
		};
		return SleepAwaitable{shared_from_this(), delay};
	}

	// --- Work guard ---
	/** \brief RAII object that increments outstanding work to keep the loop alive. */
	class WorkGuard {
	public:
		explicit WorkGuard(std::shared_ptr<CoroIoContext> loop);
		WorkGuard(const WorkGuard&) = delete;
		WorkGuard& operator=(const WorkGuard&) = delete;
		WorkGuard(WorkGuard&& other) noexcept;
		WorkGuard& operator=(WorkGuard&& other) noexcept;
		~WorkGuard();
		bool active() const noexcept { return active_; }
		/** \brief Release early. */
		void reset() { decrement_(); }
	private:
		void increment_();
		void decrement_();
		std::shared_ptr<CoroIoContext> loop_;
		bool active_{true};
	};
	WorkGuard make_work_guard() { return WorkGuard(shared_from_this()); }

	// --- Statistics ---
	size_t get_total_operations_processed() const;
	std::array<size_t, category_count_> get_operations_by_category() const;
	size_t get_timers_fired() const;
	std::string format_detailed_statistics() const;
	void log_detailed_statistics() const;

private:
	void run_loop_();
	void run_posted_();
	void run_due_timers_();
	void process_pending_ops_();
	void wait_for_work_();

	struct PendingOp {
		std::function<bool()> try_complete;
		std::coroutine_handle<> handle;
		PendingOpCategory category{PendingOpCategory::Generic};
	};
	struct Timer {
		Clock::time_point deadline;
		std::function<void()> fn;
	};

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool notified_{false};
	std::vector<PendingOp> pending_ops_;
	std::deque<std::function<void()>> posted_;
	std::map<TimerId, Timer> timers_;
	TimerId next_timer_id_{1};

	void wake_();

	std::atomic<bool> running_{false};
	std::atomic<bool> stop_requested_{false};
	std::thread loop_thread_;
	std::atomic<std::thread::id> loop_thread_id_{};
	std::shared_ptr<Logger> logger_;
	std::atomic<bool> fail_fast_{false};
	/** \brief Maximum sleep before re-polling pending operations without a notification. */
	std::chrono::milliseconds poll_interval_{std::chrono::milliseconds(10)};
	std::atomic<size_t> outstanding_work_{0};

	mutable std::mutex stats_mutex_;
	size_t total_operations_processed_{0};
	std::array<size_t, category_count_> operations_by_category_{};
	size_t timers_fired_{0};
};

} // namespace runtime
