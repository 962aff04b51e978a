/**
 * \file CoTask.hpp
 * \brief C++20 coroutine task types used by the runtime module.
 * \details `CoTask<T>` starts eagerly (`initial_suspend = suspend_never`) and stays
 * suspended at completion until its owner destroys it. A coroutine awaiting a
 * `CoTask` is resumed by symmetric transfer from the final suspend point.
 *
 * Exception policy: an exception escaping the body is captured and rethrown from
 * `co_await` / `get_result()`. `DetachedTask` is fire-and-forget; an escaping
 * exception terminates the process.
 */
#pragma once
#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

/**
 * \defgroup runtime_module Runtime Module
 * \brief Event loop and task types for coroutine-based non-blocking I/O and process handling.
 */

/** \defgroup runtime_task Task Types
 *  \ingroup runtime_module
 *  \brief Coroutine task wrappers and semantics.
 */

namespace runtime {

/** \addtogroup runtime_task
 *  @{ */

namespace detail {

/** \brief Shared promise state: continuation and captured exception. */
struct PromiseBase {
    std::coroutine_handle<> continuation{};
    std::exception_ptr exception{};

    /// Start executing immediately on creation
    std::suspend_never initial_suspend() noexcept { return {}; }

    /// Resume whoever awaited us, if anyone
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }
        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
            auto next = h.promise().continuation;
            return next ? next : std::noop_coroutine();
        }
        void await_resume() const noexcept {}
    };
    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { exception = std::current_exception(); }

    void rethrow_if_failed() const {
        if (exception) std::rethrow_exception(exception);
    }
};

} // namespace detail

/** \brief Awaitable coroutine task producing a `T`.
 *  \details Owns the coroutine handle. Move-only. Destroying an unfinished task destroys
 *  the frame, so callers keep it alive until `done()` or until it has been awaited.
 *  \see runtime::CoroIoContext
 */
template <typename T = void>
class CoTask {
public:
    struct promise_type : detail::PromiseBase {
        CoTask<T> get_return_object() {
            return CoTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        template <typename U>
        void return_value(U&& value) {
            result.emplace(std::forward<U>(value));
        }
        std::optional<T> result;
    };

    explicit CoTask(std::coroutine_handle<promise_type> handle) : h_(handle) {}
    ~CoTask() { if (h_) h_.destroy(); }
    CoTask(CoTask&& other) noexcept : h_(std::exchange(other.h_, nullptr)) {}
    CoTask& operator=(CoTask&& other) noexcept {
        if (this != &other) {
            if (h_) h_.destroy();
            h_ = std::exchange(other.h_, nullptr);
        }
        return *this;
    }
    CoTask(const CoTask&) = delete;
    CoTask& operator=(const CoTask&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h_ || h_.done(); }

    /// Result of a finished task; rethrows a captured exception
    T get_result() {
        if (!done()) throw std::logic_error("CoTask: result requested before completion");
        h_.promise().rethrow_if_failed();
        return std::move(*h_.promise().result);
    }

    bool await_ready() const noexcept { return done(); }
    void await_suspend(std::coroutine_handle<> awaiting) noexcept {
        h_.promise().continuation = awaiting;
    }
    T await_resume() {
        h_.promise().rethrow_if_failed();
        return std::move(*h_.promise().result);
    }

private:
    std::coroutine_handle<promise_type> h_;
};

/** \brief Specialization for `CoTask<void>` with the same lifetime semantics. */
template <>
class CoTask<void> {
public:
    struct promise_type : detail::PromiseBase {
        CoTask<void> get_return_object() {
            return CoTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        void return_void() noexcept {}
    };

    explicit CoTask(std::coroutine_handle<promise_type> handle) : h_(handle) {}
    ~CoTask() { if (h_) h_.destroy(); }
    CoTask(CoTask&& other) noexcept : h_(std::exchange(other.h_, nullptr)) {}
    CoTask& operator=(CoTask&& other) noexcept {
        if (this != &other) {
            if (h_) h_.destroy();
            h_ = std::exchange(other.h_, nullptr);
        }
        return *this;
    }
    CoTask(const CoTask&) = delete;
    CoTask& operator=(const CoTask&) = delete;

    bool done() const { return !h_ || h_.done(); }

    void get_result() {
        if (!done()) throw std::logic_error("CoTask: result requested before completion");
        h_.promise().rethrow_if_failed();
    }

    bool await_ready() const noexcept { return done(); }
    void await_suspend(std::coroutine_handle<> awaiting) noexcept {
        h_.promise().continuation = awaiting;
    }
    void await_resume() { h_.promise().rethrow_if_failed(); }

private:
    std::coroutine_handle<promise_type> h_;
};

/** \brief Fire-and-forget coroutine; the frame frees itself on completion.
 *  \details Anything that must survive is captured by value or held through
 *  `shared_ptr`. An exception escaping the body calls `std::terminate`.
 */
struct DetachedTask {
    struct promise_type {
        DetachedTask get_return_object() noexcept { return {}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::terminate(); }
    };
};

/** @} */

} // namespace runtime
