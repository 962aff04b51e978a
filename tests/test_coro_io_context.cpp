#include "runtime/CoroIoContext.hpp"
#include "runtime/CoTask.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace {

runtime::CoTask<int> add_later(std::shared_ptr<runtime::CoroIoContext> loop, int a, int b) {
    co_await loop->sleep_for(20ms);
    co_return a + b;
}

runtime::CoTask<int> fail_later(std::shared_ptr<runtime::CoroIoContext> loop) {
    co_await loop->sleep_for(5ms);
    throw std::runtime_error("boom");
}

} // namespace

class CoroIoContextTest : public ::testing::Test {
protected:
    std::shared_ptr<runtime::CoroIoContext> loop = std::make_shared<runtime::CoroIoContext>();
};

TEST_F(CoroIoContextTest, PostedWorkRunsOnLoopThread) {
    loop->start();
    std::atomic<bool> ran{false};
    std::atomic<bool> on_loop{false};
    loop->post([&]() {
        on_loop = loop->in_loop_thread();
        ran = true;
    });
    ASSERT_TRUE(systask_test::wait_for([&]() { return ran.load(); }));
    EXPECT_TRUE(on_loop.load());
    EXPECT_FALSE(loop->in_loop_thread());
    loop->stop();
}

TEST_F(CoroIoContextTest, TimersFireInDeadlineOrder) {
    loop->start();
    std::mutex mutex;
    std::vector<int> order;
    loop->schedule_after(60ms, [&]() { std::lock_guard<std::mutex> lock(mutex); order.push_back(3); });
    loop->schedule_after(10ms, [&]() { std::lock_guard<std::mutex> lock(mutex); order.push_back(1); });
    loop->schedule_after(30ms, [&]() { std::lock_guard<std::mutex> lock(mutex); order.push_back(2); });
    ASSERT_TRUE(systask_test::wait_for([&]() { std::lock_guard<std::mutex> lock(mutex); return order.size() == 3; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop->get_timers_fired(), 3u);
    loop->stop();
}

TEST_F(CoroIoContextTest, CancelledTimerNeverFires) {
    loop->start();
    std::atomic<bool> fired{false};
    auto id = loop->schedule_after(30ms, [&]() { fired = true; });
    EXPECT_EQ(loop->pending_timer_count(), 1u);
    EXPECT_TRUE(loop->cancel_timer(id));
    EXPECT_FALSE(loop->cancel_timer(id));
    EXPECT_EQ(loop->pending_timer_count(), 0u);
    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(fired.load());
    loop->stop();
}

TEST_F(CoroIoContextTest, TimerFiresNoEarlierThanDelay) {
    loop->start();
    std::atomic<bool> fired{false};
    auto scheduled = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed_ms{0};
    loop->schedule_after(50ms, [&]() {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - scheduled).count();
        fired = true;
    });
    ASSERT_TRUE(systask_test::wait_for([&]() { return fired.load(); }));
    EXPECT_GE(elapsed_ms.load(), 50);
    loop->stop();
}

TEST_F(CoroIoContextTest, CoroutineResultFlowsThroughAwait) {
    auto sum = systask_test::run_on_loop<int>(loop, [&]() { return add_later(loop, 2, 40); });
    EXPECT_EQ(sum, 42);
}

TEST_F(CoroIoContextTest, CoroutineExceptionPropagatesToAwaiter) {
    EXPECT_THROW(systask_test::run_on_loop<int>(loop, [&]() { return fail_later(loop); }), std::runtime_error);
}

TEST_F(CoroIoContextTest, PendingOperationResumesWhenReady) {
    loop->start();
    std::atomic<int> polls{0};
    std::atomic<bool> done{false};
    loop->register_pending(runtime::CoroIoContext::PendingOpCategory::Generic, [&]() {
        if (++polls < 3) return false;
        done = true;
        return true;
    }, nullptr);
    ASSERT_TRUE(systask_test::wait_for([&]() { return done.load(); }));
    EXPECT_GE(polls.load(), 3);
    EXPECT_GE(loop->get_total_operations_processed(), 1u);
    loop->stop();
}

TEST_F(CoroIoContextTest, StopWaitsForWorkGuard) {
    loop->start();
    EXPECT_TRUE(loop->is_running());
    auto guard = std::make_shared<runtime::CoroIoContext::WorkGuard>(loop->make_work_guard());
    std::atomic<bool> late_ran{false};
    loop->request_stop();
    EXPECT_FALSE(loop->is_running());
    loop->schedule_after(20ms, [&, guard]() mutable {
        late_ran = true;
    });
    guard.reset();
    // The timer still holds the guard, so the loop keeps running until it fires
    loop->stop();
    EXPECT_TRUE(late_ran.load());
}

TEST_F(CoroIoContextTest, ThrowingPendingCheckIsLoggedAndDropped) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("loop-test");
    logger->add_sink(sink);
    loop->set_logger(logger);
    loop->start();
    loop->register_pending(runtime::CoroIoContext::PendingOpCategory::Generic, []() -> bool {
        throw std::runtime_error("predicate failed");
    }, nullptr);
    ASSERT_TRUE(systask_test::wait_for([&]() { return sink->contains("predicate failed"); }));
    std::atomic<bool> later{false};
    loop->post([&]() { later = true; });
    EXPECT_TRUE(systask_test::wait_for([&]() { return later.load(); }));
    loop->stop();
}

TEST_F(CoroIoContextTest, FailFastRethrowsOutOfRun) {
    loop->set_fail_fast(true);
    auto guard = std::make_shared<runtime::CoroIoContext::WorkGuard>(loop->make_work_guard());
    loop->register_pending(runtime::CoroIoContext::PendingOpCategory::Generic, []() -> bool {
        throw std::runtime_error("predicate failed");
    }, nullptr);
    EXPECT_THROW(loop->run(), std::runtime_error);
    EXPECT_FALSE(loop->is_running());
    EXPECT_FALSE(loop->in_loop_thread());
}
