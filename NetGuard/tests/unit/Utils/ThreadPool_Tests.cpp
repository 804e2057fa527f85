/**
 * ============================================================================
 * NetGuard ThreadPool Unit Tests
 * ============================================================================
 */

#include "../../../src/Utils/ThreadPool.hpp"
#include "../../TestHelpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace NetGuard;
using namespace NetGuard::Utils;
using namespace std::chrono_literals;

namespace {

    /// Holds workers inside a task until Open() is called.
    class Gate {
    public:
        Gate() : m_open(m_promise.get_future().share()) {}

        void Wait() const { m_open.wait(); }
        void Open() { m_promise.set_value(); }

    private:
        std::promise<void> m_promise;
        std::shared_future<void> m_open;
    };

}  // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

/**
 * @brief Thread counts outside 1..MAX_THREADS are rejected
 */
TEST(ThreadPoolTest, RejectsInvalidThreadCount) {
    EXPECT_THROW(ThreadPool(0, 4, "Test-Pool"), std::invalid_argument);
    EXPECT_THROW(ThreadPool(ThreadPool::MAX_THREADS + 1, 4, "Test-Pool"), std::invalid_argument);

    ThreadPool pool(3, 0, "Test-Pool");
    EXPECT_EQ(pool.get_thread_count(), 3u);
    EXPECT_EQ(pool.get_busy_count(), 0u);
    EXPECT_FALSE(pool.is_shutdown());
}

// ============================================================================
// TASKS
// ============================================================================

/**
 * @brief submit() delivers the result and any exception through the future
 */
TEST(ThreadPoolTest, SubmitDeliversResultAndException) {
    ThreadPool pool(1, 1, "Test-Pool");

    auto value = pool.submit([] { return 42; });
    EXPECT_EQ(value.get(), 42);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("enumeration failed"); });
    EXPECT_THROW(failing.get(), std::runtime_error);
}

/**
 * @brief A posted task that throws is logged and the worker keeps serving
 */
TEST(ThreadPoolTest, PostedTaskExceptionKeepsWorker) {
    ThreadPool pool(1, 4, "Test-Pool");
    std::atomic<int> ran{ 0 };

    EXPECT_TRUE(pool.try_post([] { throw std::runtime_error("session failed"); }));
    EXPECT_TRUE(pool.try_post([&ran] { ran.fetch_add(1); }));

    EXPECT_TRUE(Testing::WaitUntil([&] { return ran.load() == 1; }));
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

/**
 * @brief Idle workers take tasks beyond the backlog; queued tasks keep FIFO order
 */
TEST(ThreadPoolTest, RunsQueuedTasksInOrder) {
    ThreadPool pool(1, 8, "Test-Pool");
    Gate gate;
    std::mutex mutex;
    std::vector<int> order;

    ASSERT_TRUE(pool.try_post([&gate] { gate.Wait(); }));
    ASSERT_TRUE(Testing::WaitUntil([&] { return pool.get_busy_count() == 1; }));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pool.try_post([&mutex, &order, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }
    EXPECT_EQ(pool.get_backlog(), 5u);

    gate.Open();
    pool.shutdown();
    EXPECT_EQ(order, (std::vector<int>{ 0, 1, 2, 3, 4 }));
}

// ============================================================================
// ADMISSION
// ============================================================================

/**
 * @brief Once every worker is busy and the backlog is full, new work is refused
 */
TEST(ThreadPoolTest, SaturatedPoolRefusesWork) {
    ThreadPool pool(2, 1, "Test-Pool");
    Gate gate;

    ASSERT_TRUE(pool.try_post([&gate] { gate.Wait(); }));
    ASSERT_TRUE(pool.try_post([&gate] { gate.Wait(); }));
    ASSERT_TRUE(Testing::WaitUntil([&] { return pool.get_busy_count() == 2; }));

    std::atomic<bool> queuedRan{ false };
    EXPECT_TRUE(pool.try_post([&queuedRan] { queuedRan.store(true); }));
    EXPECT_EQ(pool.get_backlog(), 1u);

    EXPECT_FALSE(pool.try_post([] {}));
    EXPECT_THROW(pool.submit([] { return 1; }), ThreadPoolBusyException);

    gate.Open();
    EXPECT_TRUE(Testing::WaitUntil([&] { return queuedRan.load(); }));
    EXPECT_TRUE(Testing::WaitUntil([&] { return pool.get_busy_count() == 0; }));
    EXPECT_TRUE(pool.try_post([] {}));
}

/**
 * @brief Without a backlog, a task is admitted only while a worker is idle
 */
TEST(ThreadPoolTest, ZeroBacklogAdmitsIdleWorkersOnly) {
    ThreadPool pool(1, 0, "Test-Pool");
    Gate gate;

    ASSERT_TRUE(pool.try_post([&gate] { gate.Wait(); }));
    ASSERT_TRUE(Testing::WaitUntil([&] { return pool.get_busy_count() == 1; }));
    EXPECT_FALSE(pool.try_post([] {}));

    gate.Open();
    EXPECT_TRUE(Testing::WaitUntil([&] { return pool.get_busy_count() == 0; }));
    EXPECT_EQ(pool.submit([] { return 3; }).get(), 3);
}

// ============================================================================
// SHUTDOWN
// ============================================================================

/**
 * @brief shutdown() runs what was already queued, then refuses new work
 */
TEST(ThreadPoolTest, ShutdownDrainsThenRefuses) {
    ThreadPool pool(1, 16, "Test-Pool");
    Gate gate;
    std::atomic<int> ran{ 0 };

    ASSERT_TRUE(pool.try_post([&gate] { gate.Wait(); }));
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.try_post([&ran] { ran.fetch_add(1); }));
    }

    gate.Open();
    pool.shutdown();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_TRUE(pool.is_shutdown());

    EXPECT_FALSE(pool.try_post([] {}));
    EXPECT_THROW(pool.submit([] { return 1; }), ThreadPoolShutdownException);
    EXPECT_NO_THROW(pool.shutdown());
}

/**
 * @brief Busy and shutdown refusals share one base for callers that treat them alike
 */
TEST(ThreadPoolTest, RejectionsShareBase) {
    ThreadPool pool(1, 0, "Test-Pool");
    pool.shutdown();
    try {
        (void)pool.submit([] { return 0; });
        FAIL() << "submit after shutdown must throw";
    }
    catch (const ThreadPoolRejectedException& e) {
        EXPECT_NE(std::string(e.what()).find("Test-Pool"), std::string::npos);
    }
}
