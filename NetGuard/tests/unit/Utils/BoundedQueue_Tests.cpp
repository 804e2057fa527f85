/**
 * ============================================================================
 * NetGuard BoundedQueue Unit Tests
 * ============================================================================
 */

#include "../../../src/Utils/BoundedQueue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace NetGuard::Utils;
using namespace std::chrono_literals;

/**
 * @brief Items come out in FIFO order
 */
TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> q(4);
    ASSERT_TRUE(q.try_push(1));
    ASSERT_TRUE(q.try_push(2));
    ASSERT_TRUE(q.try_push(3));
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(*q.pop(), 1);
    EXPECT_EQ(*q.pop(), 2);
    EXPECT_EQ(*q.pop(), 3);
}

/**
 * @brief try_push fails instead of blocking when the queue is full
 */
TEST(BoundedQueueTest, TryPushRejectsWhenFull) {
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));
    EXPECT_EQ(q.size(), 2u);
}

/**
 * @brief Zero capacity is raised to one
 */
TEST(BoundedQueueTest, ZeroCapacityBecomesOne) {
    BoundedQueue<int> q(0);
    EXPECT_EQ(q.capacity(), 1u);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_FALSE(q.try_push(2));
}

/**
 * @brief pop_for returns empty after the timeout on an empty queue
 */
TEST(BoundedQueueTest, PopForTimesOut) {
    BoundedQueue<std::string> q(1);
    const auto start = std::chrono::steady_clock::now();
    auto item = q.pop_for(30ms);
    EXPECT_FALSE(item.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

/**
 * @brief Blocking push waits for space and resumes after a pop
 */
TEST(BoundedQueueTest, PushBlocksUntilSpace) {
    BoundedQueue<int> q(1);
    ASSERT_TRUE(q.try_push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_TRUE(q.push(2));
        pushed.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(*q.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*q.pop(), 2);
}

/**
 * @brief close() drains remaining items, then pop returns empty
 */
TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    BoundedQueue<int> q(4);
    ASSERT_TRUE(q.try_push(5));
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.try_push(6));
    EXPECT_EQ(*q.pop(), 5);
    EXPECT_FALSE(q.pop().has_value());
}

/**
 * @brief close() wakes a consumer blocked in pop and a producer blocked in push
 */
TEST(BoundedQueueTest, CloseWakesBlockedThreads) {
    BoundedQueue<int> empty(1);
    BoundedQueue<int> full(1);
    ASSERT_TRUE(full.try_push(1));

    std::atomic<bool> popReturned{false};
    std::atomic<bool> pushResult{true};
    std::thread consumer([&] {
        EXPECT_FALSE(empty.pop().has_value());
        popReturned.store(true);
    });
    std::thread producer([&] { pushResult.store(full.push(2)); });

    std::this_thread::sleep_for(30ms);
    empty.close();
    full.close();
    consumer.join();
    producer.join();

    EXPECT_TRUE(popReturned.load());
    EXPECT_FALSE(pushResult.load());
}
