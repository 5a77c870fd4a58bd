/**
 * @file test_bounded_queue.cpp
 */

#include <gtest/gtest.h>
#include <utils/bounded_queue.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace Meisai;

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    q.push(3);
    int v = 0;
    ASSERT_TRUE(q.pop(v)); EXPECT_EQ(v, 1);
    ASSERT_TRUE(q.pop(v)); EXPECT_EQ(v, 2);
    ASSERT_TRUE(q.try_pop(v)); EXPECT_EQ(v, 3);
    EXPECT_FALSE(q.try_pop(v));
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    BoundedQueue<int> q(1);
    q.push(1);

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.size(), 1);
}

TEST(BoundedQueueTest, CloseUnblocksProducer) {
    BoundedQueue<int> q(1);
    q.push(1);

    bool result = true;
    std::thread producer([&] { result = q.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    producer.join();

    EXPECT_FALSE(result);
    EXPECT_TRUE(q.closed());
}

TEST(BoundedQueueTest, PopDrainsAfterClose) {
    BoundedQueue<int> q(4);
    q.push(7);
    q.close();
    EXPECT_FALSE(q.push(8));

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 7);
    EXPECT_FALSE(q.pop(v));
}
