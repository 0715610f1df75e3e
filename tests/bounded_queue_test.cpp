#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <bounded_queue.hpp>

using namespace voipcap;
using namespace std::chrono_literals;

TEST(BoundedQueue, KeepsFifoOrder)
{
    BoundedQueue<int> queue(4);
    for (int i = 0; i < 4; ++i) ASSERT_TRUE(queue.push(i));

    for (int i = 0; i < 4; ++i) EXPECT_EQ(queue.pop(), i);
}

TEST(BoundedQueue, PushBlocksWhileFull)
{
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueue, CloseDrainsThenEnds)
{
    BoundedQueue<int> queue(8);
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueue, CloseWakesBlockedConsumer)
{
    BoundedQueue<int> queue(2);
    std::thread consumer([&]() { EXPECT_FALSE(queue.pop().has_value()); });

    std::this_thread::sleep_for(20ms);
    queue.close();
    consumer.join();
}
