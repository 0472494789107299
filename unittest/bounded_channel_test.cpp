// ============================================================================
// BOUNDED CHANNEL UNIT TESTS
// ============================================================================
// Tests for blocking push/pop, backpressure accounting and close semantics
// ============================================================================

#include <gtest/gtest.h>
#include <ledgerstream/core/queues/bounded_channel.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace LedgerStream;
using namespace std::chrono_literals;

// ============================================================================
// BASIC OPERATIONS
// ============================================================================

TEST(BoundedChannel, FifoOrder) {
    BoundedChannel<int> channel(4);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(channel.push(i));
    }
    EXPECT_EQ(channel.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(channel.pop(), i);
    }
}

TEST(BoundedChannel, ZeroCapacityBecomesOne) {
    BoundedChannel<int> channel(0);
    EXPECT_EQ(channel.capacity(), 1u);
}

// ============================================================================
// BACKPRESSURE
// ============================================================================

TEST(BoundedChannel, FullChannelBlocksProducer) {
    BoundedChannel<int> channel(1);
    uint64_t first_wait = 1;
    ASSERT_TRUE(channel.push(1, &first_wait));
    EXPECT_EQ(first_wait, 0u);

    std::atomic<bool> pushed{false};
    uint64_t waited = 0;
    std::thread producer([&]() {
        channel.push(2, &waited);
        pushed.store(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(channel.pop(), 1);
    producer.join();

    EXPECT_TRUE(pushed.load());
    EXPECT_GE(waited, 40'000'000u);
    EXPECT_EQ(channel.pop(), 2);
}

// ============================================================================
// CLOSE SEMANTICS
// ============================================================================

TEST(BoundedChannel, CloseUnblocksProducer) {
    BoundedChannel<std::string> channel(1);
    channel.push("queued");

    std::atomic<bool> result{true};
    std::thread producer([&]() { result.store(channel.push("blocked")); });
    std::this_thread::sleep_for(20ms);
    channel.close();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_FALSE(channel.push("late"));
}

TEST(BoundedChannel, CloseDrainsRemainingItems) {
    BoundedChannel<int> channel(3);
    channel.push(1);
    channel.push(2);
    channel.close();

    EXPECT_EQ(channel.pop(), 1);
    EXPECT_EQ(channel.pop(), 2);
    EXPECT_FALSE(channel.pop().has_value());
}

TEST(BoundedChannel, CloseWakesBlockedConsumer) {
    BoundedChannel<int> channel(1);
    std::optional<int> popped = 0;
    std::thread consumer([&]() { popped = channel.pop(); });
    std::this_thread::sleep_for(20ms);
    channel.close();
    consumer.join();
    EXPECT_FALSE(popped.has_value());
}
