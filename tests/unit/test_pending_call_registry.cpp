/**
 * @file test_pending_call_registry.cpp
 * @brief Unit tests for PendingCallRegistry and PendingCall.
 */

#include <gtest/gtest.h>
#include <callbridge/exceptions.h>
#include <callbridge/pending_call_registry.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace callbridge;
using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// Test Fixtures
// ─────────────────────────────────────────────────────────────────────────────

class PendingCallRegistryTest : public ::testing::Test {
protected:
    PendingCallRegistry registry_;

    static PendingCall empty_closure() {
        return UserClosure<EmptyResult>{[](ErrorCode) {}};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Insert / Take
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(PendingCallRegistryTest, InsertThenTakeReturnsCall) {
    registry_.insert(5, ChannelSender<HandleResult>{});

    auto call = registry_.take(5);
    ASSERT_TRUE(call.has_value());
    EXPECT_TRUE(std::holds_alternative<ChannelSender<HandleResult>>(*call));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PendingCallRegistryTest, TakeUnknownHandleReturnsNothing) {
    EXPECT_FALSE(registry_.take(99).has_value());
}

TEST_F(PendingCallRegistryTest, SecondTakeReturnsNothing) {
    registry_.insert(1, empty_closure());

    EXPECT_TRUE(registry_.take(1).has_value());
    EXPECT_FALSE(registry_.take(1).has_value());
}

TEST_F(PendingCallRegistryTest, DuplicateInsertThrowsAndKeepsOriginal) {
    registry_.insert(3, ChannelSender<StringResult>{});

    try {
        registry_.insert(3, empty_closure());
        FAIL() << "duplicate insert did not throw";
    } catch (const ProtocolViolationError& e) {
        EXPECT_EQ(e.command_handle(), 3);
    }

    auto call = registry_.take(3);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(shape_of(*call), ResultShape::String);
}

TEST_F(PendingCallRegistryTest, SizeAndContainsTrackEntries) {
    registry_.insert(1, empty_closure());
    registry_.insert(2, empty_closure());

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_TRUE(registry_.contains(1));
    EXPECT_TRUE(registry_.contains(2));
    EXPECT_FALSE(registry_.contains(3));

    (void)registry_.take(1);
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_FALSE(registry_.contains(1));
}

// ─────────────────────────────────────────────────────────────────────────────
// Shapes
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(PendingCallRegistryTest, ShapeAndKindOfEveryAlternative) {
    EXPECT_EQ(shape_of(PendingCall{ChannelSender<EmptyResult>{}}), ResultShape::Empty);
    EXPECT_EQ(shape_of(PendingCall{ChannelSender<HandleResult>{}}), ResultShape::Handle);
    EXPECT_EQ(shape_of(PendingCall{ChannelSender<StringResult>{}}), ResultShape::String);
    EXPECT_EQ(shape_of(PendingCall{ChannelSender<BytesResult>{}}), ResultShape::Bytes);
    EXPECT_EQ(shape_of(PendingCall{UserClosure<BytesResult>{}}), ResultShape::Bytes);

    EXPECT_STREQ(kind_of(PendingCall{ChannelSender<EmptyResult>{}}), "channel");
    EXPECT_STREQ(kind_of(PendingCall{UserClosure<HandleResult>{}}), "closure");
}

// ─────────────────────────────────────────────────────────────────────────────
// Waiting
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(PendingCallRegistryTest, WaitUntilEmptySucceedsImmediatelyWhenEmpty) {
    EXPECT_TRUE(registry_.wait_until_empty(0ms));
}

TEST_F(PendingCallRegistryTest, WaitUntilEmptyTimesOutWithEntries) {
    registry_.insert(1, empty_closure());

    EXPECT_FALSE(registry_.wait_until_empty(10ms));
    (void)registry_.take(1);
}

TEST_F(PendingCallRegistryTest, WaitUntilEmptyWakesOnLastTake) {
    registry_.insert(1, empty_closure());
    registry_.insert(2, empty_closure());

    std::thread taker([this] {
        std::this_thread::sleep_for(20ms);
        (void)registry_.take(1);
        (void)registry_.take(2);
    });

    EXPECT_TRUE(registry_.wait_until_empty(5s));
    taker.join();
}

// ─────────────────────────────────────────────────────────────────────────────
// Concurrency
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(PendingCallRegistryTest, ConcurrentInsertAndTakeLoseNothing) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::atomic<int> taken{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, &taken, t] {
            for (int i = 0; i < kPerThread; ++i) {
                CommandHandle handle = t * kPerThread + i + 1;
                registry_.insert(handle, empty_closure());
                if (registry_.take(handle)) {
                    taken.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(taken.load(), kThreads * kPerThread);
    EXPECT_EQ(registry_.size(), 0u);
}
