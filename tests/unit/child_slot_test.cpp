/**
 * @file child_slot_test.cpp
 * @brief Unit tests for ChildSlot take-once semantics
 *
 * Tests:
 * - put/take/peek basics
 * - Only one of many concurrent takers receives the handle
 * - try_take_for times out while another thread holds the lock
 */

#include "sidecar/child_slot.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "mocks/mock_process_handle.hpp"

using namespace tether::sidecar;
using namespace tether::tests;

TEST(ChildSlotTest, StartsEmpty) {
    ChildSlot slot;
    EXPECT_TRUE(slot.empty());
    EXPECT_EQ(slot.take(), nullptr);
    EXPECT_EQ(slot.peek(), nullptr);
}

TEST(ChildSlotTest, TakeEmptiesSlot) {
    ChildSlot slot;
    auto handle = std::make_shared<NiceMock<MockProcessHandle>>();
    ASSERT_TRUE(slot.put(handle));

    EXPECT_FALSE(slot.empty());
    EXPECT_EQ(slot.peek(), handle);
    EXPECT_FALSE(slot.empty()) << "peek must not remove the handle";

    EXPECT_EQ(slot.take(), handle);
    EXPECT_TRUE(slot.empty());
    EXPECT_EQ(slot.take(), nullptr);
}

TEST(ChildSlotTest, PutRefusesSecondHandle) {
    ChildSlot slot;
    auto first = std::make_shared<NiceMock<MockProcessHandle>>();
    auto second = std::make_shared<NiceMock<MockProcessHandle>>();

    EXPECT_TRUE(slot.put(first));
    EXPECT_FALSE(slot.put(second));
    EXPECT_EQ(slot.take(), first);
}

TEST(ChildSlotTest, ConcurrentTakeYieldsHandleExactlyOnce) {
    for (int round = 0; round < 50; ++round) {
        ChildSlot slot;
        slot.put(std::make_shared<NiceMock<MockProcessHandle>>());

        std::atomic<bool> go{false};
        std::atomic<int> winners{0};
        std::vector<std::thread> takers;
        for (int i = 0; i < 8; ++i) {
            takers.emplace_back([&]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                if (slot.take()) {
                    ++winners;
                }
            });
        }

        go.store(true);
        for (auto &t : takers) {
            t.join();
        }

        ASSERT_EQ(winners.load(), 1) << "round " << round;
    }
}

TEST(ChildSlotTest, TryTakeForReturnsHandleWhenUncontended) {
    ChildSlot slot;
    auto handle = std::make_shared<NiceMock<MockProcessHandle>>();
    slot.put(handle);

    bool timed_out = true;
    EXPECT_EQ(slot.try_take_for(std::chrono::milliseconds(50), timed_out), handle);
    EXPECT_FALSE(timed_out);

    EXPECT_EQ(slot.try_take_for(std::chrono::milliseconds(50), timed_out), nullptr);
    EXPECT_FALSE(timed_out) << "empty slot is not a timeout";
}
