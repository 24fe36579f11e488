#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "core/lock_table.hpp"

namespace {

using Table = core::LockTable<std::uint64_t>;

Table::clock::time_point in(std::chrono::milliseconds d) {
    return Table::clock::now() + d;
}

TEST(LockTable, AcquireIsReentrantForOwner) {
    Table t;
    EXPECT_TRUE(t.acquire(1, 42, in(std::chrono::milliseconds(10))));
    EXPECT_TRUE(t.acquire(1, 42, in(std::chrono::milliseconds(10))));
    EXPECT_TRUE(t.is_held_by(1, 42));
    EXPECT_EQ(t.locked_count(), 1u);
    t.release(1, 42);
    EXPECT_FALSE(t.is_held_by(1, 42));
    EXPECT_EQ(t.locked_count(), 0u);
}

TEST(LockTable, ContenderTimesOutWhileHeld) {
    Table t;
    ASSERT_TRUE(t.acquire(1, 7, in(std::chrono::milliseconds(10))));
    EXPECT_FALSE(t.acquire(2, 7, in(std::chrono::milliseconds(20))));
    EXPECT_EQ(t.timeout_count(), 1u);
    EXPECT_EQ(t.wait_count(), 1u);
    EXPECT_TRUE(t.is_held_by(1, 7));
}

TEST(LockTable, ReleaseByNonOwnerIsIgnored) {
    Table t;
    ASSERT_TRUE(t.acquire(1, 7, in(std::chrono::milliseconds(10))));
    t.release(2, 7);
    EXPECT_TRUE(t.is_held_by(1, 7));
}

TEST(LockTable, WaiterIsGrantedOnRelease) {
    Table t;
    ASSERT_TRUE(t.acquire(1, 7, in(std::chrono::milliseconds(10))));

    std::atomic<bool> granted{false};
    std::thread waiter([&] { granted = t.acquire(2, 7, in(std::chrono::seconds(5))); });

    while (t.wait_count() == 0) {
        std::this_thread::yield();
    }
    EXPECT_FALSE(granted.load());
    t.release(1, 7);
    waiter.join();

    EXPECT_TRUE(granted.load());
    EXPECT_TRUE(t.is_held_by(2, 7));
    EXPECT_EQ(t.timeout_count(), 0u);
}

TEST(LockTable, DistinctKeysDoNotBlock) {
    Table t;
    EXPECT_TRUE(t.acquire(1, 1, in(std::chrono::milliseconds(10))));
    EXPECT_TRUE(t.acquire(2, 2, in(std::chrono::milliseconds(10))));
    EXPECT_EQ(t.locked_count(), 2u);
    EXPECT_EQ(t.wait_count(), 0u);
}

} // namespace
