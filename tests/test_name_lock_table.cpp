/**
 * @file test_name_lock_table.cpp
 * @brief Per-name lock tests
 *
 * @date 2025
 */

#include "dockhand/utils/name_lock_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using dockhand::utils::NameLockTable;

TEST(NameLockTableTest, UncontendedAcquire) {
    NameLockTable table;
    auto guard = table.Acquire("web-1");

    EXPECT_FALSE(guard.Contended());
    EXPECT_EQ(table.ActiveNames(), 1u);
}

TEST(NameLockTableTest, DifferentNamesDoNotBlock) {
    NameLockTable table;
    auto web = table.Acquire("web-1");
    auto db = table.Acquire("db-1");

    EXPECT_FALSE(db.Contended());
    EXPECT_EQ(table.ActiveNames(), 2u);
}

TEST(NameLockTableTest, EntriesVanishWithTheirGuards) {
    NameLockTable table;
    {
        auto guard = table.Acquire("web-1");
    }
    EXPECT_EQ(table.ActiveNames(), 0u);
}

TEST(NameLockTableTest, SecondHolderWaitsAndReportsContention) {
    NameLockTable table;
    std::atomic<bool> second_acquired{false};
    std::atomic<bool> second_contended{false};

    auto first = std::make_unique<NameLockTable::Guard>(table.Acquire("web-1"));

    std::thread waiter([&] {
        auto second = table.Acquire("web-1");
        second_contended = second.Contended();
        second_acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_acquired.load());

    first.reset();
    waiter.join();

    EXPECT_TRUE(second_acquired.load());
    EXPECT_TRUE(second_contended.load());
}
