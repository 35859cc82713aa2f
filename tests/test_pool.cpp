/*
 * devcat - Bulk Device Category Reassignment
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "devcat/pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace devcat;

TEST(PoolTest, RunsEverySubmittedTaskOnce) {
    std::vector<std::atomic<int>> hits(50);
    Pool pool(4);
    ASSERT_TRUE(pool.start([&](std::size_t task, int) { ++hits[task]; }));

    for (std::size_t i = 0; i < hits.size(); ++i) {
        ASSERT_TRUE(pool.submit(i));
    }
    pool.waitIdle();
    pool.stop();

    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }
}

TEST(PoolTest, UsesSeveralWorkers) {
    std::mutex mutex;
    std::set<int> workers;
    Pool pool(3);
    ASSERT_TRUE(pool.start([&](std::size_t, int workerId) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::lock_guard<std::mutex> lock(mutex);
        workers.insert(workerId);
    }));

    for (std::size_t i = 0; i < 9; ++i) {
        ASSERT_TRUE(pool.submit(i));
    }
    pool.waitIdle();

    EXPECT_GT(workers.size(), 1u);
    EXPECT_EQ(pool.workerCount(), 3);
}

TEST(PoolTest, RejectsWorkBeforeStartAndAfterStop) {
    Pool pool(2);
    EXPECT_FALSE(pool.submit(0));

    ASSERT_TRUE(pool.start([](std::size_t, int) {}));
    EXPECT_FALSE(pool.start([](std::size_t, int) {}));
    pool.stop();

    EXPECT_FALSE(pool.isRunning());
    EXPECT_FALSE(pool.submit(1));
}

TEST(PoolTest, RejectsEmptyProcessor) {
    Pool pool(1);
    EXPECT_FALSE(pool.start(TaskProcessor()));
}

TEST(PoolTest, WaitIdleReturnsImmediatelyWhenNothingQueued) {
    Pool pool(2);
    ASSERT_TRUE(pool.start([](std::size_t, int) {}));
    pool.waitIdle();
    EXPECT_EQ(pool.queueSize(), 0u);
}

TEST(PoolTest, ThrowingTaskDoesNotStallThePool) {
    std::atomic<int> done{0};
    Pool pool(2);
    ASSERT_TRUE(pool.start([&](std::size_t task, int) {
        if (task == 0) throw std::runtime_error("boom");
        ++done;
    }));

    for (std::size_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool.submit(i));
    }
    pool.waitIdle();

    EXPECT_EQ(done.load(), 3);
}
