/**
 * @file test_blocking_pool.cpp
 * @brief Unit tests for BlockingPool.
 */

#include "executor/blocking_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace proc_sandbox;

TEST(BlockingPoolTest, BasicSubmit) {
    BlockingPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(BlockingPoolTest, MultipleSubmissions) {
    BlockingPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(BlockingPoolTest, DeadlineRaceAgainstBlockingWork) {
    BlockingPool pool(1);
    std::atomic<bool> release{false};
    auto future = pool.submit([&release] {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds{5});
        return 7;
    });

    EXPECT_EQ(future.wait_for(std::chrono::milliseconds{50}), std::future_status::timeout);
    release = true;
    EXPECT_EQ(future.get(), 7);
}

TEST(BlockingPoolTest, ExceptionsReachTheFuture) {
    BlockingPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(BlockingPoolTest, QueuedWorkRunsBeforeShutdown) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    {
        BlockingPool pool(1);
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
                counter.fetch_add(1);
            }));
        }
    }
    EXPECT_EQ(counter.load(), 20);
    for (auto& f : futures) EXPECT_NO_THROW(f.get());
}

TEST(BlockingPoolTest, ThreadCount) {
    BlockingPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    BlockingPool sized_by_hardware;
    EXPECT_GT(sized_by_hardware.thread_count(), 0u);
}

TEST(BlockingPoolTest, BusyWorkersDoNotDelayNewWork) {
    BlockingPool pool(1);
    std::atomic<bool> release{false};
    auto blocked = pool.submit([&release] {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds{5});
        return 1;
    });

    auto quick = pool.submit([] { return 2; });
    EXPECT_EQ(quick.wait_for(std::chrono::seconds{5}), std::future_status::ready);
    EXPECT_EQ(quick.get(), 2);
    EXPECT_EQ(pool.thread_count(), 2u);

    release = true;
    EXPECT_EQ(blocked.get(), 1);
}

TEST(BlockingPoolTest, IdleWorkersAreReused) {
    BlockingPool pool(2);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(pool.submit([i] { return i; }).get(), i);
    }
    EXPECT_EQ(pool.thread_count(), 2u);
}
