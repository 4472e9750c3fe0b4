/**
 * Worker pool tests
 */

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "pricewatch/common/worker_pool.h"

using pricewatch::common::WorkerPool;

TEST(WorkerPoolTest, ReturnsTaskResults) {
    WorkerPool pool(3);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ConcurrencyBoundedByPoolSize) {
    WorkerPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(pool.submit([&running, &peak]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        }));
    }
    for (auto& result : results) {
        result.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(WorkerPoolTest, ExceptionsReachTheFuture) {
    WorkerPool pool(1);
    auto result = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // Worker survives the exception
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    WorkerPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i) {
        pool.submit([&done]() { done++; });
    }

    pool.shutdown();
    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}
