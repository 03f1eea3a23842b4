// ============= test/test_thread_pool.cpp =============
#include "database/thread_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace autoface;

TEST(ThreadPoolTest, SubmitReturnsResults) {
    ThreadPool pool(4);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, WaitAllDrainsQueue) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 50; ++i) {
        pool.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done++;
        });
    }
    pool.wait_all();
    EXPECT_EQ(done.load(), 50);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST(ThreadPoolTest, ExceptionTravelsInFuture) {
    ThreadPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // El worker sigue vivo
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool(1);
    pool.stop();
    EXPECT_EQ(pool.active_threads(), 0u);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
}
