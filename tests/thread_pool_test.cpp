#include "mediagate/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace mediagate;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsEverySubmittedTask) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), 3u);
        for (int i = 0; i < 100; ++i) {
            pool.submit([&counter] { ++counter; });
        }
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillTheWorker) {
    ThreadPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });

    std::promise<int> result;
    auto future = result.get_future();
    pool.submit([&result] { result.set_value(7); });
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get(), 7);
}

TEST(ThreadPoolTest, ReportsBusyWorkers) {
    ThreadPool pool(2);
    std::promise<void> unblock;
    auto blocker = unblock.get_future().share();
    std::promise<void> entered;
    auto entered_future = entered.get_future();

    pool.submit([blocker, &entered] {
        entered.set_value();
        blocker.wait();
    });
    ASSERT_EQ(entered_future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(pool.busy(), 1u);

    unblock.set_value();
    pool.shutdown();
    EXPECT_EQ(pool.busy(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    pool.shutdown();
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroWorkersRejected) {
    EXPECT_THROW(ThreadPool pool(0), std::invalid_argument);
}
