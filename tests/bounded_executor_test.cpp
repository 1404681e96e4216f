#include "mediagate/bounded_executor.hpp"

#include "mediagate/errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace mediagate;
using namespace std::chrono_literals;

namespace {

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

class BoundedExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<AdmissionGate> gate_ = std::make_shared<AdmissionGate>(2);
    std::shared_ptr<Metrics> metrics_ = std::make_shared<Metrics>(false);
    BoundedExecutor executor_{gate_, 4, 50ms, metrics_};
};

TEST_F(BoundedExecutorTest, ReturnsResultAndReleasesPermit) {
    EXPECT_EQ(executor_.runWithTimeout([] { return 42; }, 1s), 42);
    EXPECT_EQ(gate_->outstanding(), 0u);
}

TEST_F(BoundedExecutorTest, RunsVoidWork) {
    bool ran = false;
    executor_.runWithTimeout([&ran] { ran = true; }, 1s);
    EXPECT_TRUE(ran);
}

TEST_F(BoundedExecutorTest, WorkExceptionPassesThroughAndReleasesPermit) {
    EXPECT_THROW(executor_.runWithTimeout([]() -> int { throw NetworkError("connection reset"); }, 1s),
                 NetworkError);
    EXPECT_EQ(gate_->outstanding(), 0u);
}

TEST_F(BoundedExecutorTest, TimeoutDoesNotWaitForTheWork) {
    std::promise<void> unblock;
    auto blocker = unblock.get_future().share();

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(executor_.runWithTimeout([blocker] { blocker.wait(); }, 50ms, "probe"), Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);

    // The caller's slot is back even though the work is still running.
    EXPECT_EQ(gate_->outstanding(), 0u);
    EXPECT_EQ(executor_.inFlight(), 1u);
    EXPECT_EQ(metrics_->snapshot().timeouts, 1u);

    unblock.set_value();
    EXPECT_TRUE(waitFor([this] { return executor_.inFlight() == 0; }));
}

TEST_F(BoundedExecutorTest, ThirdJobDeniedUntilASlotIsReleased) {
    std::promise<void> unblock_first;
    std::promise<void> unblock_second;
    auto first = unblock_first.get_future().share();
    auto second = unblock_second.get_future().share();

    std::thread job1([&] { executor_.runWithTimeout([first] { first.wait(); }, 10s); });
    std::thread job2([&] { executor_.runWithTimeout([second] { second.wait(); }, 10s); });
    ASSERT_TRUE(waitFor([this] { return gate_->outstanding() == 2; }));

    EXPECT_THROW(executor_.runWithTimeout([] { return 3; }, 1s), CapacityExceeded);
    EXPECT_EQ(metrics_->snapshot().capacity_rejections, 1u);

    unblock_first.set_value();
    job1.join();
    EXPECT_EQ(executor_.runWithTimeout([] { return 4; }, 1s), 4);

    unblock_second.set_value();
    job2.join();
    EXPECT_EQ(gate_->outstanding(), 0u);
}

TEST_F(BoundedExecutorTest, ShutdownRejectsNewWork) {
    executor_.shutdown();
    EXPECT_THROW(executor_.runWithTimeout([] { return 1; }, 1s), std::runtime_error);
    EXPECT_EQ(gate_->outstanding(), 0u);
}
