#pragma once

#include "admission_gate.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace mediagate {

// Runs one blocking engine call on the pool under a wall-clock deadline.
//
// The engine cannot be interrupted, so a deadline only stops the *caller*
// from waiting: the worker keeps running until the engine's own low-level
// timeout fires. That orphan occupies a pool thread but no admission slot,
// which is why the pool is sized above the gate capacity.
class BoundedExecutor {
public:
    BoundedExecutor(std::shared_ptr<AdmissionGate> gate,
                    std::size_t worker_threads,
                    std::chrono::milliseconds admission_wait,
                    std::shared_ptr<Metrics> metrics = nullptr);

    BoundedExecutor(const BoundedExecutor&) = delete;
    BoundedExecutor& operator=(const BoundedExecutor&) = delete;

    // Throws CapacityExceeded, Timeout, or whatever `work` throws.
    template <typename F>
    auto runWithTimeout(F&& work, std::chrono::milliseconds deadline, const std::string& operation = "operation")
        -> std::invoke_result_t<std::decay_t<F>&>;

    // Submitted work that has not returned yet, orphans included.
    [[nodiscard]] std::size_t inFlight() const noexcept { return in_flight_->load(); }

    [[nodiscard]] AdmissionGate& gate() noexcept { return *gate_; }

    // Blocks until every worker has returned.
    void shutdown();

private:
    std::shared_ptr<AdmissionGate> gate_;
    std::chrono::milliseconds admission_wait_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
    ThreadPool pool_;
};

template <typename F>
auto BoundedExecutor::runWithTimeout(F&& work, std::chrono::milliseconds deadline, const std::string& operation)
    -> std::invoke_result_t<std::decay_t<F>&> {
    using Result = std::invoke_result_t<std::decay_t<F>&>;

    Permit permit;
    try {
        permit = gate_->acquire(admission_wait_);
    } catch (const CapacityExceeded&) {
        if (metrics_) {
            metrics_->recordCapacityRejection(operation);
        }
        throw;
    }

    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(work));
    std::future<Result> result = task->get_future();

    in_flight_->fetch_add(1);
    try {
        pool_.submit([task, in_flight = in_flight_]() {
            (*task)();
            in_flight->fetch_sub(1);
        });
    } catch (...) {
        in_flight_->fetch_sub(1);
        throw;
    }

    const auto started = std::chrono::steady_clock::now();
    if (result.wait_for(deadline) == std::future_status::timeout) {
        if (metrics_) {
            metrics_->recordTimeout(operation, std::chrono::steady_clock::now() - started);
        }
        logger()->warn("{} timed out after {}ms, {} task(s) still running on the pool",
                       operation, deadline.count(), in_flight_->load());
        throw Timeout(deadline);
    }

    if constexpr (std::is_void_v<Result>) {
        result.get();
    } else {
        return result.get();
    }
}

} // namespace mediagate
