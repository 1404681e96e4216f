#include "mediagate/bounded_executor.hpp"

#include <stdexcept>

namespace mediagate {

BoundedExecutor::BoundedExecutor(std::shared_ptr<AdmissionGate> gate,
                                 std::size_t worker_threads,
                                 std::chrono::milliseconds admission_wait,
                                 std::shared_ptr<Metrics> metrics)
    : gate_(std::move(gate)),
      admission_wait_(admission_wait),
      metrics_(std::move(metrics)),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0)),
      pool_(worker_threads) {
    if (!gate_) {
        throw std::invalid_argument("bounded executor needs an admission gate");
    }
    if (worker_threads <= gate_->capacity()) {
        logger()->warn("worker pool ({}) is not larger than admission capacity ({}); "
                       "timed-out work can starve new submissions",
                       worker_threads, gate_->capacity());
    }
}

void BoundedExecutor::shutdown() {
    const auto running = in_flight_->load();
    if (running > 0) {
        logger()->info("waiting for {} in-flight task(s) to return", running);
    }
    pool_.shutdown();
}

} // namespace mediagate
