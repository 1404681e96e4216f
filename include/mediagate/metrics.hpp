#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace mediagate {

struct MetricsSnapshot {
    std::uint64_t timeouts{0};
    std::uint64_t capacity_rejections{0};
    std::uint64_t successes{0};
    std::uint64_t errors{0};
    std::uint64_t retries{0};
    std::uint64_t cancellations{0};
    std::uint64_t expired_records{0};
    std::uint64_t orphan_dirs{0};
};

class Metrics {
public:
    explicit Metrics(bool log_enabled = true) : log_enabled_(log_enabled) {}

    void recordTimeout(const std::string& operation, std::chrono::duration<double> elapsed);
    void recordCapacityRejection(const std::string& operation);
    void recordSuccess(const std::string& operation, std::chrono::duration<double> elapsed);
    void recordError(const std::string& operation, const std::string& error, std::chrono::duration<double> elapsed);
    void recordRetry(const std::string& operation, int attempt, std::chrono::milliseconds delay, const std::string& error);
    void recordCancellation(const std::string& operation);
    void recordSweep(std::size_t expired_records, std::size_t orphan_dirs);

    [[nodiscard]] MetricsSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    MetricsSnapshot counters_;
    bool log_enabled_;
};

} // namespace mediagate
