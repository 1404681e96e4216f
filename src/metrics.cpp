#include "mediagate/metrics.hpp"

#include "mediagate/log.hpp"

namespace mediagate {

void Metrics::recordTimeout(const std::string& operation, std::chrono::duration<double> elapsed) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.timeouts;
    }
    if (log_enabled_) {
        logger()->info("METRIC timeout operation={} elapsed={:.2f}s total_timeouts={}", operation, elapsed.count(), total);
    }
}

void Metrics::recordCapacityRejection(const std::string& operation) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.capacity_rejections;
    }
    if (log_enabled_) {
        logger()->info("METRIC capacity_rejected operation={} total_rejections={}", operation, total);
    }
}

void Metrics::recordSuccess(const std::string& operation, std::chrono::duration<double> elapsed) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.successes;
    }
    if (log_enabled_) {
        logger()->debug("METRIC success operation={} elapsed={:.2f}s total_success={}", operation, elapsed.count(), total);
    }
}

void Metrics::recordError(const std::string& operation, const std::string& error, std::chrono::duration<double> elapsed) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.errors;
    }
    if (log_enabled_) {
        logger()->info("METRIC error operation={} error=\"{}\" elapsed={:.2f}s total_errors={}",
                       operation, error, elapsed.count(), total);
    }
}

void Metrics::recordRetry(const std::string& operation, int attempt, std::chrono::milliseconds delay, const std::string& error) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.retries;
    }
    if (log_enabled_) {
        logger()->info("METRIC retry operation={} attempt={} delay={}ms error=\"{}\" total_retries={}",
                       operation, attempt, delay.count(), error, total);
    }
}

void Metrics::recordCancellation(const std::string& operation) {
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = ++counters_.cancellations;
    }
    if (log_enabled_) {
        logger()->info("METRIC cancelled operation={} total_cancellations={}", operation, total);
    }
}

void Metrics::recordSweep(std::size_t expired_records, std::size_t orphan_dirs) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.expired_records += expired_records;
        counters_.orphan_dirs += orphan_dirs;
    }
    if (log_enabled_ && (expired_records > 0 || orphan_dirs > 0)) {
        logger()->info("METRIC sweep expired_records={} orphan_dirs={}", expired_records, orphan_dirs);
    }
}

MetricsSnapshot Metrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace mediagate
