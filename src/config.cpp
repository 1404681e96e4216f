#include "mediagate/config.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

namespace mediagate {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string{value};
}

template <typename T, typename Parse>
void overrideFromEnv(const char* name, T& target, Parse parse) {
    const auto raw = readEnv(name);
    if (!raw) {
        return;
    }

    try {
        std::size_t consumed = 0;
        const auto value = parse(*raw, consumed);
        if (consumed != raw->size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = static_cast<T>(value);
    } catch (const std::exception&) {
        logger()->warn("ignoring invalid value '{}' for {}", *raw, name);
    }
}

void envInt(const char* name, long long& target) {
    overrideFromEnv(name, target, [](const std::string& s, std::size_t& pos) { return std::stoll(s, &pos); });
}

void envDouble(const char* name, double& target) {
    overrideFromEnv(name, target, [](const std::string& s, std::size_t& pos) { return std::stod(s, &pos); });
}

template <typename Duration>
void envDuration(const char* name, Duration& target) {
    long long count = target.count();
    envInt(name, count);
    target = Duration{count};
}

template <typename Unsigned>
void envCount(const char* name, Unsigned& target) {
    long long count = static_cast<long long>(target);
    envInt(name, count);
    if (count < 0) {
        logger()->warn("ignoring negative value {} for {}", count, name);
        return;
    }
    target = static_cast<Unsigned>(count);
}

} // namespace

Config Config::fromEnvironment() {
    Config config;

    envCount("MEDIAGATE_MAX_CONCURRENT_OPS", config.max_concurrent_operations);
    envCount("MEDIAGATE_THREAD_POOL_WORKERS", config.worker_threads);
    envDuration("MEDIAGATE_ADMISSION_WAIT_MS", config.admission_wait);

    envDuration("MEDIAGATE_INFO_TIMEOUT", config.info_timeout);
    envDuration("MEDIAGATE_DOWNLOAD_TIMEOUT", config.download_timeout);
    envDuration("MEDIAGATE_STREAM_TIMEOUT", config.stream_timeout);
    envDuration("MEDIAGATE_ENGINE_SOCKET_TIMEOUT", config.engine_socket_timeout);

    envDuration("MEDIAGATE_DOWNLOAD_EXPIRY", config.download_expiry);
    envCount("MEDIAGATE_MAX_DOWNLOADS", config.max_completed_downloads);

    envDuration("MEDIAGATE_ORPHAN_CLEANUP_AGE", config.orphan_age);
    envDuration("MEDIAGATE_SWEEP_INTERVAL", config.sweep_interval);
    envDuration("MEDIAGATE_PROGRESS_POLL_INTERVAL_MS", config.poll_interval);

    if (const auto root = readEnv("MEDIAGATE_TEMP_ROOT")) {
        config.temp_root = *root;
    }

    envCount("MEDIAGATE_MAX_FILE_SIZE", config.max_file_size);
    envCount("MEDIAGATE_CHUNK_SIZE", config.chunk_size);

    long long retries = config.max_retries;
    envInt("MEDIAGATE_MAX_RETRIES", retries);
    config.max_retries = static_cast<int>(retries);
    envDouble("MEDIAGATE_RETRY_BASE_DELAY", config.retry_base_delay);
    envDouble("MEDIAGATE_RETRY_MAX_DELAY", config.retry_max_delay);

    if (const auto agent = readEnv("MEDIAGATE_USER_AGENT")) {
        config.user_agent = *agent;
    }
    if (const auto metrics = readEnv("MEDIAGATE_METRICS_ENABLED")) {
        config.metrics_enabled = (*metrics == "true" || *metrics == "1");
    }
    if (const auto level = readEnv("MEDIAGATE_LOG_LEVEL")) {
        config.log_level = *level;
    }

    return config;
}

void Config::validate() const {
    if (max_concurrent_operations == 0) {
        throw ConfigError("max_concurrent_operations must be at least 1");
    }
    // Orphaned workers keep their thread until the engine gives up, so the
    // pool needs headroom above the admission capacity.
    if (worker_threads <= max_concurrent_operations) {
        throw ConfigError("worker_threads must be larger than max_concurrent_operations");
    }
    if (max_completed_downloads == 0) {
        throw ConfigError("max_completed_downloads must be at least 1");
    }
    if (admission_wait.count() < 0) {
        throw ConfigError("admission_wait must not be negative");
    }
    if (poll_interval.count() <= 0) {
        throw ConfigError("poll_interval must be positive");
    }
    if (info_timeout.count() <= 0 || download_timeout.count() <= 0 || stream_timeout.count() <= 0) {
        throw ConfigError("operation timeouts must be positive");
    }
    if (sweep_interval.count() <= 0) {
        throw ConfigError("sweep_interval must be positive");
    }
    if (temp_prefix.empty()) {
        throw ConfigError("temp_prefix must not be empty");
    }
    if (chunk_size == 0) {
        throw ConfigError("chunk_size must be positive");
    }
    if (max_retries < 0 || retry_base_delay < 0.0 || retry_max_delay < 0.0) {
        throw ConfigError("retry settings must not be negative");
    }
}

} // namespace mediagate
