#include "mediagate/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace mediagate {

CapacityExceeded::CapacityExceeded(std::size_t capacity)
    : TransientError(fmt::format("server busy: {} concurrent operations already running, retry later", capacity)),
      capacity_(capacity) {}

Timeout::Timeout(std::chrono::milliseconds deadline)
    : TransientError(fmt::format("operation timed out after {}; it may still be running", deadline)),
      deadline_(deadline) {}

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Transient:
        return "transient";
    case ErrorKind::Permanent:
        return "permanent";
    case ErrorKind::Timeout:
        return "timeout";
    }
    return "permanent";
}

ErrorInfo describeError(std::exception_ptr error) {
    if (!error) {
        return {ErrorKind::Permanent, "unknown error", false};
    }

    try {
        std::rethrow_exception(error);
    } catch (const Timeout& ex) {
        return {ErrorKind::Timeout, ex.what(), true};
    } catch (const TransientError& ex) {
        return {ErrorKind::Transient, ex.what(), true};
    } catch (const PermanentError& ex) {
        return {ErrorKind::Permanent, ex.what(), false};
    } catch (const std::exception& ex) {
        return {ErrorKind::Permanent, ex.what(), false};
    } catch (...) {
        return {ErrorKind::Permanent, "unknown error", false};
    }
}

bool looksTransient(const std::string& message) {
    std::string lowered = message;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("network") != std::string::npos ||
           lowered.find("connection") != std::string::npos ||
           lowered.find("timeout") != std::string::npos ||
           lowered.find("timed out") != std::string::npos;
}

void throwClassifiedEngineError(const std::string& message) {
    if (looksTransient(message)) {
        throw NetworkError(fmt::format("network error during download: {}", message));
    }
    throw DownloadError(fmt::format("download failed: {}", message));
}

std::chrono::milliseconds backoffDelay(int attempt, double base_seconds, double max_seconds) {
    const double delay = std::min(base_seconds * std::pow(2.0, std::max(0, attempt)), max_seconds);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, delay) * 1000.0));
}

BoundaryStatus classifyForBoundary(std::exception_ptr error) {
    if (!error) {
        return BoundaryStatus::PassThrough;
    }

    try {
        std::rethrow_exception(error);
    } catch (const CapacityExceeded&) {
        return BoundaryStatus::RetryLater;
    } catch (const Timeout&) {
        return BoundaryStatus::RetryLaterMayBeRunning;
    } catch (...) {
        return BoundaryStatus::PassThrough;
    }
}

} // namespace mediagate
