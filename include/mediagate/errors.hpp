#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace mediagate {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Worth retrying after a back-off.
class TransientError : public Error {
public:
    using Error::Error;
};

class PermanentError : public Error {
public:
    using Error::Error;
};

class CapacityExceeded final : public TransientError {
public:
    explicit CapacityExceeded(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
};

// The deadline elapsed. The work may still be running and nothing it did has
// been undone.
class Timeout final : public TransientError {
public:
    explicit Timeout(std::chrono::milliseconds deadline);

    [[nodiscard]] std::chrono::milliseconds deadline() const noexcept { return deadline_; }

private:
    std::chrono::milliseconds deadline_;
};

class NetworkError final : public TransientError {
public:
    using TransientError::TransientError;
};

class RateLimitError final : public TransientError {
public:
    using TransientError::TransientError;
};

class ServerError final : public TransientError {
public:
    using TransientError::TransientError;
};

class ExtractionError final : public PermanentError {
public:
    using PermanentError::PermanentError;
};

class DownloadError final : public PermanentError {
public:
    using PermanentError::PermanentError;
};

class ContentError final : public PermanentError {
public:
    using PermanentError::PermanentError;
};

class FileSizeLimitError final : public PermanentError {
public:
    using PermanentError::PermanentError;
};

// Raised from engine hooks once the consumer has abandoned the operation.
class Cancelled final : public Error {
public:
    Cancelled() : Error("operation cancelled by client") {}
};

class TempDirError final : public Error {
public:
    using Error::Error;
};

class StoreValidationError final : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class ConfigError final : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

enum class ErrorKind {
    Transient,
    Permanent,
    Timeout,
};

struct ErrorInfo {
    ErrorKind kind{ErrorKind::Permanent};
    std::string message;
    bool retryable{false};
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// Unknown exception types are treated as permanent so that programming
// errors are not retried.
[[nodiscard]] ErrorInfo describeError(std::exception_ptr error);

// Maps free-form engine failure text to a classified exception type.
[[noreturn]] void throwClassifiedEngineError(const std::string& message);

[[nodiscard]] bool looksTransient(const std::string& message);

// min(base * 2^attempt, max)
[[nodiscard]] std::chrono::milliseconds backoffDelay(int attempt, double base_seconds, double max_seconds);

// How the outer boundary should answer a failed call.
enum class BoundaryStatus {
    RetryLater,
    RetryLaterMayBeRunning,
    PassThrough,
};

[[nodiscard]] BoundaryStatus classifyForBoundary(std::exception_ptr error);

} // namespace mediagate
