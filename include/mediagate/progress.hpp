#pragma once

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mediagate {

// What an engine reports from its transfer callback.
struct TransferProgress {
    enum class Phase { Downloading, Finished };

    Phase phase{Phase::Downloading};
    std::string filename;
    std::uint64_t downloaded_bytes{0};
    std::optional<std::uint64_t> total_bytes;
    std::optional<std::uint64_t> total_bytes_estimate;
    std::optional<double> speed;
    std::optional<std::int64_t> eta;
};

struct PostProcessStatus {
    enum class Phase { Started, Processing, Finished };

    Phase phase{Phase::Started};
    std::string processor;
};

struct DownloadingEvent {
    double percent{0.0};
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    std::optional<double> speed;
    std::optional<std::int64_t> eta;
};

struct ProcessingEvent {
    std::string message;
};

struct WaitingEvent {};

struct CompleteEvent {
    std::string id;
    std::string filename;
    std::uint64_t size{0};
};

struct ErrorEvent {
    ErrorKind kind{ErrorKind::Permanent};
    std::string message;
    bool retryable{false};
};

using ProgressEvent = std::variant<DownloadingEvent, ProcessingEvent, WaitingEvent, CompleteEvent, ErrorEvent>;

[[nodiscard]] bool isTerminal(const ProgressEvent& event) noexcept;

[[nodiscard]] const char* statusName(const ProgressEvent& event);

[[nodiscard]] DownloadingEvent toDownloadingEvent(const TransferProgress& progress);

[[nodiscard]] ErrorEvent toErrorEvent(const ErrorInfo& info);

} // namespace mediagate
