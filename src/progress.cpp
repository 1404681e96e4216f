#include "mediagate/progress.hpp"

#include <cmath>

namespace mediagate {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool isTerminal(const ProgressEvent& event) noexcept {
    return std::holds_alternative<CompleteEvent>(event) || std::holds_alternative<ErrorEvent>(event);
}

const char* statusName(const ProgressEvent& event) {
    return std::visit(Overloaded{
                          [](const DownloadingEvent&) { return "downloading"; },
                          [](const ProcessingEvent&) { return "processing"; },
                          [](const WaitingEvent&) { return "waiting"; },
                          [](const CompleteEvent&) { return "complete"; },
                          [](const ErrorEvent&) { return "error"; },
                      },
                      event);
}

DownloadingEvent toDownloadingEvent(const TransferProgress& progress) {
    DownloadingEvent event;
    event.downloaded = progress.downloaded_bytes;
    event.total = progress.total_bytes.value_or(progress.total_bytes_estimate.value_or(0));
    if (event.total > 0) {
        const double ratio = static_cast<double>(event.downloaded) / static_cast<double>(event.total);
        event.percent = std::round(ratio * 1000.0) / 10.0;
    }
    event.speed = progress.speed;
    event.eta = progress.eta;
    return event;
}

ErrorEvent toErrorEvent(const ErrorInfo& info) {
    return ErrorEvent{info.kind, info.message, info.retryable};
}

} // namespace mediagate
