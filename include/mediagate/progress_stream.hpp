#pragma once

#include "admission_gate.hpp"
#include "download_store.hpp"
#include "engine.hpp"
#include "metrics.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mediagate {

struct StreamOptions {
    std::filesystem::path temp_root;
    std::string temp_prefix{"mediagate_"};
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds stream_timeout{600000};
    std::chrono::milliseconds cancel_join_timeout{2000};
    std::uint64_t max_file_size{0}; // 0 = unlimited
};

// Lazy, finite, single-pass sequence of progress events for one download.
//
// The first next() starts a dedicated worker thread running the engine.
// Every sequence ends with exactly one terminal event (complete or error)
// and next() returns nullopt afterwards. Failures never escape as
// exceptions.
//
// Whoever consumes the stream must call close() when it stops early; the
// destructor does so as a last resort. close() works even if next() was never
// called: the permit is returned and the working directory removed without a
// worker ever being started.
//
// Cancellation is cooperative. The engine hooks throw Cancelled once the
// stream is closed; a worker stuck inside the engine past
// cancel_join_timeout is detached and runs on until the engine gives up.
class ProgressStream {
public:
    // Takes ownership of `permit` and creates the working directory. Throws
    // TempDirError, in which case the permit is released.
    ProgressStream(EnginePtr engine,
                   DownloadRequest request,
                   Permit permit,
                   std::shared_ptr<CompletedDownloadStore> store,
                   StreamOptions options,
                   std::shared_ptr<Metrics> metrics = nullptr);
    ~ProgressStream();

    ProgressStream(const ProgressStream&) = delete;
    ProgressStream& operator=(const ProgressStream&) = delete;

    [[nodiscard]] std::optional<ProgressEvent> next();

    // Idempotent.
    void close() noexcept;

    [[nodiscard]] bool finished() const;
    [[nodiscard]] bool holdsPermit() const;
    [[nodiscard]] const std::filesystem::path& workDir() const noexcept { return work_dir_; }
    [[nodiscard]] const DownloadRequest& request() const noexcept { return request_; }

private:
    struct Shared;

    ProgressEvent nextLocked();
    void startWorker();
    ProgressEvent finishFromWorker();
    ProgressEvent publishResult(const std::filesystem::path& reported);
    ProgressEvent fail(std::exception_ptr error);
    ProgressEvent timeOut();
    void stopWorker();
    void releaseResources(bool keep_work_dir) noexcept;

    EnginePtr engine_;
    DownloadRequest request_;
    std::shared_ptr<CompletedDownloadStore> store_;
    StreamOptions options_;
    std::shared_ptr<Metrics> metrics_;

    mutable std::mutex mutex_;
    Permit permit_;
    std::filesystem::path work_dir_;
    std::shared_ptr<Shared> shared_;
    std::thread worker_;
    std::chrono::steady_clock::time_point started_at_;
    bool started_{false};
    bool finished_{false};
    bool closed_{false};
};

} // namespace mediagate
