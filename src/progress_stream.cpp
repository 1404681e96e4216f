#include "mediagate/progress_stream.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"
#include "mediagate/work_dir.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace mediagate {

// Everything the worker thread touches. Co-owned by the worker so a detached
// worker never outlives what it writes to.
struct ProgressStream::Shared {
    std::mutex mutex;
    std::condition_variable changed;
    std::deque<ProgressEvent> queue;
    bool done{false};
    std::filesystem::path produced;
    std::exception_ptr error;
    std::atomic<bool> cancelled{false};

    void push(ProgressEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(std::move(event));
        }
        changed.notify_all();
    }

    void finish(std::filesystem::path path, std::exception_ptr failure) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            produced = std::move(path);
            error = std::move(failure);
            done = true;
        }
        changed.notify_all();
    }

    // Returns early once the worker is done and nothing is left to deliver.
    std::optional<ProgressEvent> poll(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait_for(lock, timeout, [this] { return !queue.empty() || done; });
        if (queue.empty()) {
            return std::nullopt;
        }
        ProgressEvent event = std::move(queue.front());
        queue.pop_front();
        return event;
    }

    bool waitDone(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return changed.wait_for(lock, timeout, [this] { return done; });
    }

    bool drained() {
        std::lock_guard<std::mutex> lock(mutex);
        return done && queue.empty();
    }
};

ProgressStream::ProgressStream(EnginePtr engine,
                               DownloadRequest request,
                               Permit permit,
                               std::shared_ptr<CompletedDownloadStore> store,
                               StreamOptions options,
                               std::shared_ptr<Metrics> metrics)
    : engine_(std::move(engine)),
      request_(std::move(request)),
      store_(std::move(store)),
      options_(std::move(options)),
      metrics_(std::move(metrics)),
      permit_(std::move(permit)),
      shared_(std::make_shared<Shared>()) {
    if (!engine_ || !store_) {
        throw std::invalid_argument("progress stream needs an engine and a store");
    }
    work_dir_ = createWorkDir(options_.temp_root, options_.temp_prefix);
}

ProgressStream::~ProgressStream() { close(); }

std::optional<ProgressEvent> ProgressStream::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return std::nullopt;
    }

    try {
        return nextLocked();
    } catch (const std::exception& ex) {
        logger()->error("progress stream for {} failed: {}", request_.url, ex.what());
        return fail(std::current_exception());
    }
}

ProgressEvent ProgressStream::nextLocked() {
    if (!started_) {
        startWorker();
    }

    if (std::chrono::steady_clock::now() - started_at_ >= options_.stream_timeout) {
        return timeOut();
    }

    if (auto event = shared_->poll(options_.poll_interval)) {
        return std::move(*event);
    }
    if (shared_->drained()) {
        return finishFromWorker();
    }
    // heartbeat keeps the transport connection open
    return WaitingEvent{};
}

void ProgressStream::startWorker() {
    started_ = true;
    started_at_ = std::chrono::steady_clock::now();

    worker_ = std::thread([shared = shared_, engine = engine_, request = request_, dir = work_dir_]() {
        EngineHooks hooks;
        hooks.on_progress = [shared](const TransferProgress& progress) {
            if (shared->cancelled) {
                throw Cancelled{};
            }
            if (progress.phase == TransferProgress::Phase::Downloading) {
                shared->push(toDownloadingEvent(progress));
            } else {
                shared->push(ProcessingEvent{"Processing file..."});
            }
        };
        hooks.on_postprocess = [shared](const PostProcessStatus& status) {
            if (shared->cancelled) {
                throw Cancelled{};
            }
            if (status.phase == PostProcessStatus::Phase::Started) {
                shared->push(ProcessingEvent{"Converting..."});
            }
        };

        std::filesystem::path produced;
        std::exception_ptr failure;
        try {
            produced = engine->download(request, dir, hooks);
        } catch (...) {
            failure = std::current_exception();
        }
        shared->finish(std::move(produced), std::move(failure));
    });
}

ProgressEvent ProgressStream::finishFromWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }

    std::filesystem::path reported;
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        reported = shared_->produced;
        failure = shared_->error;
    }
    if (failure) {
        return fail(failure);
    }

    try {
        return publishResult(reported);
    } catch (const std::exception&) {
        return fail(std::current_exception());
    }
}

ProgressEvent ProgressStream::publishResult(const std::filesystem::path& reported) {
    CompletedDownload download =
        collectCompletedDownload(work_dir_, reported, request_.audio_only, options_.max_file_size);

    CompleteEvent complete;
    complete.filename = download.filename;
    complete.size = download.file_size;
    complete.id = store_->store(std::move(download));

    finished_ = true;
    if (metrics_) {
        metrics_->recordSuccess("stream", std::chrono::steady_clock::now() - started_at_);
    }
    releaseResources(true);
    return complete;
}

ProgressEvent ProgressStream::fail(std::exception_ptr error) {
    const ErrorInfo info = describeError(error);
    finished_ = true;
    if (started_) {
        stopWorker();
    }
    if (metrics_) {
        metrics_->recordError("stream", info.message, std::chrono::steady_clock::now() - started_at_);
    }
    releaseResources(false);
    return toErrorEvent(info);
}

ProgressEvent ProgressStream::timeOut() {
    const std::chrono::duration<double> limit = options_.stream_timeout;
    logger()->warn("progress stream for {} exceeded {:.1f}s, giving up", request_.url, limit.count());
    finished_ = true;
    stopWorker();
    if (metrics_) {
        metrics_->recordTimeout("stream", std::chrono::steady_clock::now() - started_at_);
    }
    releaseResources(false);
    return ErrorEvent{ErrorKind::Timeout,
                      fmt::format("download did not finish within {:.1f} seconds", limit.count()), true};
}

void ProgressStream::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    try {
        if (!finished_) {
            finished_ = true;
            logger()->info("client disconnected, cancelling download for {}", request_.url);
            if (started_) {
                stopWorker();
            }
            if (metrics_) {
                metrics_->recordCancellation("stream");
            }
            releaseResources(false);
        } else if (worker_.joinable()) {
            worker_.detach();
        }
    } catch (const std::exception& ex) {
        logger()->error("error while closing progress stream for {}: {}", request_.url, ex.what());
        if (worker_.joinable()) {
            worker_.detach();
        }
    }
    permit_.release();
}

bool ProgressStream::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool ProgressStream::holdsPermit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permit_.held();
}

void ProgressStream::stopWorker() {
    shared_->cancelled = true;
    if (!worker_.joinable()) {
        return;
    }
    if (shared_->waitDone(options_.cancel_join_timeout)) {
        worker_.join();
        return;
    }
    logger()->warn("worker for {} did not stop within {}ms, leaving it to the engine timeout",
                   request_.url, options_.cancel_join_timeout.count());
    worker_.detach();
}

void ProgressStream::releaseResources(bool keep_work_dir) noexcept {
    if (!keep_work_dir && !work_dir_.empty()) {
        removeWorkDir(work_dir_);
    }
    permit_.release();
}

} // namespace mediagate
