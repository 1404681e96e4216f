#include "mediagate/download_service.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"
#include "mediagate/work_dir.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace mediagate {

DownloadService::DownloadService(Config config, EnginePtr engine)
    : config_(std::move(config)), engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("download service needs an engine");
    }
    config_.validate();
    setLogLevel(config_.log_level);

    metrics_ = std::make_shared<Metrics>(config_.metrics_enabled);
    gate_ = std::make_shared<AdmissionGate>(config_.max_concurrent_operations);

    StoreOptions store_options;
    store_options.ttl = config_.download_expiry;
    store_options.max_entries = config_.max_completed_downloads;
    store_ = std::make_shared<CompletedDownloadStore>(store_options);

    executor_ = std::make_unique<BoundedExecutor>(gate_, config_.worker_threads, config_.admission_wait, metrics_);

    SweeperOptions sweeper_options;
    sweeper_options.temp_root = config_.temp_root;
    sweeper_options.prefix = config_.temp_prefix;
    sweeper_options.orphan_age = config_.orphan_age;
    sweeper_options.interval = config_.sweep_interval;
    sweeper_options.join_timeout = config_.sweeper_join_timeout;
    sweeper_ = std::make_unique<OrphanSweeper>(store_, sweeper_options, metrics_);

    logger()->info("{} engine ready: {} concurrent operations, {} workers, temp root {}",
                   engine_->name(), config_.max_concurrent_operations, config_.worker_threads,
                   config_.temp_root.string());
}

DownloadService::~DownloadService() {
    try {
        shutdown();
    } catch (const std::exception& ex) {
        logger()->error("error during shutdown: {}", ex.what());
    }
}

void DownloadService::start() {
    if (stopped_) {
        throw std::logic_error("download service was already shut down");
    }
    sweeper_->start();
}

void DownloadService::shutdown() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    sweeper_->stop();
    executor_->shutdown();
    const std::size_t dropped = store_->evictAll();
    if (dropped > 0) {
        logger()->info("dropped {} unclaimed download(s) at shutdown", dropped);
    }
}

MediaInfo DownloadService::probe(const std::string& url) {
    const auto started = std::chrono::steady_clock::now();
    MediaInfo info = executor_->runWithTimeout([engine = engine_, url]() { return engine->probe(url); },
                                               config_.info_timeout, "probe");
    metrics_->recordSuccess("probe", std::chrono::steady_clock::now() - started);
    return info;
}

CompletedDownloadRecord DownloadService::download(const DownloadRequest& request) {
    // Set once the caller stops waiting; the work then cleans up after itself.
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    const auto started = std::chrono::steady_clock::now();

    auto work = [engine = engine_, store = store_, request, abandoned, root = config_.temp_root,
                 prefix = config_.temp_prefix, max_size = config_.max_file_size]() {
        if (*abandoned) {
            logger()->info("download of {} was given up before it started, skipping", request.url);
            return CompletedDownloadRecord{};
        }
        const auto dir = createWorkDir(root, prefix);
        try {
            const auto reported = engine->download(request, dir, EngineHooks{});
            CompletedDownload completed = collectCompletedDownload(dir, reported, request.audio_only, max_size);
            if (*abandoned) {
                logger()->info("download of {} finished after its caller gave up, discarding", request.url);
                removeWorkDir(dir);
                return CompletedDownloadRecord{};
            }

            CompletedDownloadRecord record;
            static_cast<CompletedDownload&>(record) = completed;
            record.created_at = std::chrono::system_clock::now();
            record.id = store->store(std::move(completed));
            return record;
        } catch (...) {
            removeWorkDir(dir);
            throw;
        }
    };

    try {
        CompletedDownloadRecord record = executor_->runWithTimeout(std::move(work), config_.download_timeout, "download");
        metrics_->recordSuccess("download", std::chrono::steady_clock::now() - started);
        return record;
    } catch (const Timeout&) {
        *abandoned = true;
        throw;
    } catch (const CapacityExceeded&) {
        throw;
    } catch (const std::exception& ex) {
        metrics_->recordError("download", ex.what(), std::chrono::steady_clock::now() - started);
        throw;
    }
}

std::unique_ptr<ProgressStream> DownloadService::openProgressStream(const DownloadRequest& request) {
    Permit permit;
    try {
        permit = gate_->acquire(config_.admission_wait);
    } catch (const CapacityExceeded&) {
        metrics_->recordCapacityRejection("stream");
        throw;
    }

    StreamOptions options;
    options.temp_root = config_.temp_root;
    options.temp_prefix = config_.temp_prefix;
    options.poll_interval = config_.poll_interval;
    options.stream_timeout = config_.stream_timeout;
    options.cancel_join_timeout = config_.cancel_join_timeout;
    options.max_file_size = config_.max_file_size;
    return std::make_unique<ProgressStream>(engine_, request, std::move(permit), store_, std::move(options), metrics_);
}

std::optional<CompletedDownloadRecord> DownloadService::take(const std::string& id) { return store_->take(id); }

} // namespace mediagate
