#include "mediagate/orphan_sweeper.hpp"

#include "mediagate/log.hpp"
#include "mediagate/work_dir.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mediagate {

std::size_t sweepOrphanDirectories(const std::filesystem::path& temp_root,
                                   const std::string& prefix,
                                   std::chrono::seconds max_age,
                                   const CompletedDownloadStore* store) {
    std::error_code ec;
    std::filesystem::directory_iterator it{temp_root, ec};
    if (ec) {
        logger()->warn("error scanning {} for orphaned directories: {}", temp_root.string(), ec.message());
        return 0;
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    std::size_t cleaned = 0;
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            logger()->warn("error scanning {} for orphaned directories: {}", temp_root.string(), ec.message());
            break;
        }

        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const auto mtime = std::filesystem::last_write_time(entry.path(), entry_ec);
        if (entry_ec) {
            // removed by someone else between listing and stat
            logger()->debug("could not stat {}: {}", entry.path().string(), entry_ec.message());
            continue;
        }
        if (now - mtime <= max_age) {
            continue;
        }
        if (store && store->tracksDirectory(entry.path())) {
            continue;
        }
        if (removeWorkDir(entry.path())) {
            ++cleaned;
        }
    }

    if (cleaned > 0) {
        logger()->info("cleaned up {} orphaned temp director{}", cleaned, cleaned == 1 ? "y" : "ies");
    }
    return cleaned;
}

struct OrphanSweeper::State {
    std::shared_ptr<CompletedDownloadStore> store;
    SweeperOptions options;
    std::shared_ptr<Metrics> metrics;

    std::mutex mutex;
    std::condition_variable wake;
    bool stop_requested{false};
    std::atomic<bool> running{false};

    SweepReport sweep() {
        SweepReport report;
        report.expired_records = store->evictExpired();
        report.orphan_dirs = sweepOrphanDirectories(options.temp_root, options.prefix, options.orphan_age, store.get());
        if (metrics) {
            metrics->recordSweep(report.expired_records, report.orphan_dirs);
        }
        return report;
    }

    void loop(std::promise<void> exited) {
        logger()->debug("orphan sweeper started, interval {}ms", options.interval.count());
        std::unique_lock<std::mutex> lock(mutex);
        while (!wake.wait_for(lock, options.interval, [this] { return stop_requested; })) {
            lock.unlock();
            try {
                sweep();
            } catch (const std::exception& ex) {
                logger()->error("orphan sweep failed: {}", ex.what());
            }
            lock.lock();
        }
        running = false;
        logger()->debug("orphan sweeper stopped");
        exited.set_value();
    }
};

OrphanSweeper::OrphanSweeper(std::shared_ptr<CompletedDownloadStore> store,
                             SweeperOptions options,
                             std::shared_ptr<Metrics> metrics)
    : state_(std::make_shared<State>()) {
    if (!store) {
        throw std::invalid_argument("orphan sweeper needs a store");
    }
    state_->store = std::move(store);
    state_->options = std::move(options);
    state_->metrics = std::move(metrics);
}

OrphanSweeper::~OrphanSweeper() { stop(); }

void OrphanSweeper::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stop_requested = false;
    }
    state_->running = true;

    std::promise<void> exited;
    exited_ = exited.get_future();
    // The thread co-owns the state so that a detached sweeper stays valid.
    thread_ = std::thread([state = state_, exited = std::move(exited)]() mutable { state->loop(std::move(exited)); });
}

void OrphanSweeper::stop() {
    if (!thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stop_requested = true;
    }
    state_->wake.notify_all();

    if (exited_.wait_for(state_->options.join_timeout) == std::future_status::ready) {
        thread_.join();
    } else {
        logger()->warn("orphan sweeper did not stop within {}ms, detaching", state_->options.join_timeout.count());
        thread_.detach();

        // The detached thread keeps the old state; a later start() gets its own.
        auto fresh = std::make_shared<State>();
        fresh->store = state_->store;
        fresh->options = state_->options;
        fresh->metrics = state_->metrics;
        state_ = std::move(fresh);
    }
}

bool OrphanSweeper::running() const noexcept { return state_->running; }

SweepReport OrphanSweeper::sweepOnce() { return state_->sweep(); }

} // namespace mediagate
