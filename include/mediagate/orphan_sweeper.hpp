#pragma once

#include "download_store.hpp"
#include "metrics.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace mediagate {

struct SweeperOptions {
    std::filesystem::path temp_root;
    std::string prefix{"mediagate_"};
    std::chrono::seconds orphan_age{3600};
    std::chrono::milliseconds interval{60000};
    std::chrono::milliseconds join_timeout{5000};
};

struct SweepReport {
    std::size_t expired_records{0};
    std::size_t orphan_dirs{0};
};

// Scans `temp_root` for directories named `<prefix>*` whose mtime is older
// than `max_age` and removes them, skipping anything `store` still tracks.
// Entries that disappear mid-scan are not errors.
std::size_t sweepOrphanDirectories(const std::filesystem::path& temp_root,
                                   const std::string& prefix,
                                   std::chrono::seconds max_age,
                                   const CompletedDownloadStore* store = nullptr);

// Background reclamation of what timed-out or expired operations leave
// behind. Each cycle runs the store's TTL eviction and then an age-based
// scan of the temp root, which is the only way to find directories of
// operations that never reached the store.
class OrphanSweeper {
public:
    OrphanSweeper(std::shared_ptr<CompletedDownloadStore> store,
                  SweeperOptions options,
                  std::shared_ptr<Metrics> metrics = nullptr);
    ~OrphanSweeper();

    OrphanSweeper(const OrphanSweeper&) = delete;
    OrphanSweeper& operator=(const OrphanSweeper&) = delete;

    void start();

    // Signals the thread and waits up to join_timeout. A thread stuck in
    // filesystem I/O past that is detached.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    // One synchronous cycle.
    SweepReport sweepOnce();

private:
    struct State;

    std::shared_ptr<State> state_;
    std::thread thread_;
    std::future<void> exited_;
};

} // namespace mediagate
