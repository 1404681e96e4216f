#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediagate {

struct CompletedDownload {
    std::filesystem::path file_path;
    std::filesystem::path temp_dir;
    std::string filename;
    std::uint64_t file_size{0};
    std::string content_type;
};

struct CompletedDownloadRecord : CompletedDownload {
    std::string id;
    std::chrono::system_clock::time_point created_at;
};

struct StoreOptions {
    std::chrono::seconds ttl{300};
    std::size_t max_entries{100};
};

// Single-use hand-off of finished downloads, keyed by an unguessable id.
//
// The store owns each record's temp_dir until the record is taken; evicted
// records have their directory removed. Filesystem work always happens after
// the map lock is released.
//
// Paths are stored verbatim. Whoever opens them must check them first (see
// validateRecordPaths).
class CompletedDownloadStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit CompletedDownloadStore(StoreOptions options, Clock clock = nullptr);

    CompletedDownloadStore(const CompletedDownloadStore&) = delete;
    CompletedDownloadStore& operator=(const CompletedDownloadStore&) = delete;

    // Throws StoreValidationError when a required field is empty.
    std::string store(CompletedDownload download);

    // Removes and returns the record. Ids are single use.
    [[nodiscard]] std::optional<CompletedDownloadRecord> take(const std::string& id);

    // Drops every record older than the TTL. Returns how many were dropped.
    std::size_t evictExpired();

    // Drops everything, used at shutdown.
    std::size_t evictAll();

    [[nodiscard]] bool tracksDirectory(const std::filesystem::path& dir) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }

private:
    void collectExpiredLocked(std::chrono::system_clock::time_point now, std::vector<std::filesystem::path>& victims);
    void evictOldestLocked(std::vector<std::filesystem::path>& victims);
    static void removeDirectories(const std::vector<std::filesystem::path>& victims);

    StoreOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CompletedDownloadRecord> records_;
};

} // namespace mediagate
