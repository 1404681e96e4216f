#include "mediagate/download_store.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"
#include "mediagate/token.hpp"
#include "mediagate/work_dir.hpp"

#include <algorithm>
#include <utility>

namespace mediagate {

namespace {

void requireField(bool present, const char* field) {
    if (!present) {
        throw StoreValidationError(std::string{"completed download is missing required field '"} + field + "'");
    }
}

} // namespace

CompletedDownloadStore::CompletedDownloadStore(StoreOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (options_.max_entries == 0) {
        throw std::invalid_argument("store capacity must be at least 1");
    }
}

std::string CompletedDownloadStore::store(CompletedDownload download) {
    requireField(!download.file_path.empty(), "file_path");
    requireField(!download.temp_dir.empty(), "temp_dir");
    requireField(!download.filename.empty(), "filename");
    requireField(!download.content_type.empty(), "content_type");

    CompletedDownloadRecord record;
    static_cast<CompletedDownload&>(record) = std::move(download);
    record.created_at = clock_();

    std::vector<std::filesystem::path> victims;
    std::size_t capacity_evictions = 0;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        collectExpiredLocked(record.created_at, victims);

        // A burst of completions between sweeps can overshoot by more than one.
        while (records_.size() >= options_.max_entries) {
            evictOldestLocked(victims);
            ++capacity_evictions;
        }

        do {
            id = generateToken();
        } while (records_.count(id) != 0);
        record.id = id;
        records_.emplace(id, std::move(record));
    }

    if (capacity_evictions > 0) {
        logger()->warn("evicted {} oldest download(s) due to capacity limit {}", capacity_evictions,
                       options_.max_entries);
    }
    removeDirectories(victims);
    return id;
}

std::optional<CompletedDownloadRecord> CompletedDownloadStore::take(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    CompletedDownloadRecord record = std::move(it->second);
    records_.erase(it);
    return record;
}

std::size_t CompletedDownloadStore::evictExpired() {
    std::vector<std::filesystem::path> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        collectExpiredLocked(clock_(), victims);
    }
    removeDirectories(victims);
    if (!victims.empty()) {
        logger()->info("cleaned up {} expired download(s)", victims.size());
    }
    return victims.size();
}

std::size_t CompletedDownloadStore::evictAll() {
    std::vector<std::filesystem::path> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        victims.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            victims.push_back(record.temp_dir);
        }
        records_.clear();
    }
    removeDirectories(victims);
    return victims.size();
}

bool CompletedDownloadStore::tracksDirectory(const std::filesystem::path& dir) const {
    const auto wanted = dir.lexically_normal();
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(records_.begin(), records_.end(), [&](const auto& entry) {
        return entry.second.temp_dir.lexically_normal() == wanted;
    });
}

std::size_t CompletedDownloadStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void CompletedDownloadStore::collectExpiredLocked(std::chrono::system_clock::time_point now,
                                                  std::vector<std::filesystem::path>& victims) {
    for (auto it = records_.begin(); it != records_.end();) {
        if (now - it->second.created_at > options_.ttl) {
            victims.push_back(it->second.temp_dir);
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

void CompletedDownloadStore::evictOldestLocked(std::vector<std::filesystem::path>& victims) {
    const auto oldest = std::min_element(records_.begin(), records_.end(), [](const auto& a, const auto& b) {
        return a.second.created_at < b.second.created_at;
    });
    if (oldest == records_.end()) {
        return;
    }
    victims.push_back(oldest->second.temp_dir);
    records_.erase(oldest);
}

void CompletedDownloadStore::removeDirectories(const std::vector<std::filesystem::path>& victims) {
    for (const auto& dir : victims) {
        removeWorkDir(dir);
    }
}

} // namespace mediagate
