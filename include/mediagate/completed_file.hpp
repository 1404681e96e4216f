#pragma once

#include "download_store.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mediagate {

// True when temp_dir is a direct child of temp_root carrying the reserved
// prefix and file_path lives inside temp_dir.
[[nodiscard]] bool validateRecordPaths(const CompletedDownloadRecord& record,
                                       const std::filesystem::path& temp_root,
                                       const std::string& prefix);

// Read side of a taken record. Streams the file in fixed chunks and removes
// the record's temp_dir when destroyed, whether or not it was read to the
// end.
class CompletedFile {
public:
    // Throws DownloadError if the file cannot be opened.
    CompletedFile(CompletedDownloadRecord record, std::size_t chunk_size);
    ~CompletedFile();

    CompletedFile(const CompletedFile&) = delete;
    CompletedFile& operator=(const CompletedFile&) = delete;

    // Empty once the file is exhausted. Throws DownloadError on read failure.
    [[nodiscard]] std::vector<char> readChunk();

    // Copies the remaining content to `destination`, returns bytes written.
    std::uint64_t copyTo(const std::filesystem::path& destination);

    [[nodiscard]] const CompletedDownloadRecord& record() const noexcept { return record_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    CompletedDownloadRecord record_;
    std::size_t chunk_size_;
    std::unique_ptr<FILE, FileDeleter> file_;
};

} // namespace mediagate
