#include "mediagate/completed_file.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"
#include "mediagate/work_dir.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace mediagate {

bool validateRecordPaths(const CompletedDownloadRecord& record,
                         const std::filesystem::path& temp_root,
                         const std::string& prefix) {
    const auto root = temp_root.lexically_normal();
    const auto dir = record.temp_dir.lexically_normal();
    const auto file = record.file_path.lexically_normal();

    if (dir.parent_path() != root) {
        return false;
    }
    const std::string name = dir.filename().string();
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    const auto relative = file.lexically_relative(dir);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return false;
    }
    return true;
}

CompletedFile::CompletedFile(CompletedDownloadRecord record, std::size_t chunk_size)
    : record_(std::move(record)), chunk_size_(std::max<std::size_t>(1, chunk_size)) {
    file_.reset(std::fopen(record_.file_path.c_str(), "rb"));
    if (!file_) {
        removeWorkDir(record_.temp_dir);
        throw DownloadError(fmt::format("cannot open completed download {}", record_.file_path.string()));
    }
}

CompletedFile::~CompletedFile() {
    file_.reset();
    removeWorkDir(record_.temp_dir);
}

std::vector<char> CompletedFile::readChunk() {
    std::vector<char> chunk(chunk_size_);
    const std::size_t got = std::fread(chunk.data(), 1, chunk.size(), file_.get());
    if (got < chunk.size() && std::ferror(file_.get())) {
        throw DownloadError(fmt::format("error streaming {}", record_.filename));
    }
    chunk.resize(got);
    return chunk;
}

std::uint64_t CompletedFile::copyTo(const std::filesystem::path& destination) {
    std::unique_ptr<FILE, FileDeleter> out{std::fopen(destination.c_str(), "wb")};
    if (!out) {
        throw DownloadError(fmt::format("cannot create {}", destination.string()));
    }

    std::uint64_t written = 0;
    for (auto chunk = readChunk(); !chunk.empty(); chunk = readChunk()) {
        if (std::fwrite(chunk.data(), 1, chunk.size(), out.get()) != chunk.size()) {
            throw DownloadError(fmt::format("failed to write {}", destination.string()));
        }
        written += chunk.size();
    }
    if (std::fflush(out.get()) != 0) {
        throw DownloadError(fmt::format("failed to flush {}", destination.string()));
    }
    logger()->debug("copied {} bytes of {} to {}", written, record_.filename, destination.string());
    return written;
}

} // namespace mediagate
