#include "mediagate/work_dir.hpp"

#include "mediagate/errors.hpp"
#include "mediagate/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <stdlib.h>

namespace mediagate {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 8> kContentTypes{{
    {".mp4", "video/mp4"},
    {".webm", "video/webm"},
    {".mkv", "video/x-matroska"},
    {".mp3", "audio/mpeg"},
    {".m4a", "audio/mp4"},
    {".opus", "audio/opus"},
    {".ogg", "audio/ogg"},
    {".wav", "audio/wav"},
}};

constexpr std::array<std::string_view, 4> kIntermediateExtensions{".part", ".temp", ".ytdl", ".frag"};

std::string lowerExtension(const std::filesystem::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool isMediaExtension(const std::string& ext) {
    return std::any_of(kContentTypes.begin(), kContentTypes.end(),
                       [&](const auto& entry) { return entry.first == ext; });
}

bool isIntermediateExtension(const std::string& ext) {
    return std::find(kIntermediateExtensions.begin(), kIntermediateExtensions.end(), ext) !=
           kIntermediateExtensions.end();
}

} // namespace

std::filesystem::path createWorkDir(const std::filesystem::path& root, const std::string& prefix) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw TempDirError(fmt::format("cannot create temp root {}: {}", root.string(), ec.message()));
    }

    std::string pattern = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw TempDirError(fmt::format("cannot create working directory under {}: {}",
                                       root.string(), std::strerror(errno)));
    }
    return std::filesystem::path{buffer.data()};
}

bool removeWorkDir(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        logger()->warn("failed to clean up working directory {}: {}", dir.string(), ec.message());
        return false;
    }
    logger()->debug("cleaned up working directory {}", dir.string());
    return true;
}

std::string contentTypeFor(const std::filesystem::path& file) {
    const std::string ext = lowerExtension(file);
    for (const auto& [known, type] : kContentTypes) {
        if (known == ext) {
            return std::string{type};
        }
    }
    return "application/octet-stream";
}

std::optional<std::filesystem::path> locateDownloadedFile(const std::filesystem::path& work_dir,
                                                          const std::filesystem::path& reported) {
    std::error_code ec;
    if (!reported.empty() && std::filesystem::is_regular_file(reported, ec)) {
        return reported;
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it{work_dir, ec}, end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        logger()->warn("cannot list working directory {}: {}", work_dir.string(), ec.message());
    }
    // directory_iterator order is unspecified
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        if (isMediaExtension(lowerExtension(file))) {
            return file;
        }
    }
    for (const auto& file : files) {
        if (!isIntermediateExtension(lowerExtension(file))) {
            return file;
        }
    }
    return std::nullopt;
}

std::string asciiFilename(const std::string& filename, bool audio_only) {
    std::string safe;
    safe.reserve(filename.size());
    for (const unsigned char c : filename) {
        if (c < 0x80) {
            safe.push_back(static_cast<char>(c));
        }
    }
    if (safe.empty()) {
        safe = audio_only ? "download.mp3" : "download.mp4";
    }
    return safe;
}

CompletedDownload collectCompletedDownload(const std::filesystem::path& work_dir,
                                           const std::filesystem::path& reported,
                                           bool audio_only,
                                           std::uint64_t max_file_size) {
    const auto file = locateDownloadedFile(work_dir, reported);
    if (!file) {
        throw DownloadError("download completed but file not found");
    }

    const std::uint64_t size = std::filesystem::file_size(*file);
    if (max_file_size > 0 && size > max_file_size) {
        throw FileSizeLimitError(fmt::format("file size ({:.1f} MB) exceeds maximum allowed ({:.1f} MB)",
                                             static_cast<double>(size) / (1024.0 * 1024.0),
                                             static_cast<double>(max_file_size) / (1024.0 * 1024.0)));
    }

    CompletedDownload download;
    download.file_path = *file;
    download.temp_dir = work_dir;
    download.filename = asciiFilename(file->filename().string(), audio_only);
    download.file_size = size;
    download.content_type = contentTypeFor(*file);
    return download;
}

} // namespace mediagate
