#pragma once

#include "download_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mediagate {

// Creates a fresh private directory `<root>/<prefix>XXXXXX`. Throws
// TempDirError: without a working directory the operation cannot proceed.
[[nodiscard]] std::filesystem::path createWorkDir(const std::filesystem::path& root, const std::string& prefix);

// Recursively removes `dir`. A directory that is already gone counts as
// removed; other failures are logged and reported as false.
bool removeWorkDir(const std::filesystem::path& dir) noexcept;

[[nodiscard]] std::string contentTypeFor(const std::filesystem::path& file);

// Picks the produced file inside `work_dir`: `reported` if it is a regular
// file, else the first file with a known media extension, else the first
// file that is not an engine intermediate (.part, .temp, .ytdl, .frag).
[[nodiscard]] std::optional<std::filesystem::path> locateDownloadedFile(
    const std::filesystem::path& work_dir, const std::filesystem::path& reported);

// Strips non-ASCII characters. Falls back to download.mp3 / download.mp4.
[[nodiscard]] std::string asciiFilename(const std::string& filename, bool audio_only);

// Describes the finished download inside `work_dir` for the store. Throws
// DownloadError when no file was produced and FileSizeLimitError when it is
// larger than `max_file_size` (0 disables the check).
[[nodiscard]] CompletedDownload collectCompletedDownload(const std::filesystem::path& work_dir,
                                                         const std::filesystem::path& reported,
                                                         bool audio_only,
                                                         std::uint64_t max_file_size);

} // namespace mediagate
