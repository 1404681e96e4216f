#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mediagate {

inline constexpr std::size_t kDownloadIdBytes = 32;

// URL-safe base64 (no padding) of `bytes` bytes from the OS CSPRNG.
// Throws std::system_error when no entropy source is available.
[[nodiscard]] std::string generateToken(std::size_t bytes = kDownloadIdBytes);

namespace detail {

// Fills buffer[offset..] from a random device file. Used when getrandom()
// is unavailable. Throws std::system_error on a short or failed read.
void fillFromDevice(std::vector<std::uint8_t>& buffer, std::size_t offset, const char* device = "/dev/urandom");

} // namespace detail

} // namespace mediagate
