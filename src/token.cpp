#include "mediagate/token.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <system_error>
#include <vector>

#include <sys/random.h>

namespace mediagate {

namespace {

struct FileCloser {
    void operator()(FILE* file) const noexcept { std::fclose(file); }
};

void fillRandom(std::vector<std::uint8_t>& buffer) {
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        const ssize_t got = ::getrandom(buffer.data() + filled, buffer.size() - filled, 0);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        filled += static_cast<std::size_t>(got);
    }
    detail::fillFromDevice(buffer, filled);
}

} // namespace

namespace detail {

void fillFromDevice(std::vector<std::uint8_t>& buffer, std::size_t offset, const char* device) {
    if (offset >= buffer.size()) {
        return;
    }
    std::unique_ptr<FILE, FileCloser> source{std::fopen(device, "rb")};
    if (!source) {
        throw std::system_error(errno, std::generic_category(), "no secure random source available");
    }
    const std::size_t wanted = buffer.size() - offset;
    if (std::fread(buffer.data() + offset, 1, wanted, source.get()) != wanted) {
        throw std::system_error(EIO, std::generic_category(), "short read from random source");
    }
}

} // namespace detail

std::string generateToken(std::size_t bytes) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::vector<std::uint8_t> raw(bytes);
    fillRandom(raw);

    std::string out;
    out.reserve((bytes * 4 + 2) / 3);
    std::size_t i = 0;
    for (; i + 3 <= raw.size(); i += 3) {
        const std::uint32_t v = (raw[i] << 16) | (raw[i + 1] << 8) | raw[i + 2];
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back(kAlphabet[v & 0x3F]);
    }

    const std::size_t rest = raw.size() - i;
    if (rest == 1) {
        const std::uint32_t v = raw[i] << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
    } else if (rest == 2) {
        const std::uint32_t v = (raw[i] << 16) | (raw[i + 1] << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
    }
    return out;
}

} // namespace mediagate
