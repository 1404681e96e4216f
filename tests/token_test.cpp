#include "mediagate/token.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

using namespace mediagate;

TEST(TokenTest, DefaultTokenIsUrlSafeBase64WithoutPadding) {
    const auto token = generateToken();
    EXPECT_EQ(token.size(), 43u);
    EXPECT_TRUE(std::all_of(token.begin(), token.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    }));
}

TEST(TokenTest, LengthFollowsByteCount) {
    EXPECT_EQ(generateToken(3).size(), 4u);
    EXPECT_EQ(generateToken(4).size(), 6u);
    EXPECT_EQ(generateToken(5).size(), 7u);
    EXPECT_TRUE(generateToken(0).empty());
}

TEST(TokenTest, TokensDoNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(generateToken());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(TokenTest, DeviceFallbackFillsTheRemainder) {
    std::vector<std::uint8_t> buffer(64, 0);
    buffer[0] = 0xAB;
    detail::fillFromDevice(buffer, 1);
    EXPECT_EQ(buffer[0], 0xAB);
    EXPECT_TRUE(std::any_of(buffer.begin() + 1, buffer.end(), [](std::uint8_t b) { return b != 0; }));
}

TEST(TokenTest, DeviceFallbackReportsMissingSource) {
    std::vector<std::uint8_t> buffer(8, 0);
    EXPECT_THROW(detail::fillFromDevice(buffer, 0, "/nonexistent/mediagate-random"), std::system_error);
    EXPECT_NO_THROW(detail::fillFromDevice(buffer, buffer.size(), "/nonexistent/mediagate-random"));
}
