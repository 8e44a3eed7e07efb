#include "vaultcache/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <gtest/gtest.h>

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0> bytes{};
    EXPECT_TRUE(vaultcache::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, FillNonEmptyReturnsTrue)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> bytes{};
    EXPECT_TRUE(vaultcache::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, TwoFillsDiffer)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> a{};
    std::array<std::uint8_t, kBytesLen> b{};
    ASSERT_TRUE(vaultcache::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(vaultcache::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
}

TEST(SecureRandom, HexHasTwoCharsPerByte)
{
    const auto hex{ vaultcache::security::secureRandomHex(32U) };
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex->size(), 64U);
    EXPECT_TRUE(std::all_of(hex->begin(), hex->end(),
                            [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
}

TEST(SecureRandom, ToHexIsLowercase)
{
    constexpr std::array<std::uint8_t, 4> kBytes{ 0x00U, 0x0FU, 0xA0U, 0xFFU };
    EXPECT_EQ(vaultcache::security::toHex(kBytes), "000fa0ff");
}
