#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "vaultcache/security/SecureMemory.hpp"

using vaultcache::security::SecureBuffer;
using vaultcache::security::SecureString;

TEST(ZeroAllocator, AllocateZeroReturnsNull)
{
    vaultcache::security::ZeroAllocator<std::uint8_t> alloc{};
    EXPECT_EQ(alloc.allocate(0U), nullptr);
    alloc.deallocate(nullptr, 0U);
}

TEST(ZeroAllocator, WorksWithStandardContainers)
{
    std::vector<int, vaultcache::security::ZeroAllocator<int>> values{};
    for (int i{ 0 }; i < 100; ++i)
    {
        values.push_back(i);
    }
    EXPECT_EQ(values.size(), 100U);
    EXPECT_EQ(values.back(), 99);
}

TEST(ZeroAllocator, AllInstancesCompareEqual)
{
    const vaultcache::security::ZeroAllocator<char> a{};
    const vaultcache::security::ZeroAllocator<std::uint8_t> b{};
    EXPECT_TRUE(a == b);
}

TEST(SecureString, FromStringViewCopiesWithoutTerminator)
{
    const auto s{ vaultcache::security::secureStringFrom("hunter2") };
    EXPECT_EQ(s.size(), 7U);
    EXPECT_EQ(vaultcache::security::asStringView(s), "hunter2");
}

TEST(SecureString, EmptyViewIsEmpty)
{
    const SecureString s{};
    EXPECT_TRUE(vaultcache::security::asStringView(s).empty());
}

TEST(SecureString, ReleaseEmptiesAndFreesStorage)
{
    auto s{ vaultcache::security::secureStringFrom("token-value") };
    vaultcache::security::secureRelease(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
}

TEST(SecureBuffer, ReleaseEmptiesAndFreesStorage)
{
    SecureBuffer b(32U, 0x5AU);
    vaultcache::security::secureRelease(b);
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(b.capacity(), 0U);
}

TEST(SecureBuffer, ByteViewsCoverWholeBuffer)
{
    SecureBuffer b{ 1U, 2U, 3U };
    EXPECT_EQ(vaultcache::security::asBytes(b).size(), 3U);

    auto writable{ vaultcache::security::asWritableBytes(b) };
    writable[0] = std::byte{ 0x7FU };
    EXPECT_EQ(b[0], 0x7FU);
}

TEST(SecureBuffer, StringViewOverBytes)
{
    const SecureBuffer b{ 'a', 'b', 'c' };
    EXPECT_EQ(vaultcache::security::asStringView(b), "abc");
}
