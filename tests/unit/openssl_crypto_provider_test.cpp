#include "vaultcache/crypto/providers/OpenSslProviderFactory.hpp"
#include "vaultcache/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{

constexpr std::string_view g_kPassword{ "password" };
constexpr std::string_view g_kSalt{ "salt" };
constexpr std::string_view g_kAad{ "vaultcache.test" };

std::span<const std::byte> asBytes(std::string_view s)
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

std::span<const std::uint8_t> asU8(std::string_view s)
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

std::string hexOf(const vaultcache::security::SecureBuffer& b)
{
    return vaultcache::security::toHex(std::span<const std::uint8_t>{ b.data(), b.size() });
}

class OpenSslCryptoProviderTest : public ::testing::Test
{
protected:
    std::unique_ptr<vaultcache::crypto::ICryptoProvider> m_crypto{ // NOLINT
                                                                   vaultcache::crypto::providers::makeOpenSslCryptoProvider()
    };
    std::array<std::uint8_t, vaultcache::crypto::g_aeadKeyBytes> m_key{}; // NOLINT

    void SetUp() override
    {
        ASSERT_TRUE(m_crypto->randomBytes(std::span{ m_key }));
    }
};

} // namespace

TEST_F(OpenSslCryptoProviderTest, Pbkdf2Sha256KnownAnswers)
{
    EXPECT_EQ(hexOf(m_crypto->deriveKeyPbkdf2Sha256(asBytes(g_kPassword), asU8(g_kSalt), 1U, 32U)),
              "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
    EXPECT_EQ(hexOf(m_crypto->deriveKeyPbkdf2Sha256(asBytes(g_kPassword), asU8(g_kSalt), 2U, 32U)),
              "ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43");
    EXPECT_EQ(hexOf(m_crypto->deriveKeyPbkdf2Sha256(asBytes(g_kPassword), asU8(g_kSalt), 4096U, 32U)),
              "c5e478d59288c841aa530db6845c4c8d962893a001ce4e11a4963873aa98134a");
}

TEST_F(OpenSslCryptoProviderTest, Pbkdf2RejectsContractViolations)
{
    EXPECT_THROW((void)m_crypto->deriveKeyPbkdf2Sha256(std::span<const std::byte>{}, asU8(g_kSalt), 1U, 32U),
                 std::invalid_argument);
    EXPECT_THROW((void)m_crypto->deriveKeyPbkdf2Sha256(asBytes(g_kPassword), asU8(g_kSalt), 0U, 32U),
                 std::invalid_argument);
    EXPECT_THROW((void)m_crypto->deriveKeyPbkdf2Sha256(asBytes(g_kPassword), asU8(g_kSalt), 1U, 0U),
                 std::invalid_argument);
}

TEST_F(OpenSslCryptoProviderTest, AeadRoundTrip)
{
    constexpr std::string_view kPlain{ R"({"API_KEY":"abc"})" };
    const auto box{ m_crypto->aeadEncrypt(m_key, asBytes(kPlain), asBytes(g_kAad)) };
    EXPECT_EQ(box.cipherText.size(), kPlain.size());

    const auto plain{ m_crypto->aeadDecrypt(m_key, box, asBytes(g_kAad)) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(vaultcache::security::asStringView(*plain), kPlain);
}

TEST_F(OpenSslCryptoProviderTest, AeadUsesFreshNonces)
{
    const auto a{ m_crypto->aeadEncrypt(m_key, asBytes("same"), asBytes(g_kAad)) };
    const auto b{ m_crypto->aeadEncrypt(m_key, asBytes("same"), asBytes(g_kAad)) };
    EXPECT_NE(a.nonce, b.nonce);
    EXPECT_NE(a.cipherText, b.cipherText);
}

TEST_F(OpenSslCryptoProviderTest, AeadRejectsTampering)
{
    auto box{ m_crypto->aeadEncrypt(m_key, asBytes("payload"), asBytes(g_kAad)) };

    auto flippedCt{ box };
    flippedCt.cipherText[0] ^= 0x01U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, flippedCt, asBytes(g_kAad)).has_value());

    auto flippedTag{ box };
    flippedTag.tag[0] ^= 0x01U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, flippedTag, asBytes(g_kAad)).has_value());

    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, box, asBytes("other.aad")).has_value());

    auto otherKey{ m_key };
    otherKey[0] ^= 0x01U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(otherKey, box, asBytes(g_kAad)).has_value());
}

TEST_F(OpenSslCryptoProviderTest, AeadRejectsWrongKeySize)
{
    const std::array<std::uint8_t, 16> shortKey{};
    EXPECT_THROW((void)m_crypto->aeadEncrypt(shortKey, asBytes("x"), asBytes(g_kAad)), std::invalid_argument);
}
