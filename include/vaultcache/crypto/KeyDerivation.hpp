#ifndef INCLUDE_VAULTCACHE_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_VAULTCACHE_CRYPTO_KEYDERIVATION_HPP

#include "vaultcache/crypto/CipherErrors.hpp"
#include "vaultcache/crypto/ICryptoProvider.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace vaultcache::crypto
{

constexpr std::size_t g_cacheSaltBytes{ 16 };
constexpr std::size_t g_cacheKeyBytes{ 32 };
constexpr std::uint32_t g_kPbkdf2DefaultIterations{ 100000 };

static_assert(g_cacheKeyBytes == g_aeadKeyBytes);

using Salt = std::array<std::uint8_t, g_cacheSaltBytes>;

struct Pbkdf2Params final
{
    std::uint32_t iterations{ g_kPbkdf2DefaultIterations };
};

class DerivedKey final
{
public:
    DerivedKey(vaultcache::security::SecureBuffer key, const Salt& salt) noexcept : m_key(std::move(key)), m_salt(salt)
    {
    }

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&&) noexcept = default;
    DerivedKey& operator=(DerivedKey&&) noexcept = default;
    ~DerivedKey() = default;

    [[nodiscard]] const vaultcache::security::SecureBuffer& key() const noexcept
    {
        return m_key;
    }

    [[nodiscard]] const Salt& salt() const noexcept
    {
        return m_salt;
    }

    // base64url text form of the key.
    [[nodiscard]] vaultcache::security::SecureString encodedKey() const;

private:
    vaultcache::security::SecureBuffer m_key;
    Salt m_salt{};
};

// PBKDF2-HMAC-SHA-256(identity, salt) -> 32-byte key. A missing salt is drawn fresh from the CSPRNG.
// Deterministic for identical (identity, salt, params). RNG or primitive failure yields CryptoUnavailable.
[[nodiscard]] CipherResult<DerivedKey> deriveCacheKey(ICryptoProvider& crypto, std::string_view identity,
                                                      const std::optional<Salt>& salt, Pbkdf2Params params = {});

} // namespace vaultcache::crypto

#endif // INCLUDE_VAULTCACHE_CRYPTO_KEYDERIVATION_HPP
