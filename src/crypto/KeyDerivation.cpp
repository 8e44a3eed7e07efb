#include "vaultcache/crypto/KeyDerivation.hpp"

#include "vaultcache/crypto/Base64Url.hpp"
#include "vaultcache/log/Log.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include <exception>
#include <span>
#include <string>

namespace vaultcache::crypto
{

vaultcache::security::SecureString DerivedKey::encodedKey() const
{
    std::string encoded{ base64UrlEncode(std::span<const std::uint8_t>{ m_key.data(), m_key.size() }) };
    auto out{ vaultcache::security::secureStringFrom(encoded) };
    vaultcache::security::wipeString(encoded);
    return out;
}

CipherResult<DerivedKey> deriveCacheKey(ICryptoProvider& crypto, std::string_view identity,
                                        const std::optional<Salt>& salt, Pbkdf2Params params)
{
    Salt effectiveSalt{};
    if (salt.has_value())
    {
        effectiveSalt = *salt;
    }
    else if (!crypto.randomBytes(std::span<std::uint8_t>{ effectiveSalt }))
    {
        vaultcache::log::warn("kdf", "random source unavailable, cannot draw salt");
        return CipherError::CryptoUnavailable;
    }

    try
    {
        const auto password{ std::as_bytes(std::span<const char>{ identity.data(), identity.size() }) };
        auto key{ crypto.deriveKeyPbkdf2Sha256(password, std::span<const std::uint8_t>{ effectiveSalt },
                                               params.iterations, g_cacheKeyBytes) };
        return DerivedKey{ std::move(key), effectiveSalt };
    }
    catch (const std::exception& e)
    {
        vaultcache::log::warn("kdf", "key derivation failed", { { "reason", e.what() } });
        return CipherError::CryptoUnavailable;
    }
}

} // namespace vaultcache::crypto
