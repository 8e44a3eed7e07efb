#ifndef INCLUDE_VAULTCACHE_CORE_SECRETCIPHER_HPP
#define INCLUDE_VAULTCACHE_CORE_SECRETCIPHER_HPP

#include "vaultcache/core/MachineIdentity.hpp"
#include "vaultcache/core/SecretMap.hpp"
#include "vaultcache/crypto/CipherErrors.hpp"
#include "vaultcache/crypto/ICryptoProvider.hpp"
#include "vaultcache/crypto/KeyDerivation.hpp"
#include <string>
#include <string_view>

namespace vaultcache::core
{

// Bound into every payload as associated data.
inline constexpr std::string_view g_kCachePayloadAad{ "vaultcache.cache.v1" };

// Encrypts secret maps under a key derived from the machine identity.
// Token layout: base64url(salt) ":" base64url(nonce || ciphertext || tag).
class SecretCipher final
{
public:
    SecretCipher(vaultcache::crypto::ICryptoProvider& crypto, IMachineIdentity& identity,
                 vaultcache::crypto::Pbkdf2Params params = {}) noexcept;

    // Fresh salt and nonce on every call. Fails only with CryptoUnavailable.
    [[nodiscard]] vaultcache::crypto::CipherResult<std::string> encrypt(const SecretMap& secrets) const;

    // Every malformed, foreign or tampered token yields DecryptFailure. Never throws.
    [[nodiscard]] vaultcache::crypto::CipherResult<SecretMap> decrypt(std::string_view token) const;

private:
    vaultcache::crypto::ICryptoProvider* m_crypto;
    IMachineIdentity* m_identity;
    vaultcache::crypto::Pbkdf2Params m_params;
};

} // namespace vaultcache::core

#endif // INCLUDE_VAULTCACHE_CORE_SECRETCIPHER_HPP
