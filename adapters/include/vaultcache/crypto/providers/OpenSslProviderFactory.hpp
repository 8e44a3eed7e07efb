#ifndef INCLUDE_VAULTCACHE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_VAULTCACHE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "vaultcache/crypto/ICryptoProvider.hpp"
#include <memory>

namespace vaultcache::crypto::providers
{

// libcrypto-backed provider: EVP_KDF "PBKDF2" and EVP_chacha20_poly1305.
// Randomness comes from the OS CSPRNG, not RAND_bytes.
[[nodiscard]] std::unique_ptr<vaultcache::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace vaultcache::crypto::providers

#endif // INCLUDE_VAULTCACHE_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
