#ifndef INCLUDE_VAULTCACHE_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_VAULTCACHE_CRYPTO_ICRYPTOPROVIDER_HPP

#include "vaultcache/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vaultcache::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

// One sealed cache payload. The cipher keeps nonce and tag beside the ciphertext.
struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Primitives the cache encryption needs: key derivation from the machine identity,
// a CSPRNG for salts and nonces, and authenticated encryption of serialized secret maps.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // PBKDF2 with HMAC-SHA-256.
    // Contract violations (empty password, zero iterations, bad output size) throw std::invalid_argument;
    // an unavailable primitive throws std::runtime_error.
    [[nodiscard]] virtual vaultcache::security::SecureBuffer
    deriveKeyPbkdf2Sha256(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                          std::uint32_t iterations, std::size_t outBytes) const = 0;

    // False when the backend cannot produce random bytes; callers must not use `out` then.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // ChaCha20-Poly1305 (IETF, 12-byte nonce) under a fresh random nonce per call.
    // Throws std::invalid_argument for a key that is not g_aeadKeyBytes long.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // std::nullopt when the tag does not verify: wrong key, wrong associated data, or a modified box.
    [[nodiscard]] virtual std::optional<vaultcache::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace vaultcache::crypto

#endif // INCLUDE_VAULTCACHE_CRYPTO_ICRYPTOPROVIDER_HPP
