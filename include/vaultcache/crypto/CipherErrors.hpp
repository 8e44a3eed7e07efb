#ifndef INCLUDE_VAULTCACHE_CRYPTO_CIPHERERRORS_HPP
#define INCLUDE_VAULTCACHE_CRYPTO_CIPHERERRORS_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace vaultcache::crypto
{

enum class CipherError : std::uint8_t
{
    // Random source, KDF or cipher primitive failed. The caller degrades to plaintext storage.
    CryptoUnavailable,
    // Wrong key, foreign or corrupted payload, parse error. The caller treats it as a cache miss.
    DecryptFailure,
};

template <class T> using CipherResult = std::variant<T, CipherError>;

[[nodiscard]] constexpr std::string_view describe(CipherError error) noexcept
{
    switch (error)
    {
    case CipherError::CryptoUnavailable:
        return "crypto unavailable";
    case CipherError::DecryptFailure:
        return "decrypt failure";
    }
    return "unknown cipher error";
}

} // namespace vaultcache::crypto

#endif // INCLUDE_VAULTCACHE_CRYPTO_CIPHERERRORS_HPP
