#ifndef INCLUDE_VAULTCACHE_SECURITY_SECURERANDOM_HPP
#define INCLUDE_VAULTCACHE_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace vaultcache::security
{

// Fills `out` from the OS CSPRNG. Returns false when the random source is unavailable.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lowercase hex of `byteCount` random bytes, or nullopt when the random source is unavailable.
[[nodiscard]] std::optional<std::string> secureRandomHex(std::size_t byteCount);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace vaultcache::security

#endif // INCLUDE_VAULTCACHE_SECURITY_SECURERANDOM_HPP
