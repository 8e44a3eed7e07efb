#ifndef INCLUDE_VAULTCACHE_CRYPTO_BASE64URL_HPP
#define INCLUDE_VAULTCACHE_CRYPTO_BASE64URL_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcache::crypto
{

// RFC 4648 section 5 alphabet ('-' and '_'), '=' padded. The output never contains ':'.
[[nodiscard]] std::string base64UrlEncode(std::span<const std::uint8_t> bytes);

// Accepts padded input only. Returns std::nullopt on any character outside the alphabet or bad length.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text);

} // namespace vaultcache::crypto

#endif // INCLUDE_VAULTCACHE_CRYPTO_BASE64URL_HPP
