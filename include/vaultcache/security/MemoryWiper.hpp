#ifndef INCLUDE_VAULTCACHE_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_VAULTCACHE_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace vaultcache::security
{

// Zeroes `bytes` in a way the optimizer may not drop.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// For standard strings that staged secret material (JSON documents, encoded cache payloads):
// zeroes the used characters, then clears.
void wipeString(std::string& s) noexcept;

} // namespace vaultcache::security

#endif // INCLUDE_VAULTCACHE_SECURITY_MEMORYWIPER_HPP
