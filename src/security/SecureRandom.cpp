#include "vaultcache/security/SecureRandom.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>
#include <string_view>
#include <vector>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#else
#error Unsupported platform
#endif

namespace vaultcache::security
{
namespace
{

#if defined(_WIN32)
// BCryptGenRandom takes a ULONG length; larger requests are split.
bool osFill(std::uint8_t* data, std::size_t size) noexcept
{
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    for (std::size_t offset{ 0U }; offset < size;)
    {
        const std::size_t chunk{ (size - offset > kMaxChunk) ? kMaxChunk : size - offset };
        if (!BCRYPT_SUCCESS(BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(data + offset),
                                            static_cast<ULONG>(chunk), BCRYPT_USE_SYSTEM_PREFERRED_RNG)))
        {
            return false;
        }
        offset += chunk;
    }
    return true;
}
#elif defined(__linux__)
// getrandom may return short reads for large buffers and EINTR when a signal lands.
bool osFill(std::uint8_t* data, std::size_t size) noexcept
{
    std::size_t offset{ 0U };
    while (offset < size)
    {
        const ssize_t got{ ::getrandom(data + offset, size - offset, 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0 || static_cast<std::size_t>(got) > size - offset)
        {
            return false;
        }
        offset += static_cast<std::size_t>(got);
    }
    return true;
}
#else
bool osFill(std::uint8_t* data, std::size_t size) noexcept
{
    return SecRandomCopyBytes(kSecRandomDefault, size, data) == errSecSuccess;
}
#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    return out.empty() || osFill(out.data(), out.size());
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr std::string_view kDigits{ "0123456789abcdef" };
    std::string out(bytes.size() * 2U, '0');
    for (std::size_t i{ 0U }; i < bytes.size(); ++i)
    {
        out[2U * i] = kDigits[bytes[i] >> 4U];
        out[2U * i + 1U] = kDigits[bytes[i] & 0x0FU];
    }
    return out;
}

std::optional<std::string> secureRandomHex(std::size_t byteCount)
{
    std::vector<std::uint8_t> rnd(byteCount);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return std::nullopt;
    }
    auto out{ toHex(std::span<const std::uint8_t>{ rnd }) };
    secureWipe(std::span<std::uint8_t>{ rnd });
    return out;
}

} // namespace vaultcache::security
