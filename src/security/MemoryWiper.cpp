#if defined(__APPLE__)
#define __STDC_WANT_LIB_EXT1__ 1
#endif
#include "vaultcache/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace vaultcache::security
{
namespace
{

void zeroize(void* data, std::size_t size) noexcept
{
#if defined(_WIN32)
    ::SecureZeroMemory(data, size);
#elif defined(__APPLE__)
    if (::memset_s(data, size, 0, size) != 0)
    {
        // memset_s only fails on invalid arguments; fall back to a volatile loop.
        auto* p{ static_cast<volatile unsigned char*>(data) };
        for (std::size_t i{ 0U }; i < size; ++i)
        {
            p[i] = 0U;
        }
    }
#else
    ::explicit_bzero(data, size);
#endif
}

} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (!bytes.empty())
    {
        zeroize(bytes.data(), bytes.size());
    }
}

void wipeString(std::string& s) noexcept
{
    if (!s.empty())
    {
        zeroize(s.data(), s.size());
    }
    s.clear();
}

} // namespace vaultcache::security
