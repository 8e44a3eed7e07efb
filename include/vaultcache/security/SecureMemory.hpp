#ifndef INCLUDE_VAULTCACHE_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_VAULTCACHE_SECURITY_SECUREMEMORY_HPP

#include "vaultcache/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace vaultcache::security
{

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& u) noexcept
    {
    }

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& t,
                          [[maybe_unused]] const ZeroAllocator<U>& u) noexcept
{
    return true;
}

// Raw key material.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

// Secret values as handed to callers. Not null-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::string_view asStringView(const SecureBuffer& b) noexcept
{
    if (b.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp{};
    b.swap(temp);
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString temp{};
    s.swap(temp);
}

} // namespace vaultcache::security

#endif // INCLUDE_VAULTCACHE_SECURITY_SECUREMEMORY_HPP
