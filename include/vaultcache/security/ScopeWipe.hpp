#ifndef INCLUDE_VAULTCACHE_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_VAULTCACHE_SECURITY_SCOPEWIPE_HPP

#include "vaultcache/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace vaultcache::security
{

// Wipes a byte range, or a standard string, when the guard goes out of scope.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    explicit ScopeWipe(std::string& s) noexcept : m_string{ &s }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }, m_string{ sw.m_string }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (!m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
        if (m_string != nullptr)
        {
            wipeString(*m_string);
        }
    }

    void release() noexcept
    {
        m_bytes = {};
        m_string = nullptr;
    }

private:
    std::span<std::byte> m_bytes;
    std::string* m_string{ nullptr };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ s };
}

} // namespace vaultcache::security

#endif // INCLUDE_VAULTCACHE_SECURITY_SCOPEWIPE_HPP
