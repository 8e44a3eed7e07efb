#include "vaultcache/core/CacheSession.hpp"

#include <stdexcept>
#include <utility>

namespace vaultcache::core
{

CacheSession::CacheSession(SecretCache& cache) noexcept : m_cache(&cache)
{
}

CacheSession::CacheSession(CacheSession&& other) noexcept : m_cache(std::exchange(other.m_cache, nullptr))
{
}

CacheSession& CacheSession::operator=(CacheSession&& other) noexcept
{
    if (this != &other)
    {
        release();
        m_cache = std::exchange(other.m_cache, nullptr);
    }
    return *this;
}

CacheSession::~CacheSession()
{
    release();
}

SecretCache& CacheSession::cache() const
{
    if (m_cache == nullptr)
    {
        throw std::logic_error("cache session already released");
    }
    return *m_cache;
}

bool CacheSession::active() const noexcept
{
    return m_cache != nullptr;
}

void CacheSession::release() noexcept
{
    if (m_cache != nullptr)
    {
        m_cache->clear();
        m_cache = nullptr;
    }
}

} // namespace vaultcache::core
