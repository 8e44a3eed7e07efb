#ifndef INCLUDE_VAULTCACHE_CORE_CACHESESSION_HPP
#define INCLUDE_VAULTCACHE_CORE_CACHESESSION_HPP

#include "vaultcache/core/SecretCache.hpp"

namespace vaultcache::core
{

// Binds the contents of a SecretCache to a scope: the cache is cleared (and wiped) when the session ends,
// on every exit path. The cache itself must outlive the session.
class CacheSession final
{
public:
    explicit CacheSession(SecretCache& cache) noexcept;

    CacheSession(const CacheSession&) = delete;
    CacheSession& operator=(const CacheSession&) = delete;
    CacheSession(CacheSession&& other) noexcept;
    CacheSession& operator=(CacheSession&& other) noexcept;
    ~CacheSession();

    // Throws std::logic_error after release().
    [[nodiscard]] SecretCache& cache() const;
    [[nodiscard]] bool active() const noexcept;

    // Clears the cache now and detaches. Idempotent.
    void release() noexcept;

private:
    SecretCache* m_cache;
};

} // namespace vaultcache::core

#endif // INCLUDE_VAULTCACHE_CORE_CACHESESSION_HPP
