#ifndef INCLUDE_VAULTCACHE_CORE_SECRETCACHE_HPP
#define INCLUDE_VAULTCACHE_CORE_SECRETCACHE_HPP

#include "vaultcache/core/SecretCipher.hpp"
#include "vaultcache/core/SecretMap.hpp"
#include "vaultcache/gateway/ISecretsGateway.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vaultcache::core
{

constexpr std::chrono::seconds g_kDefaultCacheTtl{ 300 };

enum class CacheTier : std::uint8_t
{
    Encrypted,
    Plaintext,
};

struct CacheOptions final
{
    std::chrono::seconds ttl{ g_kDefaultCacheTtl };
    // When false, or when encryption is unavailable, entries are kept as plaintext maps.
    bool encryptEntries{ true };
};

// "<org>:<project or empty>"
[[nodiscard]] std::string cacheKey(std::string_view organizationId, const std::optional<std::string>& projectId);

// In-memory TTL cache in front of a secrets gateway. Entries are never persisted.
// One mutex spans the freshness check, the refresh and the store-back.
class SecretCache final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    SecretCache(vaultcache::gateway::ISecretsGateway& gateway, const SecretCipher& cipher, CacheOptions options = {},
                NowProvider nowProvider = Clock::now);

    SecretCache(const SecretCache&) = delete;
    SecretCache& operator=(const SecretCache&) = delete;
    SecretCache(SecretCache&&) = delete;
    SecretCache& operator=(SecretCache&&) = delete;
    ~SecretCache();

    // Returns an independent copy. Refreshes when forced, missing, expired or undecryptable.
    // ProviderError from the gateway propagates; nothing is cached on failure.
    [[nodiscard]] SecretMap get(std::string_view organizationId, const std::optional<std::string>& projectId,
                                bool forceRefresh = false);

    // Drops and wipes every entry. Idempotent.
    void clear() noexcept;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(std::string_view organizationId, const std::optional<std::string>& projectId) const;
    [[nodiscard]] std::optional<CacheTier> entryTier(std::string_view organizationId,
                                                     const std::optional<std::string>& projectId) const;
    [[nodiscard]] const CacheOptions& options() const noexcept;

private:
    struct Entry final
    {
        TimePoint storedAt{};
        // Encrypted token or plaintext map.
        std::variant<std::string, SecretMap> payload;
    };

    [[nodiscard]] bool isFresh(const Entry& entry) const;
    [[nodiscard]] std::optional<SecretMap> readEntry(const Entry& entry) const;
    [[nodiscard]] SecretMap refresh(const std::string& key, std::string_view organizationId,
                                    const std::optional<std::string>& projectId);
    static void wipeEntry(Entry& entry) noexcept;

    vaultcache::gateway::ISecretsGateway* m_gateway;
    const SecretCipher* m_cipher;
    CacheOptions m_options;
    NowProvider m_now;
    mutable std::mutex m_mutex;
    std::map<std::string, Entry, std::less<>> m_entries;
};

} // namespace vaultcache::core

#endif // INCLUDE_VAULTCACHE_CORE_SECRETCACHE_HPP
