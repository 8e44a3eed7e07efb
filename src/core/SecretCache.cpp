#include "vaultcache/core/SecretCache.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include <utility>

namespace vaultcache::core
{
namespace
{

constexpr std::string_view g_kTag{ "cache" };

} // namespace

std::string cacheKey(std::string_view organizationId, const std::optional<std::string>& projectId)
{
    std::string key{ organizationId };
    key.push_back(':');
    if (projectId.has_value())
    {
        key += *projectId;
    }
    return key;
}

SecretCache::SecretCache(vaultcache::gateway::ISecretsGateway& gateway, const SecretCipher& cipher,
                         CacheOptions options, NowProvider nowProvider)
    : m_gateway(&gateway), m_cipher(&cipher), m_options(options), m_now(std::move(nowProvider))
{
}

SecretCache::~SecretCache()
{
    clear();
}

SecretMap SecretCache::get(std::string_view organizationId, const std::optional<std::string>& projectId,
                           bool forceRefresh)
{
    const std::scoped_lock lock{ m_mutex };
    const std::string key{ cacheKey(organizationId, projectId) };

    if (!forceRefresh)
    {
        const auto it{ m_entries.find(key) };
        if (it != m_entries.end() && isFresh(it->second))
        {
            if (auto hit{ readEntry(it->second) }; hit.has_value())
            {
                vaultcache::log::debug(g_kTag, "hit", { { "cache_key", key } });
                return std::move(*hit);
            }
            vaultcache::log::debug(g_kTag, "entry not decryptable, refreshing", { { "cache_key", key } });
        }
    }

    return refresh(key, organizationId, projectId);
}

void SecretCache::clear() noexcept
{
    const std::scoped_lock lock{ m_mutex };
    for (auto& [key, entry] : m_entries)
    {
        wipeEntry(entry);
    }
    m_entries.clear();
}

std::size_t SecretCache::size() const
{
    const std::scoped_lock lock{ m_mutex };
    return m_entries.size();
}

bool SecretCache::contains(std::string_view organizationId, const std::optional<std::string>& projectId) const
{
    const std::scoped_lock lock{ m_mutex };
    return m_entries.find(cacheKey(organizationId, projectId)) != m_entries.end();
}

std::optional<CacheTier> SecretCache::entryTier(std::string_view organizationId,
                                                const std::optional<std::string>& projectId) const
{
    const std::scoped_lock lock{ m_mutex };
    const auto it{ m_entries.find(cacheKey(organizationId, projectId)) };
    if (it == m_entries.end())
    {
        return std::nullopt;
    }
    return std::holds_alternative<std::string>(it->second.payload) ? CacheTier::Encrypted : CacheTier::Plaintext;
}

const CacheOptions& SecretCache::options() const noexcept
{
    return m_options;
}

bool SecretCache::isFresh(const Entry& entry) const
{
    return (m_now() - entry.storedAt) < m_options.ttl;
}

std::optional<SecretMap> SecretCache::readEntry(const Entry& entry) const
{
    if (const auto* plain{ std::get_if<SecretMap>(&entry.payload) }; plain != nullptr)
    {
        return *plain;
    }

    auto decrypted{ m_cipher->decrypt(std::get<std::string>(entry.payload)) };
    if (auto* secrets{ std::get_if<SecretMap>(&decrypted) }; secrets != nullptr)
    {
        return std::move(*secrets);
    }
    return std::nullopt;
}

SecretMap SecretCache::refresh(const std::string& key, std::string_view organizationId,
                               const std::optional<std::string>& projectId)
{
    SecretMap fresh{ m_gateway->fetch(organizationId, projectId) };

    Entry entry{};
    if (m_options.encryptEntries)
    {
        auto encrypted{ m_cipher->encrypt(fresh) };
        if (auto* token{ std::get_if<std::string>(&encrypted) }; token != nullptr)
        {
            entry.payload = std::move(*token);
        }
        else
        {
            vaultcache::log::warn(g_kTag, "encryption unavailable, caching entry as plaintext",
                                  { { "cache_key", key } });
            entry.payload = fresh;
        }
    }
    else
    {
        entry.payload = fresh;
    }
    entry.storedAt = m_now();

    if (const auto it{ m_entries.find(key) }; it != m_entries.end())
    {
        wipeEntry(it->second);
        it->second = std::move(entry);
    }
    else
    {
        m_entries.emplace(key, std::move(entry));
    }

    vaultcache::log::debug(g_kTag, "refreshed", { { "cache_key", key } });
    return fresh;
}

void SecretCache::wipeEntry(Entry& entry) noexcept
{
    if (auto* token{ std::get_if<std::string>(&entry.payload) }; token != nullptr)
    {
        vaultcache::security::wipeString(*token);
    }
    else
    {
        // SecureString values wipe themselves on release.
        std::get<SecretMap>(entry.payload).clear();
    }
}

} // namespace vaultcache::core
