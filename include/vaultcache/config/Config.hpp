#ifndef INCLUDE_VAULTCACHE_CONFIG_CONFIG_HPP
#define INCLUDE_VAULTCACHE_CONFIG_CONFIG_HPP

#include "vaultcache/core/SecretCache.hpp"
#include "vaultcache/platform/ICredentialStore.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vaultcache::config
{

inline constexpr std::string_view g_kEnvApiUrl{ "API_URL" };
inline constexpr std::string_view g_kEnvIdentityUrl{ "IDENTITY_URL" };
inline constexpr std::string_view g_kEnvAccessToken{ "BWS_TOKEN" };
inline constexpr std::string_view g_kEnvStateFile{ "STATE_FILE" };
inline constexpr std::string_view g_kEnvOrganizationId{ "ORGANIZATION_ID" };
inline constexpr std::string_view g_kEnvCacheTtl{ "VAULTCACHE_CACHE_TTL" };
inline constexpr std::string_view g_kEnvCacheEncryption{ "VAULTCACHE_CACHE_ENCRYPTION" };
inline constexpr std::string_view g_kEnvLogLevel{ "VAULTCACHE_LOG_LEVEL" };

inline constexpr std::string_view g_kDefaultApiUrl{ "https://api.bitwarden.com" };
inline constexpr std::string_view g_kDefaultIdentityUrl{ "https://identity.bitwarden.com" };

enum class ConfigError : std::uint8_t
{
    MissingAccessToken,
    MissingOrganizationId,
    MissingStateFile,
    UnsupportedEndpoint,
};

template <class T> using ConfigResult = std::variant<T, ConfigError>;

[[nodiscard]] constexpr std::string_view describe(ConfigError error) noexcept
{
    switch (error)
    {
    case ConfigError::MissingAccessToken:
        return "BWS_TOKEN environment variable is required";
    case ConfigError::MissingOrganizationId:
        return "ORGANIZATION_ID environment variable is required";
    case ConfigError::MissingStateFile:
        return "STATE_FILE environment variable is required";
    case ConfigError::UnsupportedEndpoint:
        return "API_URL scheme is not supported";
    }
    return "unknown configuration error";
}

// Empty values count as unset.
using EnvReader = std::function<std::optional<std::string>(std::string_view name)>;

[[nodiscard]] std::optional<std::string> readProcessEnv(std::string_view name);

struct GatewaySettings final
{
    std::string apiUrl;
    std::string identityUrl;
    vaultcache::security::SecureString accessToken;
    std::string organizationId;
    std::filesystem::path stateFile;
};

// Organization id: override, then ORGANIZATION_ID, then the credential store.
// State file: STATE_FILE, then the credential store entry of the organization.
// Resolved values are written back to the credential store (best effort).
[[nodiscard]] ConfigResult<GatewaySettings> loadGatewaySettings(const EnvReader& env,
                                                                vaultcache::platform::ICredentialStore& store,
                                                                const std::optional<std::string>& organizationOverride);

// Invalid values are ignored with a warning.
[[nodiscard]] vaultcache::core::CacheOptions loadCacheOptions(const EnvReader& env);

// Applies VAULTCACHE_LOG_LEVEL when set and valid.
void applyLogLevel(const EnvReader& env);

} // namespace vaultcache::config

#endif // INCLUDE_VAULTCACHE_CONFIG_CONFIG_HPP
