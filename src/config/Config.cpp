#include "vaultcache/config/Config.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace vaultcache::config
{
namespace
{

constexpr std::string_view g_kTag{ "config" };

[[nodiscard]] std::optional<std::string> nonEmpty(const EnvReader& env, std::string_view name)
{
    auto value{ env(name) };
    if (!value.has_value() || value->empty())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::string lowerCase(std::string_view s)
{
    std::string out{ s };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void persist(vaultcache::platform::ICredentialStore& store, std::string_view service, std::string_view key,
             std::string_view value)
{
    if (!store.available())
    {
        return;
    }
    if (const auto current{ store.get(service, key) }; current.has_value() && *current == value)
    {
        return;
    }
    if (!store.set(service, key, value))
    {
        vaultcache::log::debug(g_kTag, "bootstrap value not persisted", { { "service", service }, { "name", key } });
    }
}

} // namespace

std::optional<std::string> readProcessEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }

#if defined(_WIN32)
    char* value{ nullptr };
    std::size_t len{ 0U };
    if (_dupenv_s(&value, &len, std::string{ name }.c_str()) != 0 || value == nullptr)
    {
        return std::nullopt;
    }
    std::string out{ value };
    std::free(value);
    return out;
#else
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
#endif
}

ConfigResult<GatewaySettings> loadGatewaySettings(const EnvReader& env, vaultcache::platform::ICredentialStore& store,
                                                  const std::optional<std::string>& organizationOverride)
{
    GatewaySettings settings{};
    settings.apiUrl = nonEmpty(env, g_kEnvApiUrl).value_or(std::string{ g_kDefaultApiUrl });
    settings.identityUrl = nonEmpty(env, g_kEnvIdentityUrl).value_or(std::string{ g_kDefaultIdentityUrl });

    auto token{ nonEmpty(env, g_kEnvAccessToken) };
    if (!token.has_value())
    {
        return ConfigError::MissingAccessToken;
    }
    settings.accessToken = vaultcache::security::secureStringFrom(*token);
    vaultcache::security::wipeString(*token);

    const std::string bootstrapService{ vaultcache::platform::g_kCredentialServicePrefix };
    std::optional<std::string> organizationId{};
    if (organizationOverride.has_value() && !organizationOverride->empty())
    {
        organizationId = organizationOverride;
    }
    else if (auto fromEnv{ nonEmpty(env, g_kEnvOrganizationId) }; fromEnv.has_value())
    {
        organizationId = std::move(fromEnv);
    }
    else if (auto stored{ store.get(bootstrapService, vaultcache::platform::g_kOrganizationIdKey) };
             stored.has_value() && !stored->empty())
    {
        vaultcache::log::debug(g_kTag, "organization id taken from credential store");
        organizationId = std::move(stored);
    }
    if (!organizationId.has_value())
    {
        return ConfigError::MissingOrganizationId;
    }
    settings.organizationId = std::move(*organizationId);

    const std::string orgService{ vaultcache::platform::organizationService(settings.organizationId) };
    std::optional<std::string> stateFile{ nonEmpty(env, g_kEnvStateFile) };
    if (!stateFile.has_value())
    {
        if (auto stored{ store.get(orgService, vaultcache::platform::g_kStateFileKey) };
            stored.has_value() && !stored->empty())
        {
            vaultcache::log::debug(g_kTag, "state file taken from credential store");
            stateFile = std::move(stored);
        }
    }
    if (!stateFile.has_value())
    {
        return ConfigError::MissingStateFile;
    }
    settings.stateFile = std::filesystem::path{ *stateFile };

    persist(store, bootstrapService, vaultcache::platform::g_kOrganizationIdKey, settings.organizationId);
    persist(store, orgService, vaultcache::platform::g_kStateFileKey, *stateFile);
    return settings;
}

vaultcache::core::CacheOptions loadCacheOptions(const EnvReader& env)
{
    vaultcache::core::CacheOptions options{};

    if (const auto ttl{ nonEmpty(env, g_kEnvCacheTtl) }; ttl.has_value())
    {
        long long seconds{ 0 };
        const auto* first{ ttl->data() };
        const auto* last{ ttl->data() + ttl->size() };
        const auto [ptr, ec]{ std::from_chars(first, last, seconds) };
        if (ec == std::errc{} && ptr == last && seconds > 0)
        {
            options.ttl = std::chrono::seconds{ seconds };
        }
        else
        {
            vaultcache::log::warn(g_kTag, "ignoring invalid cache ttl", { { "ttl", *ttl } });
        }
    }

    if (const auto flag{ nonEmpty(env, g_kEnvCacheEncryption) }; flag.has_value())
    {
        const std::string v{ lowerCase(*flag) };
        if (v == "0" || v == "false" || v == "off" || v == "no")
        {
            options.encryptEntries = false;
        }
        else if (v == "1" || v == "true" || v == "on" || v == "yes")
        {
            options.encryptEntries = true;
        }
        else
        {
            vaultcache::log::warn(g_kTag, "ignoring invalid cache encryption flag", { { "flag", *flag } });
        }
    }
    return options;
}

void applyLogLevel(const EnvReader& env)
{
    const auto text{ nonEmpty(env, g_kEnvLogLevel) };
    if (!text.has_value())
    {
        return;
    }
    if (const auto level{ vaultcache::log::parseLevel(*text) }; level.has_value())
    {
        vaultcache::log::setMinLevel(*level);
        return;
    }
    vaultcache::log::warn(g_kTag, "ignoring invalid log level", { { "level", *text } });
}

} // namespace vaultcache::config
