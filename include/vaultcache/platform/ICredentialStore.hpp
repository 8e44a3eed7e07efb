#ifndef INCLUDE_VAULTCACHE_PLATFORM_ICREDENTIALSTORE_HPP
#define INCLUDE_VAULTCACHE_PLATFORM_ICREDENTIALSTORE_HPP

#include <optional>
#include <string>
#include <string_view>

namespace vaultcache::platform
{

// Bootstrap values live under this service; per-organization values under "<prefix>.<org>".
inline constexpr std::string_view g_kCredentialServicePrefix{ "vaultcache" };
inline constexpr std::string_view g_kOrganizationIdKey{ "organization_id" };
inline constexpr std::string_view g_kStateFileKey{ "state_file" };

[[nodiscard]] std::string organizationService(std::string_view organizationId);

// OS credential facility for small bootstrap configuration values. Never used for secret values.
class ICredentialStore
{
public:
    ICredentialStore() = default;
    ICredentialStore(const ICredentialStore&) = delete;
    ICredentialStore& operator=(const ICredentialStore&) = delete;
    ICredentialStore(ICredentialStore&&) = delete;
    ICredentialStore& operator=(ICredentialStore&&) = delete;
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual bool available() const noexcept = 0;
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view service, std::string_view key) = 0;
    [[nodiscard]] virtual bool set(std::string_view service, std::string_view key, std::string_view value) = 0;
    // True when an entry was removed.
    [[nodiscard]] virtual bool remove(std::string_view service, std::string_view key) = 0;
};

} // namespace vaultcache::platform

#endif // INCLUDE_VAULTCACHE_PLATFORM_ICREDENTIALSTORE_HPP
