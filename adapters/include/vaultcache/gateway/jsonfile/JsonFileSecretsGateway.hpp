#ifndef ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_JSONFILE_JSONFILESECRETSGATEWAY_HPP
#define ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_JSONFILE_JSONFILESECRETSGATEWAY_HPP

#include "vaultcache/gateway/ISecretsGateway.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include <chrono>
#include <filesystem>
#include <functional>

namespace vaultcache::gateway
{

// Serves provider records from a local JSON document:
//   {"secrets":[{"id":..,"organizationId":..,"projectId":..|null,"key":..,"value":..}, ...]}
// Every record is validated before any secret is returned. After a successful fetch the authentication-state
// file {"organizationId":..,"lastSync":<unix seconds>} is written and hardened.
class JsonFileSecretsGateway final : public ISecretsGateway
{
public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    JsonFileSecretsGateway(std::filesystem::path document, vaultcache::security::SecureString accessToken,
                           std::filesystem::path stateFile, WallClock wallClock = std::chrono::system_clock::now);

    [[nodiscard]] vaultcache::core::SecretMap fetch(std::string_view organizationId,
                                                    const std::optional<std::string>& projectId) override;

private:
    void writeState(std::string_view organizationId) const;

    std::filesystem::path m_document;
    vaultcache::security::SecureString m_accessToken;
    std::filesystem::path m_stateFile;
    WallClock m_wallClock;
};

} // namespace vaultcache::gateway

#endif // ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_JSONFILE_JSONFILESECRETSGATEWAY_HPP
