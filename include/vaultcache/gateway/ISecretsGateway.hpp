#ifndef INCLUDE_VAULTCACHE_GATEWAY_ISECRETSGATEWAY_HPP
#define INCLUDE_VAULTCACHE_GATEWAY_ISECRETSGATEWAY_HPP

#include "vaultcache/core/SecretMap.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vaultcache::gateway
{

// Authentication, network or response-validation failure of the provider. Propagated unchanged through the cache.
class ProviderError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// One secret as reported by the provider.
struct SecretRecord final
{
    std::string key;
    vaultcache::security::SecureString value;
    std::optional<std::string> projectId;
};

class ISecretsGateway
{
public:
    ISecretsGateway() = default;
    ISecretsGateway(const ISecretsGateway&) = delete;
    ISecretsGateway& operator=(const ISecretsGateway&) = delete;
    ISecretsGateway(ISecretsGateway&&) = delete;
    ISecretsGateway& operator=(ISecretsGateway&&) = delete;
    virtual ~ISecretsGateway() = default;

    // Secrets of `organizationId`, narrowed to `projectId` when given. Throws ProviderError.
    [[nodiscard]] virtual vaultcache::core::SecretMap fetch(std::string_view organizationId,
                                                            const std::optional<std::string>& projectId) = 0;
};

// Keeps a record when no filter is given, when it has no project association (unscoped secrets match every filter),
// or when its association equals the filter. A later record with the same key overwrites an earlier one.
[[nodiscard]] vaultcache::core::SecretMap selectProjectSecrets(std::span<const SecretRecord> records,
                                                               const std::optional<std::string>& projectId);

} // namespace vaultcache::gateway

#endif // INCLUDE_VAULTCACHE_GATEWAY_ISECRETSGATEWAY_HPP
