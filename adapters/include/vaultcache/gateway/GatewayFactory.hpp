#ifndef ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_GATEWAYFACTORY_HPP
#define ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_GATEWAYFACTORY_HPP

#include "vaultcache/config/Config.hpp"
#include "vaultcache/gateway/ISecretsGateway.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace vaultcache::gateway
{

inline constexpr std::string_view g_kFileScheme{ "file://" };

// Local path named by a file:// URL, nullopt for any other scheme.
[[nodiscard]] std::optional<std::filesystem::path> fileUrlPath(std::string_view url);

// Picks the adapter for settings.apiUrl. Only file:// endpoints are served; anything else is UnsupportedEndpoint.
[[nodiscard]] vaultcache::config::ConfigResult<std::unique_ptr<ISecretsGateway>>
makeSecretsGateway(const vaultcache::config::GatewaySettings& settings);

} // namespace vaultcache::gateway

#endif // ADAPTERS_INCLUDE_VAULTCACHE_GATEWAY_GATEWAYFACTORY_HPP
