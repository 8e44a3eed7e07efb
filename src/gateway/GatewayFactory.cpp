#include "vaultcache/gateway/GatewayFactory.hpp"

#include "vaultcache/gateway/jsonfile/JsonFileSecretsGateway.hpp"
#include "vaultcache/log/Log.hpp"

namespace vaultcache::gateway
{

std::optional<std::filesystem::path> fileUrlPath(std::string_view url)
{
    if (!url.starts_with(g_kFileScheme))
    {
        return std::nullopt;
    }
    const auto path{ url.substr(g_kFileScheme.size()) };
    if (path.empty())
    {
        return std::nullopt;
    }
    return std::filesystem::path{ std::string{ path } };
}

vaultcache::config::ConfigResult<std::unique_ptr<ISecretsGateway>>
makeSecretsGateway(const vaultcache::config::GatewaySettings& settings)
{
    const auto document{ fileUrlPath(settings.apiUrl) };
    if (!document.has_value())
    {
        vaultcache::log::error("gateway", "no adapter for endpoint", { { "url", settings.apiUrl } });
        return vaultcache::config::ConfigError::UnsupportedEndpoint;
    }
    std::unique_ptr<ISecretsGateway> gateway{ std::make_unique<JsonFileSecretsGateway>(
        *document, settings.accessToken, settings.stateFile) };
    return gateway;
}

} // namespace vaultcache::gateway
