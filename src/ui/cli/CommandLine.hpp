#ifndef VAULTCACHE_UI_CLI_COMMANDLINE_HPP
#define VAULTCACHE_UI_CLI_COMMANDLINE_HPP

#include "vaultcache/config/Config.hpp"
#include "vaultcache/core/MachineIdentity.hpp"
#include "vaultcache/core/SecretMap.hpp"
#include "vaultcache/crypto/ICryptoProvider.hpp"
#include "vaultcache/gateway/ISecretsGateway.hpp"
#include "vaultcache/platform/ICredentialStore.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace vaultcache::ui::cli
{

enum class ExitCode : int
{
    Success = 0,
    Failure = 1,
    ConfigurationError = 2,
    ProviderError = 3,
};

using GatewayMaker = std::function<vaultcache::config::ConfigResult<std::unique_ptr<vaultcache::gateway::ISecretsGateway>>(
    const vaultcache::config::GatewaySettings&)>;

// Replaces the process image. Returns only on failure. In tests: records the command.
using ProcessExec = std::function<int(const std::vector<std::string>& command)>;

struct CommandContext final
{
    vaultcache::config::EnvReader env;
    vaultcache::platform::ICredentialStore& credentials;
    vaultcache::crypto::ICryptoProvider& crypto;
    vaultcache::core::IMachineIdentity& identity;
    GatewayMaker makeGateway;
    ProcessExec exec;
    std::ostream& out;
    std::ostream& err;
};

class CommandLine final
{
public:
    explicit CommandLine(CommandContext context);

    // `args` excludes the program name.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    [[nodiscard]] std::variant<vaultcache::core::SecretMap, ExitCode>
    loadSecrets(const std::optional<std::string>& organizationId, const std::optional<std::string>& projectId,
                bool forceRefresh);

    [[nodiscard]] ExitCode doGet(const std::optional<std::string>& organizationId,
                                 const std::optional<std::string>& projectId, bool forceRefresh, bool showValues);
    [[nodiscard]] ExitCode doExec(const std::optional<std::string>& organizationId,
                                  const std::optional<std::string>& projectId, bool overrideExisting,
                                  const std::vector<std::string>& command);
    [[nodiscard]] ExitCode doConfigShow(const std::optional<std::string>& organizationId);
    [[nodiscard]] ExitCode doConfigForget(const std::optional<std::string>& organizationId);

    [[nodiscard]] std::optional<std::string> resolveOrganization(const std::optional<std::string>& organizationId);

    CommandContext m_ctx;
};

} // namespace vaultcache::ui::cli

#endif // VAULTCACHE_UI_CLI_COMMANDLINE_HPP
