#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"

#include "vaultcache/config/Config.hpp"
#include "vaultcache/core/MachineIdentity.hpp"
#include "vaultcache/crypto/providers/OpenSslProviderFactory.hpp"
#include "vaultcache/gateway/GatewayFactory.hpp"
#include "vaultcache/platform/credentials/CredentialStoreFactory.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        vaultcache::ui::cli::lockProcessMemory();

        auto crypto{ vaultcache::crypto::providers::makeOpenSslCryptoProvider() };
        auto credentials{ vaultcache::platform::makePlatformCredentialStore() };
        vaultcache::core::MachineIdentity identity{};

        vaultcache::ui::cli::CommandLine cli{ vaultcache::ui::cli::CommandContext{
            .env = vaultcache::config::readProcessEnv,
            .credentials = *credentials,
            .crypto = *crypto,
            .identity = identity,
            .makeGateway = vaultcache::gateway::makeSecretsGateway,
            .exec = vaultcache::ui::cli::execProcess,
            .out = std::cout,
            .err = std::cerr,
        } };

        const std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
