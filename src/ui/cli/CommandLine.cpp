#include "CommandLine.hpp"

#include "vaultcache/core/CacheSession.hpp"
#include "vaultcache/core/SecretCache.hpp"
#include "vaultcache/core/SecretCipher.hpp"
#include "vaultcache/log/Log.hpp"
#include "vaultcache/platform/EnvironmentExport.hpp"
#include "vaultcache/security/SecureMemory.hpp"

#include <CLI/CLI.hpp>
#include <utility>

namespace vaultcache::ui::cli
{
namespace
{

[[nodiscard]] std::optional<std::string> optionalArg(const std::string& value)
{
    if (value.empty())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] int toInt(ExitCode code) noexcept
{
    return static_cast<int>(code);
}

} // namespace

CommandLine::CommandLine(CommandContext context) : m_ctx(std::move(context))
{
}

int CommandLine::run(const std::vector<std::string>& userArgs)
{
    vaultcache::config::applyLogLevel(m_ctx.env);

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1U);
    args.emplace_back("vaultcache");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Secure local cache for provider-managed secrets" };
    app.require_subcommand(1);

    std::string organization;
    std::string project;
    bool refresh{ false };
    bool showValues{ false };
    bool overrideExisting{ false };
    std::vector<std::string> command;

    // GET
    auto* subGet = app.add_subcommand("get", "Print the names of the secrets for an organization/project");
    subGet->add_option("-o,--organization", organization, "Organization id (default: ORGANIZATION_ID)");
    subGet->add_option("-p,--project", project, "Project id filter");
    subGet->add_flag("--refresh", refresh, "Bypass the cache");
    subGet->add_flag("--show-values", showValues, "Print NAME=VALUE instead of names");

    // EXEC
    auto* subExec = app.add_subcommand("exec", "Run a command with the secrets in its environment");
    subExec->add_option("-o,--organization", organization, "Organization id (default: ORGANIZATION_ID)");
    subExec->add_option("-p,--project", project, "Project id filter");
    subExec->add_flag("--override", overrideExisting, "Replace variables that are already set");
    subExec->add_option("command", command, "Command and arguments (after --)")->required()->expected(-1);

    // CONFIG
    auto* subConfig = app.add_subcommand("config", "Inspect bootstrap values held in the OS credential store");
    subConfig->add_option("-o,--organization", organization, "Organization id");
    subConfig->require_subcommand(1);
    auto* subShow = subConfig->add_subcommand("show", "Show stored bootstrap values");
    auto* subForget = subConfig->add_subcommand("forget", "Remove stored bootstrap values");

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (auto& arg : args)
        {
            argv.push_back(arg.data());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        const int rc{ app.exit(e, m_ctx.out, m_ctx.err) };
        return rc == 0 ? toInt(ExitCode::Success) : toInt(ExitCode::Failure);
    }

    const auto org{ optionalArg(organization) };
    const auto proj{ optionalArg(project) };
    if (subGet->parsed())
    {
        return toInt(doGet(org, proj, refresh, showValues));
    }
    if (subExec->parsed())
    {
        return toInt(doExec(org, proj, overrideExisting, command));
    }
    if (subShow->parsed())
    {
        return toInt(doConfigShow(org));
    }
    if (subForget->parsed())
    {
        return toInt(doConfigForget(org));
    }
    return toInt(ExitCode::Failure);
}

std::variant<vaultcache::core::SecretMap, ExitCode>
CommandLine::loadSecrets(const std::optional<std::string>& organizationId, const std::optional<std::string>& projectId,
                         bool forceRefresh)
{
    auto settingsRes{ vaultcache::config::loadGatewaySettings(m_ctx.env, m_ctx.credentials, organizationId) };
    if (const auto* error{ std::get_if<vaultcache::config::ConfigError>(&settingsRes) }; error != nullptr)
    {
        m_ctx.err << "Configuration error: " << vaultcache::config::describe(*error) << "\n";
        return ExitCode::ConfigurationError;
    }
    const auto& settings{ std::get<vaultcache::config::GatewaySettings>(settingsRes) };

    auto gatewayRes{ m_ctx.makeGateway(settings) };
    if (const auto* error{ std::get_if<vaultcache::config::ConfigError>(&gatewayRes) }; error != nullptr)
    {
        m_ctx.err << "Configuration error: " << vaultcache::config::describe(*error) << "\n";
        return ExitCode::ConfigurationError;
    }
    auto& gateway{ std::get<std::unique_ptr<vaultcache::gateway::ISecretsGateway>>(gatewayRes) };

    const vaultcache::core::SecretCipher cipher{ m_ctx.crypto, m_ctx.identity };
    vaultcache::core::SecretCache cache{ *gateway, cipher, vaultcache::config::loadCacheOptions(m_ctx.env) };
    const vaultcache::core::CacheSession session{ cache };
    try
    {
        return session.cache().get(settings.organizationId, projectId, forceRefresh);
    }
    catch (const vaultcache::gateway::ProviderError& e)
    {
        m_ctx.err << "Provider error: " << e.what() << "\n";
        return ExitCode::ProviderError;
    }
}

ExitCode CommandLine::doGet(const std::optional<std::string>& organizationId,
                            const std::optional<std::string>& projectId, bool forceRefresh, bool showValues)
{
    auto result{ loadSecrets(organizationId, projectId, forceRefresh) };
    if (const auto* code{ std::get_if<ExitCode>(&result) }; code != nullptr)
    {
        return *code;
    }

    const auto& secrets{ std::get<vaultcache::core::SecretMap>(result) };
    if (secrets.empty())
    {
        m_ctx.out << "(empty)\n";
        return ExitCode::Success;
    }
    for (const auto& [name, value] : secrets)
    {
        if (showValues)
        {
            m_ctx.out << name << "=" << vaultcache::security::asStringView(value) << "\n";
        }
        else
        {
            m_ctx.out << name << "\n";
        }
    }
    return ExitCode::Success;
}

ExitCode CommandLine::doExec(const std::optional<std::string>& organizationId,
                             const std::optional<std::string>& projectId, bool overrideExisting,
                             const std::vector<std::string>& command)
{
    {
        auto result{ loadSecrets(organizationId, projectId, false) };
        if (const auto* code{ std::get_if<ExitCode>(&result) }; code != nullptr)
        {
            return *code;
        }
        const auto exported{ vaultcache::platform::exportToEnvironment(std::get<vaultcache::core::SecretMap>(result),
                                                                       overrideExisting) };
        vaultcache::log::debug("cli", "environment prepared", { { "exported", std::to_string(exported) } });
    }

    const int rc{ m_ctx.exec(command) };
    if (rc != 0)
    {
        m_ctx.err << "Error: cannot execute " << command.front() << "\n";
        return ExitCode::Failure;
    }
    return ExitCode::Success;
}

std::optional<std::string> CommandLine::resolveOrganization(const std::optional<std::string>& organizationId)
{
    if (organizationId.has_value())
    {
        return organizationId;
    }
    if (auto fromEnv{ m_ctx.env(vaultcache::config::g_kEnvOrganizationId) }; fromEnv.has_value() && !fromEnv->empty())
    {
        return fromEnv;
    }
    return m_ctx.credentials.get(vaultcache::platform::g_kCredentialServicePrefix,
                                 vaultcache::platform::g_kOrganizationIdKey);
}

ExitCode CommandLine::doConfigShow(const std::optional<std::string>& organizationId)
{
    m_ctx.out << "credential store: " << (m_ctx.credentials.available() ? "available" : "unavailable") << "\n";

    const auto storedOrg{ m_ctx.credentials.get(vaultcache::platform::g_kCredentialServicePrefix,
                                                vaultcache::platform::g_kOrganizationIdKey) };
    m_ctx.out << "organization_id: " << storedOrg.value_or("(not set)") << "\n";

    const auto org{ resolveOrganization(organizationId) };
    if (!org.has_value())
    {
        m_ctx.out << "state_file: (no organization)\n";
        return ExitCode::Success;
    }
    const auto stateFile{ m_ctx.credentials.get(vaultcache::platform::organizationService(*org),
                                                vaultcache::platform::g_kStateFileKey) };
    m_ctx.out << "state_file: " << stateFile.value_or("(not set)") << "\n";
    return ExitCode::Success;
}

ExitCode CommandLine::doConfigForget(const std::optional<std::string>& organizationId)
{
    std::size_t removed{ 0U };
    if (const auto org{ resolveOrganization(organizationId) }; org.has_value())
    {
        if (m_ctx.credentials.remove(vaultcache::platform::organizationService(*org),
                                     vaultcache::platform::g_kStateFileKey))
        {
            ++removed;
        }
    }
    if (m_ctx.credentials.remove(vaultcache::platform::g_kCredentialServicePrefix,
                                 vaultcache::platform::g_kOrganizationIdKey))
    {
        ++removed;
    }
    m_ctx.out << "removed " << removed << " stored value(s)\n";
    return ExitCode::Success;
}

} // namespace vaultcache::ui::cli
