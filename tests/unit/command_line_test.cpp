#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "CommandLine.hpp"
#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"
#include "vaultcache/crypto/providers/OpenSslProviderFactory.hpp"
#include "vaultcache/gateway/GatewayFactory.hpp"

#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace
{

constexpr std::string_view g_kDocument{ R"({"secrets": [
  {"id": "1", "organizationId": "o1", "projectId": null, "key": "VAULTCACHE_CLI_SHARED", "value": "s"},
  {"id": "2", "organizationId": "o1", "projectId": "p1", "key": "VAULTCACHE_CLI_A", "value": "1"},
  {"id": "3", "organizationId": "o1", "projectId": "p2", "key": "VAULTCACHE_CLI_B", "value": "2"}
]})" };

class CommandLineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.valid());
        const auto document{ m_dir.path() / "secrets.json" };
        vaultcache::test_utils::writeTextFile(document, g_kDocument);

        m_vars["API_URL"] = "file://" + document.string();
        m_vars["BWS_TOKEN"] = "0.token";
        m_vars["ORGANIZATION_ID"] = "o1";
        m_vars["STATE_FILE"] = (m_dir.path() / "state.json").string();
    }

    void TearDown() override
    {
#if !defined(_WIN32)
        for (const char* name : { "VAULTCACHE_CLI_SHARED", "VAULTCACHE_CLI_A", "VAULTCACHE_CLI_B" })
        {
            ::unsetenv(name);
        }
#endif
    }

    int run(const std::vector<std::string>& args)
    {
        vaultcache::ui::cli::CommandLine cli{ vaultcache::ui::cli::CommandContext{
            .env = [vars = m_vars](std::string_view name) -> std::optional<std::string> {
                const auto it{ vars.find(std::string{ name }) };
                if (it == vars.end())
                {
                    return std::nullopt;
                }
                return it->second;
            },
            .credentials = m_store,
            .crypto = *m_crypto,
            .identity = m_identity,
            .makeGateway = vaultcache::gateway::makeSecretsGateway,
            .exec =
                [this](const std::vector<std::string>& command) {
                    m_executed = command;
                    return m_execResult;
                },
            .out = m_out,
            .err = m_err,
        } };
        return cli.run(args);
    }

    vaultcache::test_utils::TempDir m_dir{ "cli_" };                        // NOLINT
    std::map<std::string, std::string> m_vars;                             // NOLINT
    vaultcache::test_utils::MemoryCredentialStore m_store;                 // NOLINT
    std::unique_ptr<vaultcache::crypto::ICryptoProvider> m_crypto{         // NOLINT
                                                                   vaultcache::crypto::providers::makeOpenSslCryptoProvider()
    };
    vaultcache::test_utils::FixedIdentity m_identity{ "host-a:machine-1" }; // NOLINT
    std::optional<std::vector<std::string>> m_executed;                    // NOLINT
    int m_execResult{ 0 };                                                 // NOLINT
    std::stringstream m_out;                                               // NOLINT
    std::stringstream m_err;                                               // NOLINT
};

} // namespace

TEST_F(CommandLineTest, GetListsNamesOnly)
{
    EXPECT_EQ(run({ "get", "-p", "p1" }), 0);
    EXPECT_EQ(m_out.str(), "VAULTCACHE_CLI_A\nVAULTCACHE_CLI_SHARED\n");
}

TEST_F(CommandLineTest, GetShowValues)
{
    EXPECT_EQ(run({ "get", "--project", "p2", "--show-values" }), 0);
    EXPECT_EQ(m_out.str(), "VAULTCACHE_CLI_B=2\nVAULTCACHE_CLI_SHARED=s\n");
}

TEST_F(CommandLineTest, GetWithUnknownOrganizationPrintsEmpty)
{
    EXPECT_EQ(run({ "get", "-o", "o9", "--refresh" }), 0);
    EXPECT_EQ(m_out.str(), "(empty)\n");
}

TEST_F(CommandLineTest, GetPersistsBootstrapValues)
{
    ASSERT_EQ(run({ "get" }), 0);
    EXPECT_EQ(m_store.get("vaultcache", "organization_id"), "o1");
    EXPECT_TRUE(std::filesystem::exists(m_dir.path() / "state.json"));
}

TEST_F(CommandLineTest, MissingTokenIsConfigurationError)
{
    m_vars.erase("BWS_TOKEN");
    EXPECT_EQ(run({ "get" }), 2);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("Configuration error: BWS_TOKEN"));
}

TEST_F(CommandLineTest, UnsupportedEndpointIsConfigurationError)
{
    m_vars["API_URL"] = "https://api.bitwarden.com";
    const vaultcache::test_utils::LogCapture logs{};
    EXPECT_EQ(run({ "get" }), 2);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("not supported"));
}

TEST_F(CommandLineTest, BadDocumentIsProviderError)
{
    vaultcache::test_utils::writeTextFile(m_dir.path() / "secrets.json", "{}");
    EXPECT_EQ(run({ "get" }), 3);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("Provider error:"));
}

TEST_F(CommandLineTest, UsageErrorsFail)
{
    EXPECT_EQ(run({}), 1);
    EXPECT_EQ(run({ "frobnicate" }), 1);
    EXPECT_EQ(run({ "exec" }), 1);
    EXPECT_FALSE(m_executed.has_value());
}

TEST_F(CommandLineTest, HelpSucceeds)
{
    EXPECT_EQ(run({ "--help" }), 0);
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("exec"));
}

#if !defined(_WIN32)

TEST_F(CommandLineTest, ExecExportsSecretsAndRunsCommand)
{
    EXPECT_EQ(run({ "exec", "-p", "p1", "--", "printenv", "VAULTCACHE_CLI_A" }), 0);

    ASSERT_TRUE(m_executed.has_value());
    EXPECT_EQ(*m_executed, (std::vector<std::string>{ "printenv", "VAULTCACHE_CLI_A" }));
    EXPECT_EQ(vaultcache::test_utils::getEnv("VAULTCACHE_CLI_A"), "1");
    EXPECT_EQ(vaultcache::test_utils::getEnv("VAULTCACHE_CLI_SHARED"), "s");
    EXPECT_FALSE(vaultcache::test_utils::getEnv("VAULTCACHE_CLI_B").has_value());
}

TEST_F(CommandLineTest, ExecKeepsExistingVariablesUnlessOverride)
{
    ASSERT_EQ(::setenv("VAULTCACHE_CLI_A", "mine", 1), 0);

    EXPECT_EQ(run({ "exec", "-p", "p1", "--", "true" }), 0);
    EXPECT_EQ(vaultcache::test_utils::getEnv("VAULTCACHE_CLI_A"), "mine");

    EXPECT_EQ(run({ "exec", "-p", "p1", "--override", "--", "true" }), 0);
    EXPECT_EQ(vaultcache::test_utils::getEnv("VAULTCACHE_CLI_A"), "1");
}

#endif

TEST_F(CommandLineTest, ExecFailureIsReported)
{
    m_execResult = -1;
    EXPECT_EQ(run({ "exec", "--", "no-such-binary" }), 1);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("Error: cannot execute no-such-binary"));
}

TEST_F(CommandLineTest, ConfigShowReportsStoredValues)
{
    ASSERT_EQ(run({ "get" }), 0);
    m_out.str(std::string{});

    EXPECT_EQ(run({ "config", "show" }), 0);
    const auto text{ m_out.str() };
    EXPECT_THAT(text, ::testing::HasSubstr("credential store: available"));
    EXPECT_THAT(text, ::testing::HasSubstr("organization_id: o1"));
    EXPECT_THAT(text, ::testing::HasSubstr("state_file: " + (m_dir.path() / "state.json").string()));
}

TEST_F(CommandLineTest, ConfigForgetRemovesStoredValues)
{
    ASSERT_EQ(run({ "get" }), 0);
    m_out.str(std::string{});

    EXPECT_EQ(run({ "config", "forget" }), 0);
    EXPECT_EQ(m_out.str(), "removed 2 stored value(s)\n");
    EXPECT_FALSE(m_store.get("vaultcache", "organization_id").has_value());
}
