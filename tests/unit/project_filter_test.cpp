#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "test_utils/Fakes.hpp"
#include "vaultcache/gateway/ISecretsGateway.hpp"

namespace
{

using vaultcache::gateway::SecretRecord;

SecretRecord record(std::string key, std::string_view value, std::optional<std::string> project)
{
    return SecretRecord{ std::move(key), vaultcache::security::secureStringFrom(value), std::move(project) };
}

std::vector<SecretRecord> sampleRecords()
{
    std::vector<SecretRecord> out{};
    out.push_back(record("SHARED", "s", std::nullopt));
    out.push_back(record("P1_ONLY", "one", "p1"));
    out.push_back(record("P2_ONLY", "two", "p2"));
    return out;
}

} // namespace

TEST(ProjectFilter, NoFilterKeepsEverything)
{
    const auto records{ sampleRecords() };
    const auto selected{ vaultcache::gateway::selectProjectSecrets(records, std::nullopt) };
    EXPECT_EQ(selected.size(), 3U);
}

TEST(ProjectFilter, FilterKeepsMatchingAndUnscoped)
{
    const auto records{ sampleRecords() };
    const auto selected{ vaultcache::gateway::selectProjectSecrets(records, std::string{ "p1" }) };
    EXPECT_EQ(vaultcache::test_utils::plainCopy(selected),
              (std::map<std::string, std::string>{ { "P1_ONLY", "one" }, { "SHARED", "s" } }));
}

TEST(ProjectFilter, UnknownProjectKeepsOnlyUnscoped)
{
    const auto records{ sampleRecords() };
    const auto selected{ vaultcache::gateway::selectProjectSecrets(records, std::string{ "p9" }) };
    EXPECT_EQ(vaultcache::test_utils::plainCopy(selected), (std::map<std::string, std::string>{ { "SHARED", "s" } }));
}

TEST(ProjectFilter, LaterDuplicateKeyWins)
{
    std::vector<SecretRecord> records{};
    records.push_back(record("K", "first", std::nullopt));
    records.push_back(record("K", "second", "p1"));

    const auto selected{ vaultcache::gateway::selectProjectSecrets(records, std::string{ "p1" }) };
    EXPECT_EQ(vaultcache::test_utils::plainCopy(selected), (std::map<std::string, std::string>{ { "K", "second" } }));
}

TEST(ProjectFilter, EmptyInputGivesEmptyMap)
{
    EXPECT_TRUE(vaultcache::gateway::selectProjectSecrets({}, std::string{ "p1" }).empty());
}
