#include "vaultcache/gateway/jsonfile/JsonFileSecretsGateway.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/platform/FilePermissionGuard.hpp"
#include "vaultcache/security/JsonWipe.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include "vaultcache/security/ScopeWipe.hpp"
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>
#include <vector>

namespace vaultcache::gateway
{
namespace
{

constexpr std::string_view g_kTag{ "gateway" };

[[nodiscard]] std::string readDocument(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw ProviderError("cannot read secrets document");
    }
    std::string text{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        vaultcache::security::wipeString(text);
        throw ProviderError("cannot read secrets document");
    }
    return text;
}

[[nodiscard]] const std::string& requireString(const nlohmann::json& record, const char* field, std::size_t index)
{
    const auto it{ record.find(field) };
    if (it == record.end() || !it->is_string())
    {
        throw ProviderError("secret record " + std::to_string(index) + " has no string '" + field + "'");
    }
    return it->get_ref<const std::string&>();
}

[[nodiscard]] std::optional<std::string> optionalProject(const nlohmann::json& record, std::size_t index)
{
    const auto it{ record.find("projectId") };
    if (it == record.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        throw ProviderError("secret record " + std::to_string(index) + " has an invalid 'projectId'");
    }
    return it->get<std::string>();
}

} // namespace

JsonFileSecretsGateway::JsonFileSecretsGateway(std::filesystem::path document,
                                               vaultcache::security::SecureString accessToken,
                                               std::filesystem::path stateFile, WallClock wallClock)
    : m_document(std::move(document)), m_accessToken(std::move(accessToken)), m_stateFile(std::move(stateFile)),
      m_wallClock(std::move(wallClock))
{
}

vaultcache::core::SecretMap JsonFileSecretsGateway::fetch(std::string_view organizationId,
                                                          const std::optional<std::string>& projectId)
{
    if (m_accessToken.empty())
    {
        throw ProviderError("access token rejected");
    }

    std::string text{ readDocument(m_document) };
    const auto textWipe{ vaultcache::security::scopeWipe(text) };
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    const vaultcache::security::JsonWipe docWipe{ doc };
    if (doc.is_discarded() || !doc.is_object())
    {
        throw ProviderError("secrets document is not a JSON object");
    }
    const auto secrets{ doc.find("secrets") };
    if (secrets == doc.end() || !secrets->is_array())
    {
        throw ProviderError("secrets document has no 'secrets' array");
    }

    std::vector<SecretRecord> records{};
    records.reserve(secrets->size());
    std::size_t index{ 0U };
    for (const auto& record : *secrets)
    {
        if (!record.is_object())
        {
            throw ProviderError("secret record " + std::to_string(index) + " is not an object");
        }
        const auto& recordOrg{ requireString(record, "organizationId", index) };
        const auto& key{ requireString(record, "key", index) };
        const auto& value{ requireString(record, "value", index) };
        auto project{ optionalProject(record, index) };
        if (key.empty())
        {
            throw ProviderError("secret record " + std::to_string(index) + " has an empty 'key'");
        }
        ++index;

        if (recordOrg != organizationId)
        {
            continue;
        }
        records.push_back(SecretRecord{
            .key = key, .value = vaultcache::security::secureStringFrom(value), .projectId = std::move(project) });
    }

    auto selected{ selectProjectSecrets(records, projectId) };
    vaultcache::log::debug(g_kTag, "fetched", { { "organization", organizationId } });
    writeState(organizationId);
    return selected;
}

void JsonFileSecretsGateway::writeState(std::string_view organizationId) const
{
    const auto seconds{
        std::chrono::duration_cast<std::chrono::seconds>(m_wallClock().time_since_epoch()).count()
    };
    const nlohmann::json state{ { "organizationId", std::string{ organizationId } }, { "lastSync", seconds } };
    const std::string body{ state.dump() };
    const std::string where{ m_stateFile.string() };

    // Creates the parent directory owner-only when missing.
    if (!vaultcache::platform::hardenStateFile(m_stateFile))
    {
        vaultcache::log::debug(g_kTag, "state directory not hardened", { { "path", where } });
    }

    std::error_code ec{};
    if (!std::filesystem::exists(m_stateFile, ec))
    {
        if (vaultcache::platform::createOwnerOnlyFile(m_stateFile, body))
        {
            return;
        }
    }

    std::ofstream out{ m_stateFile, std::ios::binary | std::ios::trunc };
    out << body;
    out.flush();
    if (!out)
    {
        vaultcache::log::warn(g_kTag, "cannot write state file", { { "path", where } });
        return;
    }
    out.close();
    if (!vaultcache::platform::hardenStateFile(m_stateFile))
    {
        vaultcache::log::warn(g_kTag, "state file left with default permissions", { { "path", where } });
    }
}

} // namespace vaultcache::gateway
