#include "vaultcache/gateway/ISecretsGateway.hpp"

namespace vaultcache::gateway
{

vaultcache::core::SecretMap selectProjectSecrets(std::span<const SecretRecord> records,
                                                 const std::optional<std::string>& projectId)
{
    vaultcache::core::SecretMap out{};
    for (const auto& record : records)
    {
        const bool matches{ !projectId.has_value() || !record.projectId.has_value() || *record.projectId == *projectId };
        if (!matches)
        {
            continue;
        }
        out.insert_or_assign(record.key, record.value);
    }
    return out;
}

} // namespace vaultcache::gateway
