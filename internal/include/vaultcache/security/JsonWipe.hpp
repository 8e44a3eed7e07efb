#ifndef INTERNAL_INCLUDE_VAULTCACHE_SECURITY_JSONWIPE_HPP
#define INTERNAL_INCLUDE_VAULTCACHE_SECURITY_JSONWIPE_HPP

#include "vaultcache/security/MemoryWiper.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vaultcache::security
{

// Wipes every string held by a JSON document (object keys are left alone).
inline void wipeJsonStrings(nlohmann::json& doc) noexcept
{
    if (doc.is_string())
    {
        wipeString(doc.get_ref<std::string&>());
        return;
    }
    if (doc.is_structured())
    {
        for (auto& child : doc)
        {
            wipeJsonStrings(child);
        }
    }
}

class [[nodiscard]] JsonWipe final
{
public:
    explicit JsonWipe(nlohmann::json& doc) noexcept : m_doc(&doc)
    {
    }
    JsonWipe(const JsonWipe&) = delete;
    JsonWipe& operator=(const JsonWipe&) = delete;
    JsonWipe(JsonWipe&&) = delete;
    JsonWipe& operator=(JsonWipe&&) = delete;
    ~JsonWipe()
    {
        wipeJsonStrings(*m_doc);
    }

private:
    nlohmann::json* m_doc;
};

} // namespace vaultcache::security

#endif // INTERNAL_INCLUDE_VAULTCACHE_SECURITY_JSONWIPE_HPP
