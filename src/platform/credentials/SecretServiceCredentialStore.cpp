#include "vaultcache/platform/PlatformCredentialStores.hpp"

#include "vaultcache/log/Log.hpp"
#include <libsecret/secret.h>
#include <memory>
#include <string>

namespace vaultcache::platform
{
namespace
{

constexpr std::string_view g_kTag{ "credentials" };
constexpr std::string_view g_kProbeKey{ "__probe__" };

const SecretSchema* bootstrapSchema() noexcept
{
    static const SecretSchema schema{ "org.vaultcache.Bootstrap",
                                      SECRET_SCHEMA_NONE,
                                      {
                                          { "service", SECRET_SCHEMA_ATTRIBUTE_STRING },
                                          { "key", SECRET_SCHEMA_ATTRIBUTE_STRING },
                                          { nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING },
                                      } };
    return &schema;
}

struct GErrorDeleter final
{
    void operator()(GError* e) const noexcept
    {
        if (e != nullptr)
        {
            g_error_free(e);
        }
    }
};

struct PasswordDeleter final
{
    void operator()(gchar* p) const noexcept
    {
        // Wipes before freeing.
        secret_password_free(p);
    }
};

using ErrorPtr = std::unique_ptr<GError, GErrorDeleter>;
using PasswordPtr = std::unique_ptr<gchar, PasswordDeleter>;

void logError(std::string_view what, const ErrorPtr& error)
{
    const std::string_view reason{ (error && error->message != nullptr) ? error->message : "unknown" };
    vaultcache::log::warn(g_kTag, what, { { "reason", reason } });
}

class SecretServiceCredentialStore final : public ICredentialStore
{
public:
    [[nodiscard]] bool available() const noexcept override
    {
        return true;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view service, std::string_view key) override
    {
        const std::string s{ service };
        const std::string k{ key };
        GError* raw{ nullptr };
        const PasswordPtr value{ secret_password_lookup_sync(bootstrapSchema(), nullptr, &raw, "service", s.c_str(),
                                                             "key", k.c_str(), nullptr) };
        const ErrorPtr error{ raw };
        if (error)
        {
            logError("credential lookup failed", error);
            return std::nullopt;
        }
        if (!value)
        {
            return std::nullopt;
        }
        return std::string{ value.get() };
    }

    [[nodiscard]] bool set(std::string_view service, std::string_view key, std::string_view value) override
    {
        const std::string s{ service };
        const std::string k{ key };
        const std::string v{ value };
        const std::string label{ s + "/" + k };
        GError* raw{ nullptr };
        const gboolean ok{ secret_password_store_sync(bootstrapSchema(), SECRET_COLLECTION_DEFAULT, label.c_str(),
                                                      v.c_str(), nullptr, &raw, "service", s.c_str(), "key", k.c_str(),
                                                      nullptr) };
        const ErrorPtr error{ raw };
        if (error || ok == FALSE)
        {
            logError("credential store failed", error);
            return false;
        }
        return true;
    }

    [[nodiscard]] bool remove(std::string_view service, std::string_view key) override
    {
        const std::string s{ service };
        const std::string k{ key };
        GError* raw{ nullptr };
        const gboolean removed{ secret_password_clear_sync(bootstrapSchema(), nullptr, &raw, "service", s.c_str(),
                                                           "key", k.c_str(), nullptr) };
        const ErrorPtr error{ raw };
        if (error)
        {
            logError("credential removal failed", error);
            return false;
        }
        return removed != FALSE;
    }
};

} // namespace

std::unique_ptr<ICredentialStore> makeSecretServiceCredentialStore()
{
    const std::string service{ g_kCredentialServicePrefix };
    const std::string key{ g_kProbeKey };
    GError* raw{ nullptr };
    const PasswordPtr probe{ secret_password_lookup_sync(bootstrapSchema(), nullptr, &raw, "service", service.c_str(),
                                                         "key", key.c_str(), nullptr) };
    const ErrorPtr error{ raw };
    if (error)
    {
        const std::string_view reason{ error->message != nullptr ? error->message : "unknown" };
        vaultcache::log::debug(g_kTag, "secret service unavailable", { { "reason", reason } });
        return nullptr;
    }
    return std::make_unique<SecretServiceCredentialStore>();
}

} // namespace vaultcache::platform
