#include "vaultcache/platform/credentials/CredentialStoreFactory.hpp"

namespace vaultcache::platform
{
namespace
{

class NullCredentialStore final : public ICredentialStore
{
public:
    [[nodiscard]] bool available() const noexcept override
    {
        return false;
    }

    [[nodiscard]] std::optional<std::string> get([[maybe_unused]] std::string_view service,
                                                 [[maybe_unused]] std::string_view key) override
    {
        return std::nullopt;
    }

    [[nodiscard]] bool set([[maybe_unused]] std::string_view service, [[maybe_unused]] std::string_view key,
                           [[maybe_unused]] std::string_view value) override
    {
        return false;
    }

    [[nodiscard]] bool remove([[maybe_unused]] std::string_view service,
                              [[maybe_unused]] std::string_view key) override
    {
        return false;
    }
};

} // namespace

std::string organizationService(std::string_view organizationId)
{
    std::string service{ g_kCredentialServicePrefix };
    service.push_back('.');
    service += organizationId;
    return service;
}

std::unique_ptr<ICredentialStore> makeNullCredentialStore()
{
    return std::make_unique<NullCredentialStore>();
}

} // namespace vaultcache::platform
