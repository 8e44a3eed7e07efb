#include "vaultcache/platform/PlatformCredentialStores.hpp"

#include "vaultcache/log/Log.hpp"
#include <memory>
#include <string>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <wincred.h>

namespace vaultcache::platform
{
namespace
{

constexpr std::string_view g_kTag{ "credentials" };

struct CredDeleter final
{
    void operator()(PCREDENTIALA c) const noexcept
    {
        if (c != nullptr)
        {
            ::CredFree(c);
        }
    }
};

[[nodiscard]] std::string targetName(std::string_view service, std::string_view key)
{
    std::string target{ service };
    target.push_back('/');
    target += key;
    return target;
}

class WinCredentialStore final : public ICredentialStore
{
public:
    [[nodiscard]] bool available() const noexcept override
    {
        return true;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view service, std::string_view key) override
    {
        const std::string target{ targetName(service, key) };
        PCREDENTIALA raw{ nullptr };
        if (::CredReadA(target.c_str(), CRED_TYPE_GENERIC, 0, &raw) == FALSE)
        {
            if (::GetLastError() != ERROR_NOT_FOUND)
            {
                vaultcache::log::warn(g_kTag, "credential lookup failed", { { "target", target } });
            }
            return std::nullopt;
        }
        const std::unique_ptr<CREDENTIALA, CredDeleter> cred{ raw };
        if (cred->CredentialBlob == nullptr || cred->CredentialBlobSize == 0U)
        {
            return std::string{};
        }
        return std::string{ reinterpret_cast<const char*>(cred->CredentialBlob), cred->CredentialBlobSize };
    }

    [[nodiscard]] bool set(std::string_view service, std::string_view key, std::string_view value) override
    {
        std::string target{ targetName(service, key) };
        std::vector<BYTE> blob(value.begin(), value.end());

        CREDENTIALA cred{};
        cred.Type = CRED_TYPE_GENERIC;
        cred.TargetName = target.data();
        cred.CredentialBlobSize = static_cast<DWORD>(blob.size());
        cred.CredentialBlob = blob.empty() ? nullptr : blob.data();
        cred.Persist = CRED_PERSIST_LOCAL_MACHINE;
        if (::CredWriteA(&cred, 0) == FALSE)
        {
            vaultcache::log::warn(g_kTag, "credential store failed", { { "target", target } });
            return false;
        }
        return true;
    }

    [[nodiscard]] bool remove(std::string_view service, std::string_view key) override
    {
        const std::string target{ targetName(service, key) };
        return ::CredDeleteA(target.c_str(), CRED_TYPE_GENERIC, 0) != FALSE;
    }
};

} // namespace

std::unique_ptr<ICredentialStore> makeWindowsCredentialStore()
{
    return std::make_unique<WinCredentialStore>();
}

} // namespace vaultcache::platform
