#include "vaultcache/platform/EnvironmentExport.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include <cstdlib>
#include <string>
#include <string_view>

namespace vaultcache::platform
{
namespace
{

constexpr std::string_view g_kTag{ "env" };

[[nodiscard]] bool validName(std::string_view name) noexcept
{
    return !name.empty() && name.find('=') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

[[nodiscard]] bool isSet(const std::string& name)
{
#if defined(_WIN32)
    char* value{ nullptr };
    std::size_t len{ 0U };
    if (_dupenv_s(&value, &len, name.c_str()) != 0 || value == nullptr)
    {
        return false;
    }
    std::free(value);
    return true;
#else
    return std::getenv(name.c_str()) != nullptr;
#endif
}

[[nodiscard]] bool setVariable(const std::string& name, const std::string& value)
{
#if defined(_WIN32)
    return _putenv_s(name.c_str(), value.c_str()) == 0;
#else
    return ::setenv(name.c_str(), value.c_str(), 1) == 0;
#endif
}

} // namespace

std::size_t exportToEnvironment(const vaultcache::core::SecretMap& secrets, bool overrideExisting)
{
    std::size_t written{ 0U };
    for (const auto& [name, value] : secrets)
    {
        if (!validName(name))
        {
            vaultcache::log::warn(g_kTag, "skipping secret with invalid variable name");
            continue;
        }
        if (!overrideExisting && isSet(name))
        {
            vaultcache::log::debug(g_kTag, "keeping existing variable", { { "name", name } });
            continue;
        }

        std::string terminated{ vaultcache::security::asStringView(value) };
        const bool ok{ setVariable(name, terminated) };
        vaultcache::security::wipeString(terminated);
        if (!ok)
        {
            vaultcache::log::warn(g_kTag, "cannot set variable", { { "name", name } });
            continue;
        }
        ++written;
    }
    return written;
}

} // namespace vaultcache::platform
