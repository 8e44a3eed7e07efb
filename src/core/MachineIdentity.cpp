#include "vaultcache/core/MachineIdentity.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/platform/FilePermissionGuard.hpp"
#include "vaultcache/platform/Subprocess.hpp"
#include "vaultcache/security/SecureRandom.hpp"
#include <array>
#include <fstream>
#include <variant>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#else
#include <unistd.h>
#endif

namespace vaultcache::core
{
namespace
{

constexpr std::string_view g_kTag{ "identity" };
constexpr std::size_t g_kMaxIdentityFileBytes{ 4096U };
constexpr std::string_view g_kWhitespace{ " \t\r\n" };
constexpr std::string_view g_kIoregUuidKey{ "\"IOPlatformUUID\"" };

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    const auto first{ s.find_first_not_of(g_kWhitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ s.find_last_not_of(g_kWhitespace) };
    return s.substr(first, last - first + 1U);
}

[[nodiscard]] std::optional<std::string> readTrimmed(const std::filesystem::path& path)
{
    if (path.empty())
    {
        return std::nullopt;
    }
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        return std::nullopt;
    }

    std::string raw(g_kMaxIdentityFileBytes, '\0');
    in.read(raw.data(), static_cast<std::streamsize>(raw.size()));
    raw.resize(static_cast<std::size_t>(in.gcount()));

    const auto value{ trim(raw) };
    if (value.empty())
    {
        return std::nullopt;
    }
    return std::string{ value };
}

#if defined(_WIN32)
[[nodiscard]] std::optional<std::string> readRegistryMachineGuid()
{
    std::array<char, 128> buffer{};
    DWORD size{ static_cast<DWORD>(buffer.size()) };
    const LSTATUS rc{ ::RegGetValueA(HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Cryptography", "MachineGuid",
                                     RRF_RT_REG_SZ | RRF_SUBKEY_WOW6464KEY, nullptr, buffer.data(), &size) };
    if (rc != ERROR_SUCCESS || size == 0U)
    {
        return std::nullopt;
    }
    const auto value{ trim(std::string_view{ buffer.data() }) };
    if (value.empty())
    {
        return std::nullopt;
    }
    return std::string{ value };
}
#endif

[[nodiscard]] std::string osHostname()
{
#if defined(_WIN32)
    std::array<char, MAX_COMPUTERNAME_LENGTH + 1> buffer{};
    DWORD size{ static_cast<DWORD>(buffer.size()) };
    if (::GetComputerNameA(buffer.data(), &size) != 0 && size > 0U)
    {
        return std::string{ buffer.data(), size };
    }
#else
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), buffer.size() - 1U) == 0 && buffer[0] != '\0')
    {
        return std::string{ buffer.data() };
    }
#endif
    return "localhost";
}

// The token file lives in a shared directory, so only a private regular file of ours is accepted.
// Empty contents count as absent.
[[nodiscard]] vaultcache::platform::OwnerOnlyReadResult<std::string> readToken(const std::filesystem::path& path)
{
    auto stored{ vaultcache::platform::readOwnerOnlyFile(path, g_kMaxIdentityFileBytes) };
    if (const auto* raw{ std::get_if<std::string>(&stored) })
    {
        const auto value{ trim(*raw) };
        if (value.empty())
        {
            return vaultcache::platform::OwnerOnlyReadError::Missing;
        }
        return std::string{ value };
    }
    return stored;
}

[[nodiscard]] bool isMissing(const vaultcache::platform::OwnerOnlyReadResult<std::string>& r) noexcept
{
    const auto* error{ std::get_if<vaultcache::platform::OwnerOnlyReadError>(&r) };
    return error != nullptr && *error == vaultcache::platform::OwnerOnlyReadError::Missing;
}

} // namespace

IdentitySources defaultIdentitySources()
{
    IdentitySources sources{};
#if defined(_WIN32)
    sources.readRegistryMachineGuid = true;
#elif defined(__APPLE__)
    sources.probeHardwareCommand = true;
#else
    sources.machineIdFiles = { "/etc/machine-id", "/var/lib/dbus/machine-id" };
    sources.hardwareUuidFile = "/sys/class/dmi/id/product_uuid";
#endif

    std::error_code ec{};
    const auto tmp{ std::filesystem::temp_directory_path(ec) };
    if (!ec)
    {
        sources.tokenFile = tmp / std::filesystem::path{ std::string{ g_kMachineTokenFileName } };
    }
    return sources;
}

std::optional<std::string> parseIoregPlatformUuid(std::string_view output)
{
    const auto keyPos{ output.find(g_kIoregUuidKey) };
    if (keyPos == std::string_view::npos)
    {
        return std::nullopt;
    }
    const auto eqPos{ output.find('=', keyPos + g_kIoregUuidKey.size()) };
    if (eqPos == std::string_view::npos)
    {
        return std::nullopt;
    }
    const auto open{ output.find('"', eqPos + 1U) };
    if (open == std::string_view::npos)
    {
        return std::nullopt;
    }
    const auto close{ output.find('"', open + 1U) };
    if (close == std::string_view::npos)
    {
        return std::nullopt;
    }
    const auto value{ trim(output.substr(open + 1U, close - open - 1U)) };
    if (value.empty())
    {
        return std::nullopt;
    }
    return std::string{ value };
}

MachineIdentity::MachineIdentity(IdentitySources sources) : m_sources(std::move(sources))
{
}

std::string MachineIdentity::resolve()
{
    const std::scoped_lock lock{ m_mutex };

    if (m_resolved.has_value())
    {
        return *m_resolved;
    }
    if (auto id{ fromMachineId() }; id.has_value())
    {
        m_lastTier = IdentityTier::MachineId;
        m_resolved = std::move(id);
    }
    else if (auto uuid{ fromHardware() }; uuid.has_value())
    {
        m_lastTier = IdentityTier::HardwareUuid;
        m_resolved = std::move(uuid);
    }
    else
    {
        m_resolved = fromToken();
    }
    return *m_resolved;
}

std::optional<IdentityTier> MachineIdentity::lastTier() const
{
    const std::scoped_lock lock{ m_mutex };
    return m_lastTier;
}

std::optional<std::string> MachineIdentity::fromMachineId() const
{
#if defined(_WIN32)
    if (m_sources.readRegistryMachineGuid)
    {
        if (auto guid{ readRegistryMachineGuid() }; guid.has_value())
        {
            return guid;
        }
    }
#endif
    for (const auto& file : m_sources.machineIdFiles)
    {
        if (auto id{ readTrimmed(file) }; id.has_value())
        {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<std::string> MachineIdentity::fromHardware() const
{
    if (auto uuid{ readTrimmed(m_sources.hardwareUuidFile) }; uuid.has_value())
    {
        return uuid;
    }
    if (m_sources.probeHardwareCommand)
    {
        const auto output{ vaultcache::platform::runWithDeadline({ "ioreg", "-rd1", "-c", "IOPlatformExpertDevice" },
                                                                 m_sources.probeDeadline) };
        if (output.has_value())
        {
            return parseIoregPlatformUuid(*output);
        }
        vaultcache::log::debug(g_kTag, "hardware uuid probe produced no result");
    }
    return std::nullopt;
}

std::string MachineIdentity::hostname() const
{
    if (!m_sources.hostname.empty())
    {
        return m_sources.hostname;
    }
    return osHostname();
}

std::string MachineIdentity::fromToken()
{
    const std::string host{ hostname() };
    const auto& tokenFile{ m_sources.tokenFile };
    std::optional<std::string> fresh{};

    if (!tokenFile.empty())
    {
        auto stored{ readToken(tokenFile) };
        if (isMissing(stored))
        {
            fresh = vaultcache::security::secureRandomHex(g_kMachineTokenBytes);
            if (fresh.has_value() && vaultcache::platform::createOwnerOnlyFile(tokenFile, *fresh))
            {
                m_lastTier = IdentityTier::PersistedToken;
                return host + ":" + *fresh;
            }
            // Another process may have won the exclusive create.
            stored = readToken(tokenFile);
        }

        if (const auto* token{ std::get_if<std::string>(&stored) })
        {
            m_lastTier = IdentityTier::PersistedToken;
            return host + ":" + *token;
        }
        if (!isMissing(stored))
        {
            const std::string where{ tokenFile.string() };
            vaultcache::log::warn(
                g_kTag, "machine token file is not trusted, ignoring it",
                { { "path", where },
                  { "reason", vaultcache::platform::describe(std::get<vaultcache::platform::OwnerOnlyReadError>(stored)) } });
        }
    }

    if (!fresh.has_value())
    {
        fresh = vaultcache::security::secureRandomHex(g_kMachineTokenBytes);
    }
    if (!fresh.has_value())
    {
        vaultcache::log::warn(g_kTag, "random source unavailable, machine identity falls back to hostname only");
        fresh = std::string{};
    }
    const std::string where{ tokenFile.string() };
    vaultcache::log::warn(g_kTag, "cannot persist machine token, identity is not stable across restarts",
                          { { "path", where } });

    m_lastTier = IdentityTier::EphemeralToken;
    return host + ":" + *fresh;
}

} // namespace vaultcache::core
