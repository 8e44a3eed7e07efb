#ifndef INCLUDE_VAULTCACHE_CORE_MACHINEIDENTITY_HPP
#define INCLUDE_VAULTCACHE_CORE_MACHINEIDENTITY_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcache::core
{

inline constexpr std::string_view g_kMachineTokenFileName{ "vaultcache_machine_token" };
constexpr std::size_t g_kMachineTokenBytes{ 32U };

// Where each identity tier reads from. Defaults come from defaultIdentitySources().
struct IdentitySources final
{
    // Tier 1, tried in order.
    std::vector<std::filesystem::path> machineIdFiles;
    // Tier 2 (Linux): a hardware UUID file.
    std::filesystem::path hardwareUuidFile;
    // Tier 2 (macOS): run `ioreg` with a deadline.
    bool probeHardwareCommand{ false };
    std::chrono::milliseconds probeDeadline{ 2000 };
    // Tier 3. Empty hostname means "ask the OS".
    std::filesystem::path tokenFile;
    std::string hostname;
    // Windows only: read HKLM\SOFTWARE\Microsoft\Cryptography\MachineGuid as tier 1.
    bool readRegistryMachineGuid{ false };
};

[[nodiscard]] IdentitySources defaultIdentitySources();

enum class IdentityTier : std::uint8_t
{
    MachineId,
    HardwareUuid,
    PersistedToken,
    EphemeralToken,
};

class IMachineIdentity
{
public:
    IMachineIdentity() = default;
    IMachineIdentity(const IMachineIdentity&) = delete;
    IMachineIdentity& operator=(const IMachineIdentity&) = delete;
    IMachineIdentity(IMachineIdentity&&) = delete;
    IMachineIdentity& operator=(IMachineIdentity&&) = delete;
    virtual ~IMachineIdentity() = default;

    // Stable per-machine string. Never fails.
    [[nodiscard]] virtual std::string resolve() = 0;
};

class MachineIdentity final : public IMachineIdentity
{
public:
    explicit MachineIdentity(IdentitySources sources = defaultIdentitySources());

    // The first call walks the tiers; later calls return the same value without touching the sources again.
    [[nodiscard]] std::string resolve() override;

    // Tier that produced the most recent resolve(); nullopt before the first call.
    [[nodiscard]] std::optional<IdentityTier> lastTier() const;

private:
    [[nodiscard]] std::optional<std::string> fromMachineId() const;
    [[nodiscard]] std::optional<std::string> fromHardware() const;
    [[nodiscard]] std::string fromToken();
    [[nodiscard]] std::string hostname() const;

    IdentitySources m_sources;
    mutable std::mutex m_mutex;
    std::optional<std::string> m_resolved;
    std::optional<IdentityTier> m_lastTier;
};

// Extracts the IOPlatformUUID value from `ioreg -rd1 -c IOPlatformExpertDevice` output.
[[nodiscard]] std::optional<std::string> parseIoregPlatformUuid(std::string_view output);

} // namespace vaultcache::core

#endif // INCLUDE_VAULTCACHE_CORE_MACHINEIDENTITY_HPP
