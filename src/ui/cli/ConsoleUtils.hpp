#ifndef VAULTCACHE_UI_CLI_CONSOLEUTILS_HPP
#define VAULTCACHE_UI_CLI_CONSOLEUTILS_HPP

#include <string>
#include <vector>

namespace vaultcache::ui::cli
{

// Locks process memory and disables core dumps (best effort).
void lockProcessMemory() noexcept;

// Replaces the current process with `command` (PATH lookup). Returns only on failure.
[[nodiscard]] int execProcess(const std::vector<std::string>& command);

} // namespace vaultcache::ui::cli

#endif // VAULTCACHE_UI_CLI_CONSOLEUTILS_HPP
