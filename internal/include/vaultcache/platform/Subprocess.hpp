#ifndef INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_SUBPROCESS_HPP
#define INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_SUBPROCESS_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vaultcache::platform
{

constexpr std::size_t g_kMaxSubprocessOutputBytes{ 64U * 1024U };

// Runs argv[0] (PATH lookup) with stdin/stderr on the null device and captures stdout.
// Returns the captured output only if the child exits with status 0 before `deadline`; a child still running at
// the deadline is killed and reaped. Output beyond g_kMaxSubprocessOutputBytes is discarded.
[[nodiscard]] std::optional<std::string> runWithDeadline(const std::vector<std::string>& argv,
                                                         std::chrono::milliseconds deadline);

} // namespace vaultcache::platform

#endif // INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_SUBPROCESS_HPP
