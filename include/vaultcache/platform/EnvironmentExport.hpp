#ifndef INCLUDE_VAULTCACHE_PLATFORM_ENVIRONMENTEXPORT_HPP
#define INCLUDE_VAULTCACHE_PLATFORM_ENVIRONMENTEXPORT_HPP

#include "vaultcache/core/SecretMap.hpp"
#include <cstddef>

namespace vaultcache::platform
{

// Sets every secret as a process environment variable. Existing variables are kept unless `overrideExisting`.
// Names that cannot be environment variable names (empty, containing '=' or NUL) are skipped.
// Returns the number of variables written.
std::size_t exportToEnvironment(const vaultcache::core::SecretMap& secrets, bool overrideExisting);

} // namespace vaultcache::platform

#endif // INCLUDE_VAULTCACHE_PLATFORM_ENVIRONMENTEXPORT_HPP
