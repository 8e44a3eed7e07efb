#ifndef INCLUDE_VAULTCACHE_CORE_SECRETMAP_HPP
#define INCLUDE_VAULTCACHE_CORE_SECRETMAP_HPP

#include "vaultcache/security/SecureMemory.hpp"
#include <functional>
#include <map>
#include <string>

namespace vaultcache::core
{

// Secret name -> secret value. Values are wiped when the map (or any copy of it) is destroyed.
using SecretMap = std::map<std::string, vaultcache::security::SecureString, std::less<>>;

} // namespace vaultcache::core

#endif // INCLUDE_VAULTCACHE_CORE_SECRETMAP_HPP
