#ifndef ADAPTERS_INCLUDE_VAULTCACHE_PLATFORM_CREDENTIALS_CREDENTIALSTOREFACTORY_HPP
#define ADAPTERS_INCLUDE_VAULTCACHE_PLATFORM_CREDENTIALS_CREDENTIALSTOREFACTORY_HPP

#include "vaultcache/platform/ICredentialStore.hpp"
#include <memory>

namespace vaultcache::platform
{

// Secret Service (libsecret) on Linux, Credential Manager on Windows. Availability is probed once; when the
// facility is missing the null store is returned.
[[nodiscard]] std::unique_ptr<ICredentialStore> makePlatformCredentialStore();

// Reads nothing, stores nothing.
[[nodiscard]] std::unique_ptr<ICredentialStore> makeNullCredentialStore();

} // namespace vaultcache::platform

#endif // ADAPTERS_INCLUDE_VAULTCACHE_PLATFORM_CREDENTIALS_CREDENTIALSTOREFACTORY_HPP
