#ifndef INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_PLATFORMCREDENTIALSTORES_HPP
#define INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_PLATFORMCREDENTIALSTORES_HPP

#include "vaultcache/platform/ICredentialStore.hpp"
#include <memory>

namespace vaultcache::platform
{

#if defined(VAULTCACHE_HAVE_LIBSECRET)
// nullptr when no Secret Service answers the probe lookup.
[[nodiscard]] std::unique_ptr<ICredentialStore> makeSecretServiceCredentialStore();
#endif

#if defined(_WIN32)
[[nodiscard]] std::unique_ptr<ICredentialStore> makeWindowsCredentialStore();
#endif

} // namespace vaultcache::platform

#endif // INTERNAL_INCLUDE_VAULTCACHE_PLATFORM_PLATFORMCREDENTIALSTORES_HPP
