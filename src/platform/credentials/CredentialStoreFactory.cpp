#include "vaultcache/platform/credentials/CredentialStoreFactory.hpp"

#include "vaultcache/log/Log.hpp"
#include "vaultcache/platform/PlatformCredentialStores.hpp"

namespace vaultcache::platform
{

std::unique_ptr<ICredentialStore> makePlatformCredentialStore()
{
    std::unique_ptr<ICredentialStore> store{};
#if defined(_WIN32)
    store = makeWindowsCredentialStore();
#elif defined(VAULTCACHE_HAVE_LIBSECRET)
    store = makeSecretServiceCredentialStore();
#endif
    if (store)
    {
        return store;
    }
    vaultcache::log::debug("credentials", "no os credential store, bootstrap values come from the environment only");
    return makeNullCredentialStore();
}

} // namespace vaultcache::platform
