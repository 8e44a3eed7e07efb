#include <gtest/gtest.h>

#include "vaultcache/platform/ICredentialStore.hpp"
#include "vaultcache/platform/credentials/CredentialStoreFactory.hpp"

TEST(CredentialStore, OrganizationServiceIsPrefixed)
{
    EXPECT_EQ(vaultcache::platform::organizationService("org-1"), "vaultcache.org-1");
}

TEST(CredentialStore, NullStoreIsInert)
{
    const auto store{ vaultcache::platform::makeNullCredentialStore() };
    ASSERT_NE(store, nullptr);

    EXPECT_FALSE(store->available());
    EXPECT_FALSE(store->set(vaultcache::platform::g_kCredentialServicePrefix,
                            vaultcache::platform::g_kOrganizationIdKey, "org-1"));
    EXPECT_FALSE(store->get(vaultcache::platform::g_kCredentialServicePrefix, vaultcache::platform::g_kOrganizationIdKey)
                     .has_value());
    EXPECT_FALSE(store->remove(vaultcache::platform::g_kCredentialServicePrefix,
                               vaultcache::platform::g_kOrganizationIdKey));
}

TEST(CredentialStore, PlatformStoreAlwaysConstructs)
{
    const auto store{ vaultcache::platform::makePlatformCredentialStore() };
    ASSERT_NE(store, nullptr);
    if (!store->available())
    {
        EXPECT_FALSE(store->get("vaultcache.test", "missing").has_value());
    }
}
