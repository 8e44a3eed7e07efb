#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

#include "test_utils/TestUtils.hpp"
#include "vaultcache/log/Log.hpp"
#include "vaultcache/platform/FilePermissionGuard.hpp"

#if defined(__linux__)
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/resource.h>
#endif

namespace
{

[[nodiscard]] std::filesystem::perms permsOf(const std::filesystem::path& p)
{
    return std::filesystem::status(p).permissions() & std::filesystem::perms::mask;
}

constexpr auto g_kOwnerRw{ std::filesystem::perms::owner_read | std::filesystem::perms::owner_write };

} // namespace

TEST(FilePermissionGuard, CreateOwnerOnlyFileWritesContents)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "token" };

    ASSERT_TRUE(vaultcache::platform::createOwnerOnlyFile(file, "abc123"));
    EXPECT_EQ(vaultcache::test_utils::readTextFile(file), "abc123");
#if !defined(_WIN32)
    EXPECT_EQ(permsOf(file), g_kOwnerRw);
#endif
}

TEST(FilePermissionGuard, CreateOwnerOnlyFileRefusesExistingFile)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "token" };
    vaultcache::test_utils::writeTextFile(file, "first");

    EXPECT_FALSE(vaultcache::platform::createOwnerOnlyFile(file, "second"));
    EXPECT_EQ(vaultcache::test_utils::readTextFile(file), "first");
}

TEST(FilePermissionGuard, ReadOwnerOnlyFileReturnsPrivateContents)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "token" };
    ASSERT_TRUE(vaultcache::platform::createOwnerOnlyFile(file, "abc123"));

    const auto read{ vaultcache::platform::readOwnerOnlyFile(file, 4096U) };
    ASSERT_TRUE(std::holds_alternative<std::string>(read));
    EXPECT_EQ(std::get<std::string>(read), "abc123");

    const auto capped{ vaultcache::platform::readOwnerOnlyFile(file, 3U) };
    ASSERT_TRUE(std::holds_alternative<std::string>(capped));
    EXPECT_EQ(std::get<std::string>(capped), "abc");
}

TEST(FilePermissionGuard, ReadOwnerOnlyFileReportsMissing)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());

    const auto read{ vaultcache::platform::readOwnerOnlyFile(dir.path() / "absent", 4096U) };
    ASSERT_TRUE(std::holds_alternative<vaultcache::platform::OwnerOnlyReadError>(read));
    EXPECT_EQ(std::get<vaultcache::platform::OwnerOnlyReadError>(read), vaultcache::platform::OwnerOnlyReadError::Missing);
}

#if !defined(_WIN32)

TEST(FilePermissionGuard, ReadOwnerOnlyFileRejectsSymlink)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto target{ dir.path() / "target" };
    ASSERT_TRUE(vaultcache::platform::createOwnerOnlyFile(target, "abc123"));
    std::filesystem::create_symlink(target, dir.path() / "link");

    const auto read{ vaultcache::platform::readOwnerOnlyFile(dir.path() / "link", 4096U) };
    ASSERT_TRUE(std::holds_alternative<vaultcache::platform::OwnerOnlyReadError>(read));
    EXPECT_EQ(std::get<vaultcache::platform::OwnerOnlyReadError>(read),
              vaultcache::platform::OwnerOnlyReadError::NotRegularFile);
}

TEST(FilePermissionGuard, ReadOwnerOnlyFileRejectsGroupOrOtherAccess)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "token" };
    vaultcache::test_utils::writeTextFile(file, "abc123");

    for (const auto extra : { std::filesystem::perms::group_read, std::filesystem::perms::others_read,
                              std::filesystem::perms::others_write })
    {
        std::filesystem::permissions(file, g_kOwnerRw | extra, std::filesystem::perm_options::replace);
        const auto read{ vaultcache::platform::readOwnerOnlyFile(file, 4096U) };
        ASSERT_TRUE(std::holds_alternative<vaultcache::platform::OwnerOnlyReadError>(read));
        EXPECT_EQ(std::get<vaultcache::platform::OwnerOnlyReadError>(read),
                  vaultcache::platform::OwnerOnlyReadError::AccessibleToOthers);
    }
}

TEST(FilePermissionGuard, ReadOwnerOnlyFileRejectsDirectory)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto sub{ dir.path() / "sub" };
    std::filesystem::create_directory(sub);
    std::filesystem::permissions(sub, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);

    const auto read{ vaultcache::platform::readOwnerOnlyFile(sub, 4096U) };
    ASSERT_TRUE(std::holds_alternative<vaultcache::platform::OwnerOnlyReadError>(read));
    EXPECT_EQ(std::get<vaultcache::platform::OwnerOnlyReadError>(read),
              vaultcache::platform::OwnerOnlyReadError::NotRegularFile);
}

TEST(FilePermissionGuard, RestrictToOwnerTightensLooseFile)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "state.json" };
    vaultcache::test_utils::writeTextFile(file, "{}");
    std::filesystem::permissions(file, std::filesystem::perms::all, std::filesystem::perm_options::replace);

    ASSERT_TRUE(vaultcache::platform::restrictToOwner(file));
    EXPECT_EQ(permsOf(file), g_kOwnerRw);
}

TEST(FilePermissionGuard, HardenCreatesPrivateParent)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto parent{ dir.path() / "state" };
    const auto file{ parent / "state.json" };

    ASSERT_TRUE(vaultcache::platform::hardenStateFile(file));
    ASSERT_TRUE(std::filesystem::is_directory(parent));
    EXPECT_EQ(permsOf(parent), std::filesystem::perms::owner_all);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST(FilePermissionGuard, HardenRestrictsEveryCreatedLevel)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto top{ dir.path() / "a" };
    const auto file{ top / "b" / "c" / "state.json" };

    ASSERT_TRUE(vaultcache::platform::hardenStateFile(file));
    EXPECT_EQ(permsOf(top), std::filesystem::perms::owner_all);
    EXPECT_EQ(permsOf(top / "b"), std::filesystem::perms::owner_all);
    EXPECT_EQ(permsOf(top / "b" / "c"), std::filesystem::perms::owner_all);
}

TEST(FilePermissionGuard, HardenLeavesExistingParentAlone)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto parent{ dir.path() / "shared" };
    std::filesystem::create_directory(parent);
    constexpr auto kShared{ std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                            std::filesystem::perms::group_exec };
    std::filesystem::permissions(parent, kShared, std::filesystem::perm_options::replace);
    const auto file{ parent / "state.json" };
    vaultcache::test_utils::writeTextFile(file, "{}");
    std::filesystem::permissions(file, std::filesystem::perms::owner_all | std::filesystem::perms::others_read,
                                 std::filesystem::perm_options::replace);

    ASSERT_TRUE(vaultcache::platform::hardenStateFile(file));
    EXPECT_EQ(permsOf(parent), kShared);
    EXPECT_EQ(permsOf(file), g_kOwnerRw);
}

#endif

#if defined(__linux__)

// A file-size limit makes write(2) fail with EFBIG after the first bytes; close(2) then succeeds and must not
// overwrite the reported reason.
TEST(FilePermissionGuard, FailedWriteReportsItsOwnErrorAndRemovesFile)
{
    const vaultcache::test_utils::TempDir dir{ "perm_" };
    ASSERT_TRUE(dir.valid());
    const auto file{ dir.path() / "token" };

    std::string logged{};
    vaultcache::log::setSink([&logged](vaultcache::log::Level, std::string_view line) { logged.append(line); });

    struct rlimit previous
    {
    };
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &previous), 0);
    const auto previousHandler{ ::signal(SIGXFSZ, SIG_IGN) };
    struct rlimit tiny
    {
        previous
    };
    tiny.rlim_cur = 4U;
    const bool limited{ ::setrlimit(RLIMIT_FSIZE, &tiny) == 0 };
    const bool created{ limited && vaultcache::platform::createOwnerOnlyFile(file, std::string(64U, 'x')) };
    (void)::setrlimit(RLIMIT_FSIZE, &previous);
    (void)::signal(SIGXFSZ, previousHandler);
    vaultcache::log::setSink({});

    ASSERT_TRUE(limited);
    EXPECT_FALSE(created);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_NE(logged.find(std::strerror(EFBIG)), std::string::npos) << logged;
}

#endif
