#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "vaultcache/platform/Subprocess.hpp"

using namespace std::chrono_literals;

#if !defined(_WIN32)

TEST(Subprocess, CapturesStdoutOnSuccess)
{
    const auto out{ vaultcache::platform::runWithDeadline({ "/bin/sh", "-c", "echo hello" }, 2000ms) };
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "hello\n");
}

TEST(Subprocess, NonZeroExitYieldsNothing)
{
    EXPECT_FALSE(vaultcache::platform::runWithDeadline({ "/bin/sh", "-c", "echo partial; exit 3" }, 2000ms));
}

TEST(Subprocess, MissingProgramYieldsNothing)
{
    EXPECT_FALSE(vaultcache::platform::runWithDeadline({ "vaultcache-no-such-program" }, 2000ms));
}

TEST(Subprocess, EmptyArgvYieldsNothing)
{
    EXPECT_FALSE(vaultcache::platform::runWithDeadline({}, 2000ms));
}

TEST(Subprocess, HungChildIsKilledAtDeadline)
{
    const auto start{ std::chrono::steady_clock::now() };
    const auto out{ vaultcache::platform::runWithDeadline({ "/bin/sh", "-c", "exec sleep 30" }, 200ms) };
    const auto elapsed{ std::chrono::steady_clock::now() - start };

    EXPECT_FALSE(out.has_value());
    EXPECT_LT(elapsed, 10s);
}

TEST(Subprocess, OutputIsCapped)
{
    const auto out{ vaultcache::platform::runWithDeadline(
        { "/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' 'a'" }, 5000ms) };
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->size(), vaultcache::platform::g_kMaxSubprocessOutputBytes);
}

#endif
