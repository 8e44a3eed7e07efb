#include "ConsoleUtils.hpp"

#include "vaultcache/log/Log.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <process.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace vaultcache::ui::cli
{

void lockProcessMemory() noexcept
{
#if defined(_WIN32)
    // TODO: VirtualLock the SecureString pages.
#else
    if (::mlockall(MCL_CURRENT) != 0)
    {
        vaultcache::log::debug("cli", "mlockall unavailable");
    }
    struct rlimit lim
    {
        0, 0
    };
    if (::setrlimit(RLIMIT_CORE, &lim) != 0)
    {
        vaultcache::log::debug("cli", "cannot disable core dumps");
    }
#endif
}

int execProcess(const std::vector<std::string>& command)
{
    if (command.empty())
    {
        return -1;
    }

    std::vector<char*> argv{};
    argv.reserve(command.size() + 1U);
    for (const auto& arg : command)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

#if defined(_WIN32)
    return static_cast<int>(::_execvp(argv[0], argv.data()));
#else
    return ::execvp(argv[0], argv.data());
#endif
}

} // namespace vaultcache::ui::cli
