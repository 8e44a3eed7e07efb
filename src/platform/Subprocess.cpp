#include "vaultcache/platform/Subprocess.hpp"

#include "vaultcache/log/Log.hpp"

#if defined(_WIN32)

namespace vaultcache::platform
{

std::optional<std::string> runWithDeadline([[maybe_unused]] const std::vector<std::string>& argv,
                                           [[maybe_unused]] std::chrono::milliseconds deadline)
{
    // No probe on Windows needs a child process.
    return std::nullopt;
}

} // namespace vaultcache::platform

#else

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace vaultcache::platform
{
namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::string_view g_kTag{ "subprocess" };
constexpr std::chrono::milliseconds g_kReapPollInterval{ 10 };
constexpr int g_kExecFailedStatus{ 127 };

class FdCloser final
{
public:
    explicit FdCloser(int fd) noexcept : m_fd(fd)
    {
    }
    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;
    FdCloser(FdCloser&&) = delete;
    FdCloser& operator=(FdCloser&&) = delete;
    ~FdCloser()
    {
        reset();
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    void reset() noexcept
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd{ -1 };
};

[[nodiscard]] int remainingMillis(Clock::time_point until) noexcept
{
    const auto left{ std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now()) };
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void killAndReap(pid_t pid) noexcept
{
    (void)::kill(pid, SIGKILL);
    int status{ 0 };
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
}

// Waits for the child until `until`; returns its exit status or nullopt (child killed) on timeout.
[[nodiscard]] std::optional<int> waitUntil(pid_t pid, Clock::time_point until) noexcept
{
    for (;;)
    {
        int status{ 0 };
        const pid_t rc{ ::waitpid(pid, &status, WNOHANG) };
        if (rc == pid)
        {
            return status;
        }
        if (rc < 0 && errno != EINTR)
        {
            return std::nullopt;
        }
        if (Clock::now() >= until)
        {
            killAndReap(pid);
            return std::nullopt;
        }
        std::this_thread::sleep_for(g_kReapPollInterval);
    }
}

} // namespace

std::optional<std::string> runWithDeadline(const std::vector<std::string>& argv, std::chrono::milliseconds deadline)
{
    if (argv.empty())
    {
        return std::nullopt;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> args{};
    args.reserve(argv.size() + 1U);
    for (const auto& a : argv)
    {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    std::array<int, 2> fds{ -1, -1 };
    if (::pipe(fds.data()) != 0)
    {
        vaultcache::log::debug(g_kTag, "pipe failed");
        return std::nullopt;
    }
    FdCloser readEnd{ fds[0] };
    FdCloser writeEnd{ fds[1] };
    (void)::fcntl(readEnd.get(), F_SETFD, FD_CLOEXEC);

    const int devNull{ ::open("/dev/null", O_RDWR | O_CLOEXEC) };
    FdCloser nullFd{ devNull };

    const auto until{ Clock::now() + deadline };
    const pid_t pid{ ::fork() };
    if (pid < 0)
    {
        vaultcache::log::debug(g_kTag, "fork failed");
        return std::nullopt;
    }
    if (pid == 0)
    {
        if (devNull >= 0)
        {
            (void)::dup2(devNull, STDIN_FILENO);
            (void)::dup2(devNull, STDERR_FILENO);
        }
        if (::dup2(writeEnd.get(), STDOUT_FILENO) < 0)
        {
            ::_exit(g_kExecFailedStatus);
        }
        ::execvp(args[0], args.data());
        ::_exit(g_kExecFailedStatus);
    }

    writeEnd.reset();
    nullFd.reset();

    std::string output{};
    std::array<char, 4096> chunk{};
    bool timedOut{ false };
    for (;;)
    {
        const int waitMs{ remainingMillis(until) };
        if (waitMs == 0)
        {
            timedOut = true;
            break;
        }
        pollfd pfd{ readEnd.get(), POLLIN, 0 };
        const int ready{ ::poll(&pfd, 1, waitMs) };
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (ready == 0)
        {
            timedOut = true;
            break;
        }
        const ssize_t n{ ::read(readEnd.get(), chunk.data(), chunk.size()) };
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0)
        {
            break;
        }
        if (output.size() < g_kMaxSubprocessOutputBytes)
        {
            const auto room{ g_kMaxSubprocessOutputBytes - output.size() };
            output.append(chunk.data(), std::min(room, static_cast<std::size_t>(n)));
        }
    }
    readEnd.reset();

    if (timedOut)
    {
        killAndReap(pid);
        vaultcache::log::debug(g_kTag, "child killed at deadline", { { "program", argv.front() } });
        return std::nullopt;
    }

    const auto status{ waitUntil(pid, until) };
    if (!status.has_value())
    {
        vaultcache::log::debug(g_kTag, "child killed at deadline", { { "program", argv.front() } });
        return std::nullopt;
    }
    if (!WIFEXITED(*status) || WEXITSTATUS(*status) != 0)
    {
        return std::nullopt;
    }
    return output;
}

} // namespace vaultcache::platform

#endif
