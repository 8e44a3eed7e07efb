#include "vaultcache/platform/FilePermissionGuard.hpp"

#include "vaultcache/log/Log.hpp"
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <aclapi.h>
#include <memory>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace vaultcache::platform
{
namespace
{

constexpr std::string_view g_kTag{ "permissions" };

void logFailure(std::string_view what, const std::filesystem::path& path, std::string_view reason)
{
    const std::string p{ path.string() };
    vaultcache::log::warn(g_kTag, what, { { "path", p }, { "reason", reason } });
}

#if defined(_WIN32)

struct LocalFreeDeleter final
{
    void operator()(void* p) const noexcept
    {
        if (p != nullptr)
        {
            ::LocalFree(p);
        }
    }
};

struct HandleCloser final
{
    void operator()(HANDLE h) const noexcept
    {
        if (h != nullptr && h != INVALID_HANDLE_VALUE)
        {
            ::CloseHandle(h);
        }
    }
};

using ScopedHandle = std::unique_ptr<void, HandleCloser>;

[[nodiscard]] std::vector<BYTE> currentTokenInfo(TOKEN_INFORMATION_CLASS infoClass)
{
    HANDLE rawToken{ nullptr };
    if (!::OpenProcessToken(::GetCurrentProcess(), TOKEN_QUERY, &rawToken))
    {
        return {};
    }
    const ScopedHandle token{ rawToken };

    DWORD needed{ 0 };
    (void)::GetTokenInformation(rawToken, infoClass, nullptr, 0, &needed);
    if (needed == 0)
    {
        return {};
    }
    std::vector<BYTE> buffer(needed);
    if (!::GetTokenInformation(rawToken, infoClass, buffer.data(), needed, &needed))
    {
        return {};
    }
    return buffer;
}

[[nodiscard]] bool applyOwnerOnlyDacl(const std::filesystem::path& path, bool isDirectory, std::string& reason)
{
    const auto tokenInfo{ currentTokenInfo(TokenUser) };
    if (tokenInfo.empty())
    {
        reason = "current user sid unavailable";
        return false;
    }
    const auto* user{ reinterpret_cast<const TOKEN_USER*>(tokenInfo.data()) };

    EXPLICIT_ACCESS_W access{};
    access.grfAccessPermissions = GENERIC_ALL;
    access.grfAccessMode = SET_ACCESS;
    access.grfInheritance = isDirectory ? SUB_CONTAINERS_AND_OBJECTS_INHERIT : NO_INHERITANCE;
    access.Trustee.TrusteeForm = TRUSTEE_IS_SID;
    access.Trustee.TrusteeType = TRUSTEE_IS_USER;
    access.Trustee.ptstrName = reinterpret_cast<LPWSTR>(user->User.Sid);

    PACL rawAcl{ nullptr };
    if (::SetEntriesInAclW(1, &access, nullptr, &rawAcl) != ERROR_SUCCESS)
    {
        reason = "acl build failed";
        return false;
    }
    const std::unique_ptr<ACL, LocalFreeDeleter> acl{ rawAcl };

    std::wstring wpath{ path.wstring() };
    const DWORD rc{ ::SetNamedSecurityInfoW(wpath.data(), SE_FILE_OBJECT,
                                            DACL_SECURITY_INFORMATION | PROTECTED_DACL_SECURITY_INFORMATION, nullptr,
                                            nullptr, acl.get(), nullptr) };
    if (rc != ERROR_SUCCESS)
    {
        reason = "acl apply failed";
        return false;
    }
    return true;
}

// Owner must be the current user, or the token's default owner (an elevated administrator's files belong to
// BUILTIN\Administrators). Only the current user may hold an allow ACE.
// nullopt when the handle's security descriptor is private to the current user.
[[nodiscard]] std::optional<OwnerOnlyReadError> checkOwnerOnlySecurity(HANDLE handle)
{
    const auto userInfo{ currentTokenInfo(TokenUser) };
    const auto ownerInfo{ currentTokenInfo(TokenOwner) };
    if (userInfo.empty())
    {
        return OwnerOnlyReadError::Unreadable;
    }
    const PSID user{ reinterpret_cast<const TOKEN_USER*>(userInfo.data())->User.Sid };

    PSID owner{ nullptr };
    PACL dacl{ nullptr };
    PSECURITY_DESCRIPTOR rawSd{ nullptr };
    if (::GetSecurityInfo(handle, SE_FILE_OBJECT, OWNER_SECURITY_INFORMATION | DACL_SECURITY_INFORMATION, &owner,
                          nullptr, &dacl, nullptr, &rawSd) != ERROR_SUCCESS)
    {
        return OwnerOnlyReadError::Unreadable;
    }
    const std::unique_ptr<void, LocalFreeDeleter> sd{ rawSd };

    const bool ownedByUser{ owner != nullptr && ::EqualSid(owner, user) != FALSE };
    const bool ownedByDefaultOwner{ owner != nullptr && !ownerInfo.empty() &&
                                    ::EqualSid(owner, reinterpret_cast<const TOKEN_OWNER*>(ownerInfo.data())->Owner) !=
                                        FALSE };
    if (!ownedByUser && !ownedByDefaultOwner)
    {
        return OwnerOnlyReadError::ForeignOwner;
    }

    // A null DACL grants everyone full access.
    if (dacl == nullptr)
    {
        return OwnerOnlyReadError::AccessibleToOthers;
    }
    for (DWORD i{ 0 }; i < dacl->AceCount; ++i)
    {
        void* rawAce{ nullptr };
        if (!::GetAce(dacl, i, &rawAce))
        {
            return OwnerOnlyReadError::Unreadable;
        }
        const auto* header{ static_cast<const ACE_HEADER*>(rawAce) };
        if (header->AceType == ACCESS_DENIED_ACE_TYPE)
        {
            continue;
        }
        if (header->AceType != ACCESS_ALLOWED_ACE_TYPE)
        {
            return OwnerOnlyReadError::AccessibleToOthers;
        }
        auto* allowed{ static_cast<ACCESS_ALLOWED_ACE*>(rawAce) };
        if (::EqualSid(reinterpret_cast<PSID>(&allowed->SidStart), user) == FALSE)
        {
            return OwnerOnlyReadError::AccessibleToOthers;
        }
    }
    return std::nullopt;
}

#else

class FileDescriptor final
{
public:
    explicit FileDescriptor(int fd) noexcept : m_fd{ fd }
    {
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    FileDescriptor& operator=(FileDescriptor&&) = delete;
    ~FileDescriptor()
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

private:
    int m_fd;
};

#endif

} // namespace

bool restrictToOwner(const std::filesystem::path& path) noexcept
{
    try
    {
        std::error_code ec{};
        const bool isDirectory{ std::filesystem::is_directory(path, ec) };
        if (ec)
        {
            logFailure("cannot stat path", path, ec.message());
            return false;
        }

#if defined(_WIN32)
        std::string reason{};
        if (!applyOwnerOnlyDacl(path, isDirectory, reason))
        {
            logFailure("cannot restrict path to owner", path, reason);
            return false;
        }
        return true;
#else
        const auto perms{ isDirectory ? std::filesystem::perms::owner_all
                                      : (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write) };
        std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            logFailure("cannot restrict path to owner", path, ec.message());
            return false;
        }
        return true;
#endif
    }
    catch (const std::exception& e)
    {
        logFailure("cannot restrict path to owner", path, e.what());
        return false;
    }
}

bool hardenStateFile(const std::filesystem::path& file) noexcept
{
    try
    {
        bool ok{ true };
        std::error_code ec{};

        const auto parent{ file.parent_path() };
        std::vector<std::filesystem::path> missingLevels{};
        for (auto level{ parent }; !level.empty(); level = level.parent_path())
        {
            ec.clear();
            if (std::filesystem::exists(level, ec) || ec)
            {
                break;
            }
            missingLevels.push_back(level);
            if (level == level.parent_path())
            {
                break;
            }
        }

        if (!missingLevels.empty())
        {
            ec.clear();
            (void)std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                logFailure("cannot create state directory", parent, ec.message());
                return false;
            }
            for (const auto& level : missingLevels)
            {
                if (!restrictToOwner(level))
                {
                    ok = false;
                }
            }
        }

        ec.clear();
        if (std::filesystem::exists(file, ec) && !ec)
        {
            if (!restrictToOwner(file))
            {
                ok = false;
            }
        }
        return ok;
    }
    catch (const std::exception& e)
    {
        logFailure("cannot harden state file", file, e.what());
        return false;
    }
}

bool createOwnerOnlyFile(const std::filesystem::path& file, std::string_view contents) noexcept
{
#if defined(_WIN32)
    try
    {
        const std::wstring wpath{ file.wstring() };
        ScopedHandle handle{ ::CreateFileW(wpath.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                                           FILE_ATTRIBUTE_NORMAL, nullptr) };
        if (handle.get() == INVALID_HANDLE_VALUE)
        {
            handle.release();
            return false;
        }

        std::string reason{};
        if (!applyOwnerOnlyDacl(file, false, reason))
        {
            handle.reset();
            std::error_code ec{};
            std::filesystem::remove(file, ec);
            logFailure("cannot restrict new file to owner", file, reason);
            return false;
        }

        DWORD written{ 0 };
        const bool wrote{ ::WriteFile(handle.get(), contents.data(), static_cast<DWORD>(contents.size()), &written,
                                      nullptr) != 0 &&
                          written == contents.size() };
        handle.reset();
        if (!wrote)
        {
            std::error_code ec{};
            std::filesystem::remove(file, ec);
            logFailure("cannot write new file", file, "short write");
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        logFailure("cannot create owner-only file", file, e.what());
        return false;
    }
#else
    const std::string path{ file.string() };
    const int fd{ ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR) };
    if (fd < 0)
    {
        if (errno != EEXIST)
        {
            logFailure("cannot create owner-only file", file, std::strerror(errno));
        }
        return false;
    }

    // The umask can only remove bits; pin the mode regardless.
    int failure{ 0 };
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0)
    {
        failure = errno;
    }
    const char* cursor{ contents.data() };
    std::size_t remaining{ contents.size() };
    while (failure == 0 && remaining > 0U)
    {
        const ssize_t n{ ::write(fd, cursor, remaining) };
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0)
        {
            failure = (n < 0) ? errno : EIO;
            break;
        }
        cursor += n;
        remaining -= static_cast<std::size_t>(n);
    }
    if (failure == 0 && ::fsync(fd) != 0)
    {
        failure = errno;
    }
    if (::close(fd) != 0 && failure == 0)
    {
        failure = errno;
    }
    const bool ok{ failure == 0 };
    if (!ok)
    {
        (void)::unlink(path.c_str());
        logFailure("cannot write owner-only file", file, std::strerror(failure));
    }
    return ok;
#endif
}

OwnerOnlyReadResult<std::string> readOwnerOnlyFile(const std::filesystem::path& file, std::size_t maxBytes) noexcept
{
    try
    {
#if defined(_WIN32)
        const std::wstring wpath{ file.wstring() };
        ScopedHandle handle{ ::CreateFileW(wpath.c_str(), GENERIC_READ | READ_CONTROL, FILE_SHARE_READ, nullptr,
                                           OPEN_EXISTING, FILE_FLAG_OPEN_REPARSE_POINT, nullptr) };
        if (handle.get() == INVALID_HANDLE_VALUE)
        {
            handle.release();
            const DWORD err{ ::GetLastError() };
            return (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) ? OwnerOnlyReadError::Missing
                                                                                : OwnerOnlyReadError::Unreadable;
        }

        BY_HANDLE_FILE_INFORMATION info{};
        if (!::GetFileInformationByHandle(handle.get(), &info))
        {
            return OwnerOnlyReadError::Unreadable;
        }
        if ((info.dwFileAttributes & (FILE_ATTRIBUTE_REPARSE_POINT | FILE_ATTRIBUTE_DIRECTORY)) != 0U)
        {
            return OwnerOnlyReadError::NotRegularFile;
        }
        if (const auto rejected{ checkOwnerOnlySecurity(handle.get()) }; rejected.has_value())
        {
            return *rejected;
        }

        std::string out(maxBytes, '\0');
        std::size_t total{ 0U };
        while (total < maxBytes)
        {
            DWORD got{ 0 };
            if (!::ReadFile(handle.get(), out.data() + total, static_cast<DWORD>(maxBytes - total), &got, nullptr))
            {
                return OwnerOnlyReadError::Unreadable;
            }
            if (got == 0U)
            {
                break;
            }
            total += got;
        }
        out.resize(total);
        return out;
#else
        const std::string path{ file.string() };
        const FileDescriptor fd{ ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK) };
        if (fd.get() < 0)
        {
            if (errno == ENOENT)
            {
                return OwnerOnlyReadError::Missing;
            }
            return (errno == ELOOP) ? OwnerOnlyReadError::NotRegularFile : OwnerOnlyReadError::Unreadable;
        }

        struct stat st
        {
        };
        if (::fstat(fd.get(), &st) != 0)
        {
            return OwnerOnlyReadError::Unreadable;
        }
        if (!S_ISREG(st.st_mode))
        {
            return OwnerOnlyReadError::NotRegularFile;
        }
        if (st.st_uid != ::geteuid())
        {
            return OwnerOnlyReadError::ForeignOwner;
        }
        if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0)
        {
            return OwnerOnlyReadError::AccessibleToOthers;
        }

        std::string out(maxBytes, '\0');
        std::size_t total{ 0U };
        while (total < maxBytes)
        {
            const ssize_t n{ ::read(fd.get(), out.data() + total, maxBytes - total) };
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            if (n < 0)
            {
                return OwnerOnlyReadError::Unreadable;
            }
            if (n == 0)
            {
                break;
            }
            total += static_cast<std::size_t>(n);
        }
        out.resize(total);
        return out;
#endif
    }
    catch (const std::exception& e)
    {
        logFailure("cannot read owner-only file", file, e.what());
        return OwnerOnlyReadError::Unreadable;
    }
}

std::string_view describe(OwnerOnlyReadError error) noexcept
{
    switch (error)
    {
    case OwnerOnlyReadError::Missing:
        return "file does not exist";
    case OwnerOnlyReadError::NotRegularFile:
        return "not a regular file (symlink, directory or device)";
    case OwnerOnlyReadError::ForeignOwner:
        return "owned by another user";
    case OwnerOnlyReadError::AccessibleToOthers:
        return "accessible to other users";
    case OwnerOnlyReadError::Unreadable:
        return "cannot be read";
    }
    return "unknown";
}

} // namespace vaultcache::platform
