#ifndef INCLUDE_VAULTCACHE_PLATFORM_FILEPERMISSIONGUARD_HPP
#define INCLUDE_VAULTCACHE_PLATFORM_FILEPERMISSIONGUARD_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace vaultcache::platform
{

// Hardens a durable authentication-state file:
//  - creates missing directories up to the parent and restricts every level it created to the owner (rwx);
//    directories that already existed are left alone;
//  - restricts the file to owner read/write when it exists.
// Returns false when any step failed. Failures are logged, never thrown; the file stays usable.
[[nodiscard]] bool hardenStateFile(const std::filesystem::path& file) noexcept;

// Restricts an existing path to the current user: 0600 for files, 0700 for directories on POSIX,
// a protected owner-only DACL on Windows.
[[nodiscard]] bool restrictToOwner(const std::filesystem::path& path) noexcept;

// Creates `file` exclusively (fails if it exists) with owner-only permissions applied at creation time and
// writes `contents`. A partially written file is removed.
[[nodiscard]] bool createOwnerOnlyFile(const std::filesystem::path& file, std::string_view contents) noexcept;

enum class OwnerOnlyReadError : std::uint8_t
{
    Missing,
    NotRegularFile,
    ForeignOwner,
    AccessibleToOthers,
    Unreadable,
};

template <class T> using OwnerOnlyReadResult = std::variant<T, OwnerOnlyReadError>;

// Reads at most `maxBytes` of `file` only if it can be trusted as private to the current user:
// a regular file reached without following a symlink, owned by the current user, with no group/other access
// (Windows: no reparse point, owned by the current user, no ACE granting anyone else access).
[[nodiscard]] OwnerOnlyReadResult<std::string> readOwnerOnlyFile(const std::filesystem::path& file,
                                                                 std::size_t maxBytes) noexcept;

[[nodiscard]] std::string_view describe(OwnerOnlyReadError error) noexcept;

} // namespace vaultcache::platform

#endif // INCLUDE_VAULTCACHE_PLATFORM_FILEPERMISSIONGUARD_HPP
