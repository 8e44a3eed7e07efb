#ifndef INCLUDE_VAULTCACHE_LOG_LOG_HPP
#define INCLUDE_VAULTCACHE_LOG_LOG_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace vaultcache::log
{

enum class Level : std::uint8_t
{
    Debug = 0U,
    Info = 1U,
    Warn = 2U,
    Error = 3U,
};

struct Field final
{
    std::string_view key;
    std::string_view value;
};

// Receives the fully formatted (and redacted) line, without trailing newline.
using Sink = std::function<void(Level level, std::string_view line)>;

// An empty sink restores the default stdout/stderr writer.
void setSink(Sink sink);

void setMinLevel(Level level) noexcept;
[[nodiscard]] Level minLevel() noexcept;

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
[[nodiscard]] std::optional<Level> parseLevel(std::string_view text) noexcept;

void write(Level level, std::string_view tag, std::string_view message, std::initializer_list<Field> fields = {});

inline void debug(std::string_view tag, std::string_view message, std::initializer_list<Field> fields = {})
{
    write(Level::Debug, tag, message, fields);
}

inline void info(std::string_view tag, std::string_view message, std::initializer_list<Field> fields = {})
{
    write(Level::Info, tag, message, fields);
}

inline void warn(std::string_view tag, std::string_view message, std::initializer_list<Field> fields = {})
{
    write(Level::Warn, tag, message, fields);
}

inline void error(std::string_view tag, std::string_view message, std::initializer_list<Field> fields = {})
{
    write(Level::Error, tag, message, fields);
}

[[nodiscard]] bool isSensitiveKey(std::string_view key);

// Replaces the value of inline `token=...`, `password=...` style fragments with ***.
[[nodiscard]] std::string redactMessage(std::string_view message);

[[nodiscard]] std::string formatLine(Level level, std::string_view tag, std::string_view message,
                                     std::initializer_list<Field> fields);

} // namespace vaultcache::log

#endif // INCLUDE_VAULTCACHE_LOG_LOG_HPP
