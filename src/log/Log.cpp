#include "vaultcache/log/Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <utility>

namespace vaultcache::log
{
namespace
{

constexpr std::string_view g_kRedacted{ "***" };

std::mutex g_sinkMutex;
Sink g_sink;
std::atomic<Level> g_minLevel{ Level::Info };

[[nodiscard]] std::string_view levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

[[nodiscard]] std::string toLowerAscii(std::string_view value)
{
    std::string out{ value };
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] bool isDelimiter(char ch) noexcept
{
    const auto uc{ static_cast<unsigned char>(ch) };
    return std::isspace(uc) != 0 || ch == ',' || ch == ';' || ch == '&';
}

void writeDefault(Level level, std::string_view line)
{
    FILE* out{ (level == Level::Warn || level == Level::Error) ? stderr : stdout };
    std::fwrite(line.data(), 1U, line.size(), out);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace

void setSink(Sink sink)
{
    const std::lock_guard<std::mutex> lock{ g_sinkMutex };
    g_sink = std::move(sink);
}

void setMinLevel(Level level) noexcept
{
    g_minLevel.store(level, std::memory_order_relaxed);
}

Level minLevel() noexcept
{
    return g_minLevel.load(std::memory_order_relaxed);
}

std::optional<Level> parseLevel(std::string_view text) noexcept
{
    std::array<char, 8> lower{};
    if (text.empty() || text.size() > lower.size())
    {
        return std::nullopt;
    }
    for (std::size_t i{}; i < text.size(); ++i)
    {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    const std::string_view v{ lower.data(), text.size() };
    if (v == "debug")
    {
        return Level::Debug;
    }
    if (v == "info")
    {
        return Level::Info;
    }
    if (v == "warn" || v == "warning")
    {
        return Level::Warn;
    }
    if (v == "error")
    {
        return Level::Error;
    }
    return std::nullopt;
}

bool isSensitiveKey(std::string_view key)
{
    if (key.empty())
    {
        return false;
    }
    const std::string lower{ toLowerAscii(key) };
    constexpr std::array<std::string_view, 4> kMarkers{ "token", "password", "secret", "value" };
    for (const auto marker : kMarkers)
    {
        if (lower.find(marker) != std::string::npos)
        {
            return true;
        }
    }
    if (lower.find("key") != std::string::npos)
    {
        return lower.find("key_id") == std::string::npos && lower.find("keyid") == std::string::npos &&
               lower.find("cache_key") == std::string::npos;
    }
    return false;
}

std::string redactMessage(std::string_view message)
{
    std::string out{ message };
    std::string lower{ toLowerAscii(out) };
    constexpr std::array<std::string_view, 4> kKeys{ "token=", "password=", "secret=", "key=" };
    for (const auto pattern : kKeys)
    {
        std::size_t pos{ 0U };
        while ((pos = lower.find(pattern, pos)) != std::string::npos)
        {
            const std::size_t start{ pos + pattern.size() };
            std::size_t end{ start };
            while (end < out.size() && !isDelimiter(out[end]))
            {
                ++end;
            }
            if (end > start)
            {
                out.replace(start, end - start, g_kRedacted);
                lower.replace(start, end - start, g_kRedacted);
            }
            pos = start + ((end > start) ? g_kRedacted.size() : 0U);
        }
    }
    return out;
}

std::string formatLine(Level level, std::string_view tag, std::string_view message,
                       std::initializer_list<Field> fields)
{
    std::string line{};
    line.reserve(32U + message.size() + (fields.size() * 16U));
    line.append("[vaultcache] ");
    line.append(levelName(level));
    if (!tag.empty())
    {
        line.push_back(' ');
        line.append(tag);
    }
    line.append(": ");
    line.append(redactMessage(message));
    for (const auto& field : fields)
    {
        if (field.key.empty())
        {
            continue;
        }
        line.push_back(' ');
        line.append(field.key);
        line.push_back('=');
        line.append(isSensitiveKey(field.key) ? g_kRedacted : field.value);
    }
    return line;
}

void write(Level level, std::string_view tag, std::string_view message, std::initializer_list<Field> fields)
{
    if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(minLevel()))
    {
        return;
    }
    const std::string line{ formatLine(level, tag, message, fields) };

    const std::lock_guard<std::mutex> lock{ g_sinkMutex };
    if (g_sink)
    {
        g_sink(level, line);
        return;
    }
    writeDefault(level, line);
}

} // namespace vaultcache::log
