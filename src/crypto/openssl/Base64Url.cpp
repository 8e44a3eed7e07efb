#include "vaultcache/crypto/Base64Url.hpp"

#include <algorithm>
#include <limits>
#include <openssl/evp.h>

namespace vaultcache::crypto
{
namespace
{

constexpr std::size_t g_kQuantumChars{ 4U };
constexpr std::size_t g_kQuantumBytes{ 3U };

[[nodiscard]] char toUrlAlphabet(char c) noexcept
{
    if (c == '+')
    {
        return '-';
    }
    if (c == '/')
    {
        return '_';
    }
    return c;
}

// Maps back to the standard alphabet; standard-only characters are rejected so that '+' and '/' never decode.
[[nodiscard]] std::optional<char> fromUrlAlphabet(char c) noexcept
{
    if (c == '-')
    {
        return '+';
    }
    if (c == '_')
    {
        return '/';
    }
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '=')
    {
        return c;
    }
    return std::nullopt;
}

} // namespace

std::string base64UrlEncode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2))
    {
        return {};
    }

    const std::size_t encodedLen{ ((bytes.size() + g_kQuantumBytes - 1U) / g_kQuantumBytes) * g_kQuantumChars };
    std::string out(encodedLen + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0)
    {
        return {};
    }
    out.resize(static_cast<std::size_t>(written));
    std::transform(out.begin(), out.end(), out.begin(), toUrlAlphabet);
    return out;
}

std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if ((text.size() % g_kQuantumChars) != 0U || text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    std::string standard{};
    standard.reserve(text.size());
    for (const char c : text)
    {
        const auto mapped{ fromUrlAlphabet(c) };
        if (!mapped)
        {
            return std::nullopt;
        }
        standard.push_back(*mapped);
    }

    std::size_t padding{ 0U };
    while (padding < standard.size() && standard[standard.size() - 1U - padding] == '=')
    {
        ++padding;
    }
    if (padding > 2U || standard.find('=') < standard.size() - padding)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out((standard.size() / g_kQuantumChars) * g_kQuantumBytes);
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                       static_cast<int>(standard.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) != out.size())
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by padding.
    out.resize(out.size() - padding);
    return out;
}

} // namespace vaultcache::crypto
