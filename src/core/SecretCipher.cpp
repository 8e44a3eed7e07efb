#include "vaultcache/core/SecretCipher.hpp"

#include "vaultcache/crypto/Base64Url.hpp"
#include "vaultcache/log/Log.hpp"
#include "vaultcache/security/JsonWipe.hpp"
#include "vaultcache/security/MemoryWiper.hpp"
#include "vaultcache/security/ScopeWipe.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>
#include <span>
#include <vector>

namespace vaultcache::core
{
namespace
{

using vaultcache::crypto::CipherError;
using vaultcache::crypto::CipherResult;

constexpr std::string_view g_kTag{ "cipher" };
constexpr char g_kSeparator{ ':' };

[[nodiscard]] std::span<const std::byte> aadBytes() noexcept
{
    return std::as_bytes(std::span<const char>{ g_kCachePayloadAad.data(), g_kCachePayloadAad.size() });
}

} // namespace

SecretCipher::SecretCipher(vaultcache::crypto::ICryptoProvider& crypto, IMachineIdentity& identity,
                           vaultcache::crypto::Pbkdf2Params params) noexcept
    : m_crypto(&crypto), m_identity(&identity), m_params(params)
{
}

CipherResult<std::string> SecretCipher::encrypt(const SecretMap& secrets) const
{
    auto derived{ vaultcache::crypto::deriveCacheKey(*m_crypto, m_identity->resolve(), std::nullopt, m_params) };
    if (std::holds_alternative<CipherError>(derived))
    {
        return CipherError::CryptoUnavailable;
    }
    const auto& key{ std::get<vaultcache::crypto::DerivedKey>(derived) };

    std::string plain{};
    const auto plainWipe{ vaultcache::security::scopeWipe(plain) };
    try
    {
        nlohmann::json doc = nlohmann::json::object();
        const vaultcache::security::JsonWipe docWipe{ doc };
        for (const auto& [name, value] : secrets)
        {
            doc[name] = std::string{ vaultcache::security::asStringView(value) };
        }
        plain = doc.dump();
    }
    catch (const nlohmann::json::exception& e)
    {
        vaultcache::log::warn(g_kTag, "cannot serialize secrets", { { "reason", e.what() } });
        return CipherError::CryptoUnavailable;
    }

    vaultcache::crypto::AeadBox box{};
    try
    {
        box = m_crypto->aeadEncrypt(std::span<const std::uint8_t>{ key.key().data(), key.key().size() },
                                    std::as_bytes(std::span<const char>{ plain.data(), plain.size() }), aadBytes());
    }
    catch (const std::exception& e)
    {
        vaultcache::log::warn(g_kTag, "encryption failed", { { "reason", e.what() } });
        return CipherError::CryptoUnavailable;
    }

    std::vector<std::uint8_t> blob{};
    blob.reserve(box.nonce.size() + box.cipherText.size() + box.tag.size());
    blob.insert(blob.end(), box.nonce.begin(), box.nonce.end());
    blob.insert(blob.end(), box.cipherText.begin(), box.cipherText.end());
    blob.insert(blob.end(), box.tag.begin(), box.tag.end());

    std::string token{ vaultcache::crypto::base64UrlEncode(key.salt()) };
    token.push_back(g_kSeparator);
    token += vaultcache::crypto::base64UrlEncode(blob);
    return token;
}

CipherResult<SecretMap> SecretCipher::decrypt(std::string_view token) const
{
    try
    {
        const auto sep{ token.find(g_kSeparator) };
        if (sep == std::string_view::npos)
        {
            return CipherError::DecryptFailure;
        }

        const auto saltBytes{ vaultcache::crypto::base64UrlDecode(token.substr(0, sep)) };
        if (!saltBytes.has_value() || saltBytes->size() != vaultcache::crypto::g_cacheSaltBytes)
        {
            return CipherError::DecryptFailure;
        }
        const auto blob{ vaultcache::crypto::base64UrlDecode(token.substr(sep + 1U)) };
        constexpr std::size_t kMinBlob{ vaultcache::crypto::g_aeadNonceBytes + vaultcache::crypto::g_aeadTagBytes };
        if (!blob.has_value() || blob->size() < kMinBlob)
        {
            return CipherError::DecryptFailure;
        }

        vaultcache::crypto::Salt salt{};
        std::copy(saltBytes->begin(), saltBytes->end(), salt.begin());
        auto derived{ vaultcache::crypto::deriveCacheKey(*m_crypto, m_identity->resolve(), salt, m_params) };
        if (std::holds_alternative<CipherError>(derived))
        {
            return CipherError::DecryptFailure;
        }
        const auto& key{ std::get<vaultcache::crypto::DerivedKey>(derived) };

        vaultcache::crypto::AeadBox box{};
        const auto nonceEnd{ blob->begin() + static_cast<std::ptrdiff_t>(box.nonce.size()) };
        const auto tagBegin{ blob->end() - static_cast<std::ptrdiff_t>(box.tag.size()) };
        std::copy(blob->begin(), nonceEnd, box.nonce.begin());
        box.cipherText.assign(nonceEnd, tagBegin);
        std::copy(tagBegin, blob->end(), box.tag.begin());

        auto plain{ m_crypto->aeadDecrypt(std::span<const std::uint8_t>{ key.key().data(), key.key().size() }, box,
                                          aadBytes()) };
        if (!plain.has_value())
        {
            return CipherError::DecryptFailure;
        }

        const auto text{ vaultcache::security::asStringView(*plain) };
        nlohmann::json doc = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        const vaultcache::security::JsonWipe docWipe{ doc };
        if (doc.is_discarded() || !doc.is_object())
        {
            return CipherError::DecryptFailure;
        }

        SecretMap out{};
        for (const auto& item : doc.items())
        {
            if (!item.value().is_string())
            {
                return CipherError::DecryptFailure;
            }
            out.insert_or_assign(item.key(),
                                 vaultcache::security::secureStringFrom(item.value().get_ref<const std::string&>()));
        }
        return out;
    }
    catch (const std::exception& e)
    {
        vaultcache::log::debug(g_kTag, "payload rejected", { { "reason", e.what() } });
        return CipherError::DecryptFailure;
    }
}

} // namespace vaultcache::core
