#include "vaultcache/crypto/providers/OpenSslProviderFactory.hpp"
#include "vaultcache/security/SecureMemory.hpp"
#include "vaultcache/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace vaultcache::crypto::providers
{
namespace
{

constexpr char g_kPbkdf2Digest[]{ "SHA256" };
constexpr std::size_t g_kMaxDerivedBytes{ 64U };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

EvpKdfPtr fetchPbkdf2Kdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr), &EVP_KDF_free };
}

const unsigned char* bytePtr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

// One ChaCha20-Poly1305 operation: key and nonce installed, AAD fed, then a single update and final.
class ChaChaPolyOperation final
{
public:
    ChaChaPolyOperation(bool encrypt, std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce)
        : m_ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free }, m_encrypt{ encrypt ? 1 : 0 }
    {
        requireExactSize(key, vaultcache::crypto::g_aeadKeyBytes, "chacha20-poly1305: key must be 32 bytes");
        if (!m_ctx)
        {
            throw std::runtime_error("chacha20-poly1305: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_CipherInit_ex(m_ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, m_encrypt) != 1 ||
            EVP_CIPHER_CTX_ctrl(m_ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
            EVP_CipherInit_ex(m_ctx.get(), nullptr, nullptr, key.data(), nonce.data(), m_encrypt) != 1)
        {
            throw std::runtime_error("chacha20-poly1305: cipher init failed");
        }
    }

    void authenticate(std::span<const std::byte> associatedData)
    {
        requireIntSized(associatedData.size(), "chacha20-poly1305: associated data too large");
        int ignored{ 0 };
        if (EVP_CipherUpdate(m_ctx.get(), nullptr, &ignored, bytePtr(associatedData),
                             static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("chacha20-poly1305: associated data rejected");
        }
    }

    // Writes at most in.size() bytes to out; returns the count, or nullopt when OpenSSL refuses
    // (for decryption that includes a tag mismatch at final).
    [[nodiscard]] std::optional<std::size_t> run(std::span<const std::byte> in, std::span<std::uint8_t> out)
    {
        requireIntSized(in.size(), "chacha20-poly1305: input too large");
        int updated{ 0 };
        auto* outPtr{ out.empty() ? nullptr : out.data() };
        if (EVP_CipherUpdate(m_ctx.get(), outPtr, &updated, bytePtr(in), static_cast<int>(in.size())) != 1 ||
            updated < 0 || static_cast<std::size_t>(updated) > out.size())
        {
            return std::nullopt;
        }
        int finished{ 0 };
        auto* tailPtr{ out.empty() ? nullptr : out.data() + updated };
        if (EVP_CipherFinal_ex(m_ctx.get(), tailPtr, &finished) != 1 || finished < 0)
        {
            return std::nullopt;
        }
        const std::size_t total{ static_cast<std::size_t>(updated) + static_cast<std::size_t>(finished) };
        if (total > out.size())
        {
            return std::nullopt;
        }
        return total;
    }

    void tag(int ctrl, std::span<std::uint8_t> bytes)
    {
        if (EVP_CIPHER_CTX_ctrl(m_ctx.get(), ctrl, static_cast<int>(bytes.size()), bytes.data()) != 1)
        {
            throw std::runtime_error("chacha20-poly1305: tag exchange failed");
        }
    }

private:
    EvpCipherCtxPtr m_ctx;
    int m_encrypt;
};

class OpenSslCryptoProvider final : public vaultcache::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_pbkdf2{ fetchPbkdf2Kdf() }
    {
    }

    [[nodiscard]] vaultcache::security::SecureBuffer
    deriveKeyPbkdf2Sha256(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                          std::uint32_t iterations, std::size_t outBytes) const override
    {
        if (password.empty())
        {
            throw std::invalid_argument("deriveKeyPbkdf2Sha256: empty password");
        }
        if (iterations == 0U)
        {
            throw std::invalid_argument("deriveKeyPbkdf2Sha256: zero iterations");
        }
        if (outBytes == 0U || outBytes > g_kMaxDerivedBytes)
        {
            throw std::invalid_argument("deriveKeyPbkdf2Sha256: invalid outBytes");
        }
        if (!m_pbkdf2)
        {
            throw std::runtime_error("deriveKeyPbkdf2Sha256: OpenSSL PBKDF2 not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKeyPbkdf2Sha256: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies.
        vaultcache::security::SecureBuffer passwordCopy(password.size());
        std::memcpy(passwordCopy.data(), password.data(), password.size());
        std::vector<std::uint8_t> saltCopy(salt.begin(), salt.end());

        std::uint64_t iter{ iterations };
        char digest[sizeof(g_kPbkdf2Digest)]{};
        std::memcpy(digest, g_kPbkdf2Digest, sizeof(g_kPbkdf2Digest));

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end(),
        };

        vaultcache::security::SecureBuffer out(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveKeyPbkdf2Sha256: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return vaultcache::security::secureRandomFill(out);
    }

    [[nodiscard]] vaultcache::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        vaultcache::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        ChaChaPolyOperation op{ true, key, box.nonce };
        op.authenticate(associatedData);

        box.cipherText.resize(plainText.size());
        const auto written{ op.run(plainText, box.cipherText) };
        if (!written.has_value())
        {
            throw std::runtime_error("aeadEncrypt: encryption failed");
        }
        box.cipherText.resize(*written);
        op.tag(EVP_CTRL_AEAD_GET_TAG, box.tag);
        return box;
    }

    [[nodiscard]] std::optional<vaultcache::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const vaultcache::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        ChaChaPolyOperation op{ false, key, box.nonce };
        op.authenticate(associatedData);

        std::array<std::uint8_t, vaultcache::crypto::g_aeadTagBytes> expectedTag{ box.tag };
        op.tag(EVP_CTRL_AEAD_SET_TAG, expectedTag);

        vaultcache::security::SecureBuffer plainText(box.cipherText.size());
        const auto read{ op.run(std::as_bytes(std::span<const std::uint8_t>{ box.cipherText }), plainText) };
        if (!read.has_value())
        {
            vaultcache::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(*read);
        return plainText;
    }

private:
    EvpKdfPtr m_pbkdf2{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<vaultcache::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace vaultcache::crypto::providers
