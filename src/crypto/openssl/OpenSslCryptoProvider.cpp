#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>
#include <vector>

namespace credhash::crypto::providers
{
namespace
{

constexpr const char* g_kDigestSha256{ "SHA256" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

EvpKdfPtr fetchPbkdf2Kdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr), &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public credhash::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_pbkdf2{ fetchPbkdf2Kdf() }
    {
    }

    [[nodiscard]] credhash::security::SecureBuffer derivePbkdf2Sha256(std::span<const std::byte> password,
                                                                      std::span<const std::uint8_t> salt,
                                                                      std::uint32_t iterations) const override
    {
        if (salt.empty())
        {
            throw std::invalid_argument("derivePbkdf2Sha256: empty salt");
        }
        if (iterations == 0U)
        {
            throw std::invalid_argument("derivePbkdf2Sha256: zero iterations");
        }
        if (!m_pbkdf2)
        {
            throw std::runtime_error("derivePbkdf2Sha256: OpenSSL PBKDF2 not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("derivePbkdf2Sha256: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies.
        // An empty password is legal, so keep one spare byte to never pass a null pointer.
        credhash::security::SecureBuffer passwordCopy(password.size() + 1U);
        if (!password.empty())
        {
            std::memcpy(passwordCopy.data(), password.data(), password.size());
        }
        std::vector<std::uint8_t> saltCopy(salt.begin(), salt.end());

        std::uint64_t iter{ iterations };
        // PKCS#5 mode lifts the SP 800-132 lower bounds; the legacy format allows 1 iteration and a 1-byte salt.
        int pkcs5Mode{ 1 };
        std::array<char, 8> digest{};
        std::memcpy(digest.data(), g_kDigestSha256, std::strlen(g_kDigestSha256));

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), password.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0),
            OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Mode),
            OSSL_PARAM_construct_end(),
        };

        credhash::security::SecureBuffer out(credhash::crypto::g_kSubkeyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("derivePbkdf2Sha256: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return credhash::security::secureRandomFill(out);
    }

private:
    EvpKdfPtr m_pbkdf2{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<credhash::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace credhash::crypto::providers
