#ifndef INCLUDE_CREDHASH_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_CREDHASH_CRYPTO_ICRYPTOPROVIDER_HPP

#include "credhash/crypto/KdfParams.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace credhash::crypto
{

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // PBKDF2 with HMAC-SHA256, always g_kSubkeyBytes of output.
    // Contract violations (empty salt, zero iterations) throw std::invalid_argument;
    // backend failures throw std::runtime_error.
    [[nodiscard]] virtual credhash::security::SecureBuffer
    derivePbkdf2Sha256(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                       std::uint32_t iterations) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;
};

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_ICRYPTOPROVIDER_HPP
