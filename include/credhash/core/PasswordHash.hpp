#ifndef INCLUDE_CREDHASH_CORE_PASSWORDHASH_HPP
#define INCLUDE_CREDHASH_CORE_PASSWORDHASH_HPP

#include "credhash/core/HashError.hpp"
#include "credhash/core/HashPolicy.hpp"
#include "credhash/crypto/KdfParams.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::core
{

// A hashed password in the identity framework's version-1 layout:
//
//   version[1]=0x01, prf[4]=1, iterations[4], saltLength[4], salt[saltLength], subkey[32]
//
// All integers big-endian. Instances are immutable and own copies of salt and subkey.
class PasswordHash final
{
public:
    // Assembles a record from components obtained elsewhere. Version and PRF are fixed;
    // ranges are not checked here, callers handling untrusted input must validate first.
    // Verifying a record with an empty salt or zero iterations throws std::invalid_argument.
    PasswordHash(std::span<const std::uint8_t> salt, std::uint32_t iterations, std::span<const std::uint8_t> subkey);

    [[nodiscard]] std::uint8_t version() const noexcept
    {
        return m_version;
    }
    [[nodiscard]] credhash::crypto::Prf prf() const noexcept
    {
        return m_prf;
    }
    [[nodiscard]] std::uint32_t iterations() const noexcept
    {
        return m_iterations;
    }
    [[nodiscard]] std::span<const std::uint8_t> salt() const noexcept
    {
        return m_salt;
    }
    [[nodiscard]] std::span<const std::uint8_t> subkey() const noexcept
    {
        return m_subkey;
    }

    [[nodiscard]] friend bool operator==(const PasswordHash& a, const PasswordHash& b) noexcept;

private:
    std::uint8_t m_version{ g_kFormatVersion };
    credhash::crypto::Prf m_prf{ credhash::crypto::Prf::HmacSha256 };
    std::uint32_t m_iterations{ g_kDefaultIterations };
    std::vector<std::uint8_t> m_salt;
    credhash::security::SecureBuffer m_subkey;
};

// Binary form; exactly g_kHeaderBytes + salt + subkey bytes.
[[nodiscard]] std::vector<std::byte> encodePasswordHash(const PasswordHash& hash);

// Checks length, version, PRF, iterations, salt length and total length, in that order.
[[nodiscard]] HashResult<PasswordHash> decodePasswordHash(std::span<const std::byte> bytes);

// Base64 of the binary form: the value stored in the user table.
[[nodiscard]] std::string encodePasswordHashText(const PasswordHash& hash);

[[nodiscard]] HashResult<PasswordHash> decodePasswordHashText(std::string_view text);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PASSWORDHASH_HPP
