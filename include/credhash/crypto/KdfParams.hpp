#ifndef INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace credhash::crypto
{

// SHA-256 digest size; the only subkey length the format carries.
constexpr std::size_t g_kSubkeyBytes{ 32 };

// Pseudorandom function identifiers as stored in the hashed value.
enum class Prf : std::uint32_t
{
    HmacSha256 = 1U,
};

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP
