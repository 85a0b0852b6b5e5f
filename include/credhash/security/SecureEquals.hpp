#ifndef INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace credhash::security
{

// Constant-time equality. The loop always covers the longer input, so neither the
// position of the first differing byte nor a length mismatch shortens the work.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    const std::size_t length{ std::max(a.size(), b.size()) };

    volatile unsigned char diff{ static_cast<unsigned char>(a.size() != b.size()) };
    for (std::size_t i{}; i < length; ++i)
    {
        const unsigned char x{ i < a.size() ? std::to_integer<unsigned char>(a[i]) : static_cast<unsigned char>(0U) };
        const unsigned char y{ i < b.size() ? std::to_integer<unsigned char>(b[i]) : static_cast<unsigned char>(0U) };
        diff |= static_cast<unsigned char>(x ^ y);
    }

    return diff == 0U;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
