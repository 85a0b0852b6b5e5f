#ifndef INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace credhash::security
{

// Fills `out` from the operating system CSPRNG.
// Returns false if the source cannot supply every byte; there is no weaker fallback.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
