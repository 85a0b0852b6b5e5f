#ifndef INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP
#define INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace credhash::core
{

// Format version byte 0x01 (what the identity framework calls its "v3" layout).
constexpr std::uint8_t g_kFormatVersion{ 1U };

// version[1] + prf[4] + iterations[4] + saltLength[4]
constexpr std::size_t g_kHeaderBytes{ 1U + 3U * 4U };

constexpr std::uint32_t g_kDefaultIterations{ 10000U };
constexpr std::uint32_t g_kMinIterations{ 1U };
constexpr std::uint32_t g_kMaxIterations{ 100000U };

constexpr std::size_t g_kDefaultSaltBytes{ 16U };
constexpr std::size_t g_kMinSaltBytes{ 1U };
constexpr std::size_t g_kMaxSaltBytes{ 64U };

// Environment variable that overrides the iteration count for new hashes.
constexpr std::string_view g_kIterationsEnvVar{ "CREDHASH_ITERATIONS" };

[[nodiscard]] constexpr bool isValidIterations(std::uint64_t iterations) noexcept
{
    return iterations >= g_kMinIterations && iterations <= g_kMaxIterations;
}

[[nodiscard]] constexpr bool isValidSaltLength(std::uint64_t saltBytes) noexcept
{
    return saltBytes >= g_kMinSaltBytes && saltBytes <= g_kMaxSaltBytes;
}

// Plain decimal digits only, within [g_kMinIterations, g_kMaxIterations].
[[nodiscard]] std::optional<std::uint32_t> parseIterations(std::string_view text) noexcept;

// CREDHASH_ITERATIONS when set to a valid count, g_kDefaultIterations otherwise.
[[nodiscard]] std::uint32_t defaultIterationsFromEnvironment();

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP
