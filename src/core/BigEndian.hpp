#ifndef CREDHASH_SRC_CORE_BIGENDIAN_HPP
#define CREDHASH_SRC_CORE_BIGENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace credhash::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::uint32_t g_kBitsPerByte{ 8U };
constexpr std::uint32_t g_kByteMask{ 0xFFU };

// Most significant byte first.
inline void writeU32BE(std::span<std::byte, g_kU32Bytes> out, std::uint32_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(out.size() - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((v >> shiftBits) & g_kByteMask);
    }
}

[[nodiscard]] inline std::uint32_t readU32BE(std::span<const std::byte, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{ 0U };
    for (const std::byte b : in)
    {
        v = (v << g_kBitsPerByte) | static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(b));
    }
    return v;
}

} // namespace credhash::core::detail

#endif // CREDHASH_SRC_CORE_BIGENDIAN_HPP
