#include "credhash/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace credhash::security
{
namespace
{

#if defined(_WIN32)

[[nodiscard]] bool fillChunk(std::uint8_t* dst, std::size_t len) noexcept
{
    const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(dst), static_cast<ULONG>(len),
                                           BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status);
}

constexpr std::size_t g_kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };

#else

// getrandom() may return short reads for large requests or be interrupted by signals.
[[nodiscard]] bool fillChunk(std::uint8_t* dst, std::size_t len) noexcept
{
    while (len > 0U)
    {
        const ssize_t got{ ::getrandom(dst, len, 0U) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > len)
        {
            return false;
        }
        dst += got;
        len -= static_cast<std::size_t>(got);
    }
    return true;
}

constexpr std::size_t g_kMaxChunk{ 256U };

#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const std::size_t chunk{ out.size() < g_kMaxChunk ? out.size() : g_kMaxChunk };
        if (!fillChunk(out.data(), chunk))
        {
            return false;
        }
        out = out.subspan(chunk);
    }
    return true;
}

} // namespace credhash::security
