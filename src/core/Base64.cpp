#include "Base64.hpp"

#include <climits>
#include <cstdint>
#include <openssl/evp.h>
#include <optional>
#include <stdexcept>

namespace credhash::core::detail
{
namespace
{

constexpr std::size_t g_kQuantumChars{ 4U };
constexpr std::size_t g_kQuantumBytes{ 3U };
constexpr std::size_t g_kMaxPadding{ 2U };

[[nodiscard]] constexpr bool isAlphabet(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

[[nodiscard]] HashError illegalAt(std::size_t position)
{
    return HashError{ HashErrc::Corrupt, "illegal base64 data at input byte " + std::to_string(position) };
}

struct ScanResult final
{
    std::size_t padding{};
    std::optional<std::size_t> badPosition;
};

[[nodiscard]] ScanResult scan(std::string_view text) noexcept
{
    ScanResult out{};
    for (std::size_t i{}; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (isAlphabet(c))
        {
            if (out.padding != 0U)
            {
                out.badPosition = i;
                return out;
            }
            continue;
        }
        if (c == '=' && i + g_kMaxPadding >= text.size() && out.padding < g_kMaxPadding)
        {
            ++out.padding;
            continue;
        }
        out.badPosition = i;
        return out;
    }

    if ((text.size() % g_kQuantumChars) != 0U)
    {
        out.badPosition = text.size();
    }
    return out;
}

} // namespace

std::string base64Encode(std::span<const std::byte> bytes)
{
    if (bytes.size() > static_cast<std::size_t>(INT_MAX / 2))
    {
        throw std::length_error("base64Encode: input too large");
    }

    const std::size_t encodedLen{ g_kQuantumChars * ((bytes.size() + g_kQuantumBytes - 1U) / g_kQuantumBytes) };
    // EVP_EncodeBlock writes a trailing NUL.
    std::string out(encodedLen + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                       reinterpret_cast<const unsigned char*>(bytes.data()),
                                       static_cast<int>(bytes.size())) };
    out.resize(static_cast<std::size_t>(written));
    return out;
}

HashResult<std::vector<std::byte>> base64Decode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::byte>{};
    }
    if (text.size() > static_cast<std::size_t>(INT_MAX))
    {
        return HashError{ HashErrc::Corrupt, "base64 input too large" };
    }

    const ScanResult scanned{ scan(text) };
    if (scanned.badPosition.has_value())
    {
        return illegalAt(*scanned.badPosition);
    }

    std::vector<std::byte> out((text.size() / g_kQuantumChars) * g_kQuantumBytes);
    const int decoded{ EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                       reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (decoded < 0 || static_cast<std::size_t>(decoded) != out.size())
    {
        return HashError{ HashErrc::Corrupt, "base64 decoder rejected input" };
    }

    // EVP_DecodeBlock counts padding characters as zero bytes.
    out.resize(out.size() - scanned.padding);
    return out;
}

} // namespace credhash::core::detail
