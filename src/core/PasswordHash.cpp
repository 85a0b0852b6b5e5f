#include "credhash/core/PasswordHash.hpp"

#include "Base64.hpp"
#include "BigEndian.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <algorithm>

namespace credhash::core
{
namespace
{

constexpr std::size_t g_kU32Bytes{ detail::g_kU32Bytes };

constexpr std::size_t g_kOffsetPrf{ 1U };
constexpr std::size_t g_kOffsetIterations{ g_kOffsetPrf + g_kU32Bytes };
constexpr std::size_t g_kOffsetSaltLength{ g_kOffsetIterations + g_kU32Bytes };

static_assert(g_kOffsetSaltLength + g_kU32Bytes == g_kHeaderBytes);

[[nodiscard]] std::uint32_t readField(std::span<const std::byte> bytes, std::size_t offset) noexcept
{
    return detail::readU32BE(bytes.subspan(offset).first<g_kU32Bytes>());
}

void writeField(std::span<std::byte> out, std::size_t offset, std::uint32_t value) noexcept
{
    detail::writeU32BE(out.subspan(offset).first<g_kU32Bytes>(), value);
}

[[nodiscard]] std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

} // namespace

PasswordHash::PasswordHash(std::span<const std::uint8_t> salt, std::uint32_t iterations,
                           std::span<const std::uint8_t> subkey)
    : m_iterations{ iterations }, m_salt(salt.begin(), salt.end()), m_subkey{ credhash::security::secureBufferFrom(subkey) }
{
}

bool operator==(const PasswordHash& a, const PasswordHash& b) noexcept
{
    return a.m_version == b.m_version && a.m_prf == b.m_prf && a.m_iterations == b.m_iterations &&
           std::ranges::equal(a.m_salt, b.m_salt) && credhash::security::secureEquals(a.m_subkey, b.m_subkey);
}

std::vector<std::byte> encodePasswordHash(const PasswordHash& hash)
{
    const auto salt{ hash.salt() };
    const auto subkey{ hash.subkey() };

    std::vector<std::byte> out(g_kHeaderBytes + salt.size() + subkey.size());
    const std::span<std::byte> view{ out };

    view[0] = static_cast<std::byte>(hash.version());
    writeField(view, g_kOffsetPrf, static_cast<std::uint32_t>(hash.prf()));
    writeField(view, g_kOffsetIterations, hash.iterations());
    writeField(view, g_kOffsetSaltLength, static_cast<std::uint32_t>(salt.size()));

    auto cursor{ out.begin() + static_cast<std::ptrdiff_t>(g_kHeaderBytes) };
    cursor = std::transform(salt.begin(), salt.end(), cursor, [](std::uint8_t b) { return std::byte{ b }; });
    std::transform(subkey.begin(), subkey.end(), cursor, [](std::uint8_t b) { return std::byte{ b }; });

    return out;
}

HashResult<PasswordHash> decodePasswordHash(std::span<const std::byte> bytes)
{
    // Everything is validated before a record is built, so a failed decode produces nothing.
    if (bytes.size() < g_kHeaderBytes)
    {
        return HashErrc::Corrupt;
    }
    if (std::to_integer<std::uint8_t>(bytes[0]) != g_kFormatVersion)
    {
        return HashErrc::Version;
    }
    if (readField(bytes, g_kOffsetPrf) != static_cast<std::uint32_t>(credhash::crypto::Prf::HmacSha256))
    {
        return HashErrc::Function;
    }

    const std::uint32_t iterations{ readField(bytes, g_kOffsetIterations) };
    if (!isValidIterations(iterations))
    {
        return HashErrc::Parameter;
    }

    const std::uint32_t saltLength{ readField(bytes, g_kOffsetSaltLength) };
    if (!isValidSaltLength(saltLength))
    {
        return HashErrc::Parameter;
    }

    if (bytes.size() != g_kHeaderBytes + saltLength + credhash::crypto::g_kSubkeyBytes)
    {
        return HashErrc::Corrupt;
    }

    const auto salt{ bytes.subspan(g_kHeaderBytes, saltLength) };
    const auto subkey{ bytes.subspan(g_kHeaderBytes + saltLength) };
    return PasswordHash{ asU8(salt), iterations, asU8(subkey) };
}

std::string encodePasswordHashText(const PasswordHash& hash)
{
    const auto bytes{ encodePasswordHash(hash) };
    return detail::base64Encode(bytes);
}

HashResult<PasswordHash> decodePasswordHashText(std::string_view text)
{
    auto bytesOrError{ detail::base64Decode(text) };
    if (auto* error = std::get_if<HashError>(&bytesOrError))
    {
        return std::move(*error);
    }
    return decodePasswordHash(std::get<std::vector<std::byte>>(bytesOrError));
}

} // namespace credhash::core
