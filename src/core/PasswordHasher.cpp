#include "credhash/core/PasswordHasher.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <array>

namespace credhash::core
{
namespace
{

// Decoy parameters for malformed stored values. Only the cost matters, not the values.
constexpr std::array<std::uint8_t, g_kDefaultSaltBytes> g_kDecoySalt{
    0x63, 0x72, 0x65, 0x64, 0x68, 0x61, 0x73, 0x68, 0x2e, 0x64, 0x65, 0x63, 0x6f, 0x79, 0x2e, 0x31,
};
constexpr std::string_view g_kDecoyPassword{ "credhash.decoy.reference" };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace

PasswordHasher::PasswordHasher(credhash::crypto::ICryptoProvider& crypto)
    : m_crypto{ &crypto },
      m_decoyKey{ crypto.derivePbkdf2Sha256(asBytes(g_kDecoyPassword), g_kDecoySalt, g_kDefaultIterations) }
{
}

HashResult<PasswordHash> PasswordHasher::hashPassword(std::span<const std::byte> password, std::uint32_t iterations)
{
    if (!isValidIterations(iterations))
    {
        return HashErrc::Parameter;
    }

    std::array<std::uint8_t, g_kDefaultSaltBytes> salt{};
    if (!m_crypto->randomBytes(salt))
    {
        return HashErrc::RandomSourceFailure;
    }

    auto subkey{ m_crypto->derivePbkdf2Sha256(password, salt, iterations) };
    return PasswordHash{ salt, iterations, subkey };
}

bool PasswordHasher::verifyPassword(const PasswordHash& hash, std::span<const std::byte> password) const
{
    const auto candidate{ m_crypto->derivePbkdf2Sha256(password, hash.salt(), hash.iterations()) };
    return credhash::security::secureEquals(hash.subkey(), std::span<const std::uint8_t>{ candidate });
}

VerifyResult PasswordHasher::verifyEncodedHash(std::string_view encoded, std::span<const std::byte> password) const
{
    auto decoded{ decodePasswordHashText(encoded) };
    if (auto* error = std::get_if<HashError>(&decoded))
    {
        burnDecoyDerivation(password);
        return VerifyResult{ .matched = false, .error = std::move(*error) };
    }

    return VerifyResult{ .matched = verifyPassword(std::get<PasswordHash>(decoded), password), .error = std::nullopt };
}

HashResult<std::string> PasswordHasher::generateFromPassword(std::span<const std::byte> password,
                                                             std::uint32_t iterations)
{
    auto hashed{ hashPassword(password, iterations) };
    if (auto* error = std::get_if<HashError>(&hashed))
    {
        return std::move(*error);
    }
    return encodePasswordHashText(std::get<PasswordHash>(hashed));
}

HashResult<std::monostate> PasswordHasher::compareHashAndPassword(std::string_view encoded,
                                                                  std::span<const std::byte> password) const
{
    auto result{ verifyEncodedHash(encoded, password) };
    if (result.error.has_value())
    {
        return std::move(*result.error);
    }
    if (!result.matched)
    {
        return HashErrc::Mismatch;
    }
    return std::monostate{};
}

void PasswordHasher::burnDecoyDerivation(std::span<const std::byte> password) const
{
    // Compared against an independently derived key, never against itself, so the comparison
    // cannot be folded away. The outcome is discarded through a volatile.
    const auto candidate{ m_crypto->derivePbkdf2Sha256(password, g_kDecoySalt, g_kDefaultIterations) };
    volatile bool sink{ credhash::security::secureEquals(candidate, m_decoyKey) };
    (void)sink;
}

} // namespace credhash::core
