#ifndef INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
#define INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP

#include "credhash/core/HashError.hpp"
#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/PasswordHash.hpp"
#include "credhash/crypto/ICryptoProvider.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace credhash::core
{

struct VerifyResult final
{
    bool matched{ false };
    // Set only when the stored value could not be decoded. For access control treat it exactly like
    // matched == false; the error is for diagnostics.
    std::optional<HashError> error;
};

// Creates and checks hashed passwords. Holds no mutable state after construction, so one instance
// may serve concurrent callers as long as the provider's randomBytes() is thread-safe.
class PasswordHasher final
{
public:
    // Derives the decoy reference key used by verifyEncodedHash(); costs one default-strength derivation.
    explicit PasswordHasher(credhash::crypto::ICryptoProvider& crypto);

    // New record with a fresh random salt of g_kDefaultSaltBytes.
    // Errors: Parameter (iterations outside [g_kMinIterations, g_kMaxIterations]), RandomSourceFailure.
    [[nodiscard]] HashResult<PasswordHash> hashPassword(std::span<const std::byte> password,
                                                        std::uint32_t iterations = g_kDefaultIterations);

    // Constant-time comparison against the stored subkey. Records from decodePasswordHash() are always
    // accepted; one built from raw components with an empty salt or zero iterations makes the provider
    // throw std::invalid_argument.
    [[nodiscard]] bool verifyPassword(const PasswordHash& hash, std::span<const std::byte> password) const;

    // Decodes `encoded` and verifies `password` against it. A malformed value costs the same single
    // derivation as a real check before {false, error} is returned.
    [[nodiscard]] VerifyResult verifyEncodedHash(std::string_view encoded, std::span<const std::byte> password) const;

    // hashPassword() followed by the text encoding.
    [[nodiscard]] HashResult<std::string> generateFromPassword(std::span<const std::byte> password,
                                                               std::uint32_t iterations = g_kDefaultIterations);

    // std::monostate on a match, the decode error for malformed values, HashErrc::Mismatch otherwise.
    [[nodiscard]] HashResult<std::monostate> compareHashAndPassword(std::string_view encoded,
                                                                    std::span<const std::byte> password) const;

private:
    void burnDecoyDerivation(std::span<const std::byte> password) const;

    credhash::crypto::ICryptoProvider* m_crypto{ nullptr };
    credhash::security::SecureBuffer m_decoyKey;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
