#ifndef INCLUDE_CREDHASH_CORE_HASHERROR_HPP
#define INCLUDE_CREDHASH_CORE_HASHERROR_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace credhash::core
{

enum class HashErrc : std::uint8_t
{
    // Byte length inconsistent with the declared fields, or text-layer (base64) decoding failure.
    Corrupt,
    // Version byte is not the supported format.
    Version,
    // PRF identifier is not HMAC-SHA256.
    Function,
    // Iteration count or salt length out of range.
    Parameter,
    // The secure random source could not supply salt bytes.
    RandomSourceFailure,
    // Well-formed hash, wrong password (compareHashAndPassword only).
    Mismatch,
};

struct HashError final
{
    HashErrc code{ HashErrc::Corrupt };
    // Underlying diagnostic, e.g. the base64 decoder's complaint. Empty for most errors.
    std::string detail;

    HashError() = default;
    HashError(HashErrc c) : code{ c } // NOLINT(google-explicit-constructor)
    {
    }
    HashError(HashErrc c, std::string d) : code{ c }, detail{ std::move(d) }
    {
    }

    // Errors compare by kind; the diagnostic text is for logs only.
    [[nodiscard]] friend bool operator==(const HashError& a, const HashError& b) noexcept
    {
        return a.code == b.code;
    }
    [[nodiscard]] friend bool operator==(const HashError& a, HashErrc b) noexcept
    {
        return a.code == b;
    }
};

template <class T> using HashResult = std::variant<T, HashError>;

[[nodiscard]] std::string describe(const HashError& error);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_HASHERROR_HPP
