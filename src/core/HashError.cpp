#include "credhash/core/HashError.hpp"
#include <string_view>

namespace credhash::core
{
namespace
{

[[nodiscard]] std::string_view messageFor(HashErrc code) noexcept
{
    switch (code)
    {
    case HashErrc::Corrupt:
        return "malformed hashed value";
    case HashErrc::Version:
        return "unknown hashed format version";
    case HashErrc::Function:
        return "unknown hash function";
    case HashErrc::Parameter:
        return "invalid hash function parameter";
    case HashErrc::RandomSourceFailure:
        return "cannot make salt value";
    case HashErrc::Mismatch:
        return "password does not match";
    }
    return "unknown error";
}

} // namespace

std::string describe(const HashError& error)
{
    if (error.detail.empty())
    {
        return std::string{ messageFor(error.code) };
    }

    std::string out{ "password encoding: " };
    out += error.detail;
    return out;
}

} // namespace credhash::core
