#ifndef CREDHASH_SRC_CORE_BASE64_HPP
#define CREDHASH_SRC_CORE_BASE64_HPP

#include "credhash/core/HashError.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::core::detail
{

// RFC 4648 standard alphabet with padding, no line breaks.
[[nodiscard]] std::string base64Encode(std::span<const std::byte> bytes);

// Strict decoding: no whitespace, padding only at the very end, length a multiple of 4.
// Failures are HashErrc::Corrupt with the offending input position in the detail.
[[nodiscard]] HashResult<std::vector<std::byte>> base64Decode(std::string_view text);

} // namespace credhash::core::detail

#endif // CREDHASH_SRC_CORE_BASE64_HPP
