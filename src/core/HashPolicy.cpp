#include "credhash/core/HashPolicy.hpp"
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace credhash::core
{

std::optional<std::uint32_t> parseIterations(std::string_view text) noexcept
{
    if (text.empty())
    {
        return std::nullopt;
    }

    std::uint64_t value{};
    const char* const first{ text.data() };
    const char* const last{ text.data() + text.size() };
    const auto [end, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || end != last)
    {
        return std::nullopt;
    }
    if (!isValidIterations(value))
    {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::uint32_t defaultIterationsFromEnvironment()
{
    const char* value{ std::getenv(std::string{ g_kIterationsEnvVar }.c_str()) };
    if (value == nullptr)
    {
        return g_kDefaultIterations;
    }
    return parseIterations(value).value_or(g_kDefaultIterations);
}

} // namespace credhash::core
