#ifndef INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace credhash::security
{

// Zeroes the bytes in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes a borrowed byte range when it goes out of scope.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.m_bytes = {};
    }
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

private:
    std::span<std::byte> m_bytes;
};

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(std::span<T> buffer) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(buffer) };
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
