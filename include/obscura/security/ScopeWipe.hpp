#ifndef INCLUDE_OBSCURA_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_OBSCURA_SECURITY_SCOPEWIPE_HPP

#include "obscura/security/MemoryWiper.hpp"
#include <cstddef>
#include <span>
#include <type_traits>

namespace obscura::security
{
// Wipes a fixed region when the enclosing scope ends, normally or by exception.
// Pinned to its scope: neither copyable nor movable, so the region is wiped exactly once.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> region) noexcept : m_region{ region }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_region);
    }

private:
    std::span<std::byte> m_region;
};

// Guards the object representation of a scratch value, e.g. an intermediate digest.
// Returned as a prvalue, so `auto guard{ scopeWipeObject(x) };` needs no move.
template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipeObject(T& value) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T, 1>{ &value, 1 }) };
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SCOPEWIPE_HPP
