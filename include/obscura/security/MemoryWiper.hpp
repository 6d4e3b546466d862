#ifndef INCLUDE_OBSCURA_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_OBSCURA_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace obscura::security
{
// Overwrites the region with zero bytes. The write is never elided as a dead store.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Wipes the object representation of a single trivially copyable value.
template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipeObject(T& value) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T, 1>{ &value, 1 }));
}
} // namespace obscura::security
#endif // INCLUDE_OBSCURA_SECURITY_MEMORYWIPER_HPP
