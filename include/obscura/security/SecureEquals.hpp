#ifndef INCLUDE_OBSCURA_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_OBSCURA_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace obscura::security
{
// Returns false at once when the sizes differ. Equal-size inputs are always scanned to the end:
// the XOR of every byte pair is OR-ed into a volatile accumulator, with no early exit.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};

    for (std::size_t i{}; i < a.size(); ++i)
    {
        const unsigned char x{ std::to_integer<unsigned char>(a[i]) };
        const unsigned char y{ std::to_integer<unsigned char>(b[i]) };

        diff |= (x ^ y);
    }

    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SECUREEQUALS_HPP
