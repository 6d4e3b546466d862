#ifndef INCLUDE_OBSCURA_SECURITY_SECURERANDOM_HPP
#define INCLUDE_OBSCURA_SECURITY_SECURERANDOM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace obscura::security
{

// Fills out from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

template <std::size_t N> [[nodiscard]] std::array<std::uint8_t, N> secureRandomArray()
{
    std::array<std::uint8_t, N> out{};
    if (!secureRandomFill(std::span<std::uint8_t>{ out }))
    {
        throw std::runtime_error("secureRandomArray: CSPRNG failure");
    }
    return out;
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SECURERANDOM_HPP
