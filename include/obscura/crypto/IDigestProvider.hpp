#ifndef INCLUDE_OBSCURA_CRYPTO_IDIGESTPROVIDER_HPP
#define INCLUDE_OBSCURA_CRYPTO_IDIGESTPROVIDER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace obscura::crypto
{

constexpr std::size_t g_kDigestBytes{ 64 };

using Digest = std::array<std::uint8_t, g_kDigestBytes>;

class IDigestProvider
{
public:
    IDigestProvider() = default;
    IDigestProvider(const IDigestProvider&) = delete;
    IDigestProvider& operator=(const IDigestProvider&) = delete;
    IDigestProvider(IDigestProvider&&) = delete;
    IDigestProvider& operator=(IDigestProvider&&) = delete;
    virtual ~IDigestProvider() = default;

    // BLAKE2b-512 of input, unkeyed.
    // The result goes into caller-owned storage so the caller decides when it is wiped.
    // Backend failures throw std::runtime_error.
    virtual void digest(std::span<const std::byte> input, Digest& out) const = 0;
};

} // namespace obscura::crypto

#endif // INCLUDE_OBSCURA_CRYPTO_IDIGESTPROVIDER_HPP
