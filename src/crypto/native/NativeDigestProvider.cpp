#include "obscura/crypto/providers/NativeProviderFactory.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <span>

namespace obscura::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

class NativeDigestProvider final : public obscura::crypto::IDigestProvider
{
public:
    void digest(std::span<const std::byte> input, obscura::crypto::Digest& out) const override
    {
        // crypto_blake2b wipes its own context before returning.
        crypto_blake2b(out.data(), out.size(), asU8(input).data(), input.size());
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<obscura::crypto::IDigestProvider> makeNativeDigestProvider()
{
    return std::make_unique<NativeDigestProvider>();
}

} // namespace obscura::crypto::providers
