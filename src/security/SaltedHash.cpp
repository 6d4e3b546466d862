#include "obscura/security/SaltedHash.hpp"

#include "obscura/crypto/providers/NativeProviderFactory.hpp"
#include "obscura/security/MemoryWiper.hpp"
#include "obscura/security/ScopeWipe.hpp"
#include "obscura/security/SecureRandom.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace obscura::security
{
namespace
{
std::shared_ptr<const obscura::crypto::IDigestProvider> nativeProvider()
{
    static const std::shared_ptr<const obscura::crypto::IDigestProvider> s_provider{
        obscura::crypto::providers::makeNativeDigestProvider()
    };
    return s_provider;
}

// Little-endian read so the result does not depend on host byte order.
std::size_t foldToSizeT(std::span<const std::uint8_t> digest) noexcept
{
    std::size_t out{};
    for (std::size_t i{}; i < sizeof(std::size_t); ++i)
    {
        out |= static_cast<std::size_t>(digest[i]) << (8U * i);
    }
    return out;
}
} // namespace

SaltedSecretHash::SaltedSecretHash() : SaltedSecretHash(nativeProvider())
{
}

SaltedSecretHash::SaltedSecretHash(std::shared_ptr<const obscura::crypto::IDigestProvider> provider)
    : m_provider{ std::move(provider) }, m_salt{ secureRandomArray<kSaltBytes>() }
{
    if (!m_provider)
    {
        throw std::invalid_argument("SaltedSecretHash: null digest provider");
    }
}

SaltedSecretHash::~SaltedSecretHash() noexcept
{
    secureWipe(std::span<std::uint8_t>{ m_salt });
}

std::size_t SaltedSecretHash::hashBytes(std::span<const std::byte> content) const
{
    static_assert(sizeof(std::size_t) <= obscura::crypto::g_kDigestBytes);

    obscura::crypto::Digest contentDigest{};
    auto wipeContentDigest{ scopeWipeObject(contentDigest) };
    m_provider->digest(content, contentDigest);

    std::array<std::uint8_t, obscura::crypto::g_kDigestBytes + kSaltBytes> salted{};
    auto wipeSalted{ scopeWipeObject(salted) };
    std::memcpy(salted.data(), contentDigest.data(), contentDigest.size());
    std::memcpy(salted.data() + contentDigest.size(), m_salt.data(), m_salt.size());

    obscura::crypto::Digest saltedDigest{};
    auto wipeSaltedDigest{ scopeWipeObject(saltedDigest) };
    m_provider->digest(std::as_bytes(std::span{ salted }), saltedDigest);

    return foldToSizeT(std::span<const std::uint8_t>{ saltedDigest });
}

} // namespace obscura::security
