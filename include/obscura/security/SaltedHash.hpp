#ifndef INCLUDE_OBSCURA_SECURITY_SALTEDHASH_HPP
#define INCLUDE_OBSCURA_SECURITY_SALTEDHASH_HPP

#include "obscura/crypto/IDigestProvider.hpp"
#include "obscura/security/PaddingFree.hpp"
#include "obscura/security/SecretBox.hpp"
#include "obscura/security/SecretUtf8.hpp"
#include "obscura/security/SecretVec.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace obscura::security
{
// Hasher for unordered containers keyed by secrets.
//
// Never exposes a stable digest of the content: the value is
//   BLAKE2b-512( BLAKE2b-512(content) || salt )
// truncated to size_t, where salt is drawn from the OS CSPRNG when the hasher is constructed.
// Two hashers (two tables) therefore disagree on every input. Copies keep the salt.
//
// There is intentionally no std::hash specialization for the secret containers.
class SaltedSecretHash final
{
public:
    static constexpr std::size_t kSaltBytes{ 32 };

    // Uses the native BLAKE2b provider. Throws std::runtime_error if the CSPRNG fails.
    SaltedSecretHash();
    explicit SaltedSecretHash(std::shared_ptr<const obscura::crypto::IDigestProvider> provider);

    SaltedSecretHash(const SaltedSecretHash&) = default;
    SaltedSecretHash(SaltedSecretHash&&) noexcept = default;
    SaltedSecretHash& operator=(const SaltedSecretHash&) = default;
    SaltedSecretHash& operator=(SaltedSecretHash&&) noexcept = default;
    ~SaltedSecretHash() noexcept;

    [[nodiscard]] std::size_t hashBytes(std::span<const std::byte> content) const;

    template <PaddingFree T> [[nodiscard]] std::size_t operator()(const SecretVec<T>& v) const
    {
        return hashBytes(objectBytes(v.unsecure()));
    }

    template <PaddingFree T> [[nodiscard]] std::size_t operator()(const SecretBox<T>& b) const
    {
        if (!b.hasValue())
        {
            return hashBytes({});
        }
        return hashBytes(objectBytes(b.unsecure()));
    }

    [[nodiscard]] std::size_t operator()(const SecretUtf8& s) const
    {
        return hashBytes(objectBytes(s.bytes().unsecure()));
    }

private:
    std::shared_ptr<const obscura::crypto::IDigestProvider> m_provider;
    std::array<std::uint8_t, kSaltBytes> m_salt{};
};

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SALTEDHASH_HPP
