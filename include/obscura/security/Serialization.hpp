#ifndef INCLUDE_OBSCURA_SECURITY_SERIALIZATION_HPP
#define INCLUDE_OBSCURA_SECURITY_SERIALIZATION_HPP

#if !defined(OBSC_ENABLE_SERIALIZATION)
#error "obscura/security/Serialization.hpp requires OBSC_ENABLE_SERIALIZATION"
#endif

#include "obscura/security/SecretUtf8.hpp"
#include "obscura/security/SecretVec.hpp"
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>

// Encode/decode hooks for an external serialization framework. Secrets leave the container
// unredacted on this path: a caller who encodes a secret has chosen to expose it.
// Byte buffers map to a byte string and text to a text string (CBOR major types 2 and 3).
namespace obscura::security
{

template <typename E>
concept ByteStringEncoder = requires(E& e, std::span<const std::uint8_t> bytes) { e.writeBytes(bytes); };

template <typename E>
concept TextStringEncoder = requires(E& e, std::string_view text) { e.writeText(text); };

template <ByteStringEncoder Encoder> void encodeSecret(Encoder& encoder, const SecretBytes& secret)
{
    encoder.writeBytes(secret.unsecure());
}

template <TextStringEncoder Encoder> void encodeSecret(Encoder& encoder, const SecretUtf8& secret)
{
    encoder.writeText(secret.unsecure());
}

// The decoded view is copied into fresh locked storage; wiping the decoder's own buffer is up to
// the framework.
[[nodiscard]] inline SecretBytes decodeSecretBytes(std::span<const std::uint8_t> decoded)
{
    return SecretBytes(decoded);
}

// Throws std::invalid_argument if decoded is not valid UTF-8.
[[nodiscard]] inline SecretUtf8 decodeSecretUtf8(std::string_view decoded)
{
    return SecretUtf8{ decoded };
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SERIALIZATION_HPP
