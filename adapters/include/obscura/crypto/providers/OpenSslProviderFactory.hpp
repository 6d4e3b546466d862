#ifndef INCLUDE_OBSCURA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_OBSCURA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "obscura/crypto/IDigestProvider.hpp"
#include <memory>

namespace obscura::crypto::providers
{

// Throws std::runtime_error if the linked OpenSSL has no BLAKE2B-512 digest.
[[nodiscard]] std::unique_ptr<obscura::crypto::IDigestProvider> makeOpenSslDigestProvider();

} // namespace obscura::crypto::providers

#endif // INCLUDE_OBSCURA_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
