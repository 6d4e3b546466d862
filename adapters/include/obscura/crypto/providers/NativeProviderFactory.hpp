#ifndef INCLUDE_OBSCURA_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_OBSCURA_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "obscura/crypto/IDigestProvider.hpp"
#include <memory>

namespace obscura::crypto::providers
{

[[nodiscard]] std::unique_ptr<obscura::crypto::IDigestProvider> makeNativeDigestProvider();

} // namespace obscura::crypto::providers

#endif // INCLUDE_OBSCURA_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
