#include "obscura/crypto/providers/OpenSslProviderFactory.hpp"
#include <cstddef>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

namespace obscura::crypto::providers
{
namespace
{

using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpMdPtr fetchBlake2b512()
{
    if (EVP_MD * md{ EVP_MD_fetch(nullptr, "BLAKE2B-512", nullptr) }; md != nullptr)
    {
        return EvpMdPtr{ md, &EVP_MD_free };
    }
    return EvpMdPtr{ nullptr, &EVP_MD_free };
}

class OpenSslDigestProvider final : public obscura::crypto::IDigestProvider
{
public:
    OpenSslDigestProvider() : m_blake2b{ fetchBlake2b512() }
    {
        if (!m_blake2b)
        {
            throw std::runtime_error("OpenSslDigestProvider: BLAKE2B-512 not available");
        }
        if (EVP_MD_get_size(m_blake2b.get()) != static_cast<int>(obscura::crypto::g_kDigestBytes))
        {
            throw std::runtime_error("OpenSslDigestProvider: unexpected BLAKE2B-512 digest size");
        }
    }

    void digest(std::span<const std::byte> input, obscura::crypto::Digest& out) const override
    {
        // EVP_MD_CTX_free cleanses the context state.
        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("digest: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_blake2b.get(), nullptr) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestInit_ex2 failed");
        }
        if (!input.empty() && EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1)
        {
            throw std::runtime_error("digest: EVP_DigestUpdate failed");
        }
        unsigned int written{};
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
        {
            throw std::runtime_error("digest: EVP_DigestFinal_ex failed");
        }
    }

private:
    EvpMdPtr m_blake2b;
};

} // namespace

[[nodiscard]] std::unique_ptr<obscura::crypto::IDigestProvider> makeOpenSslDigestProvider()
{
    return std::make_unique<OpenSslDigestProvider>();
}

} // namespace obscura::crypto::providers
