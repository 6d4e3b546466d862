#include "obscura/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#else
#error Unsupported platform
#endif

namespace obscura::security
{
namespace
{
// Reads up to len bytes. Returns the number written, or 0 on a hard failure.
std::size_t readOsEntropy(std::uint8_t* out, std::size_t len) noexcept
{
#if defined(_WIN32)
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    const std::size_t chunk{ (len > kMaxChunk) ? kMaxChunk : len };
    const NTSTATUS status{ ::BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out), static_cast<ULONG>(chunk),
                                             BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status) ? chunk : 0U;
#elif defined(__linux__)
    for (;;)
    {
        const ssize_t received{ ::getrandom(out, len, 0) };
        if (received > 0)
        {
            const auto n{ static_cast<std::size_t>(received) };
            return (n <= len) ? n : 0U;
        }
        if (received < 0 && errno == EINTR)
        {
            continue;
        }
        return 0U;
    }
#else
    // arc4random_buf() cannot fail.
    ::arc4random_buf(out, len);
    return len;
#endif
}
} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t filled{};
    while (filled < out.size())
    {
        const std::size_t n{ readOsEntropy(out.data() + filled, out.size() - filled) };
        if (n == 0U)
        {
            return false;
        }
        filled += n;
    }
    return true;
}

} // namespace obscura::security
