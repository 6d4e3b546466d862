#if defined(__APPLE__)
#define __STDC_WANT_LIB_EXT1__ 1
#endif

#include "obscura/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__) || defined(__APPLE__)
#include <string.h>
#endif

namespace obscura::security
{
namespace
{
// Last resort: stores through a volatile pointer may not be elided.
void volatileZero(std::byte* p, std::size_t n) noexcept
{
    volatile std::byte* out{ p };
    while (n-- != 0U)
    {
        *out++ = std::byte{};
    }
}
} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    ::explicit_bzero(bytes.data(), bytes.size());
#elif defined(__NetBSD__)
    (void)::explicit_memset(bytes.data(), 0, bytes.size());
#elif defined(__APPLE__)
    if (::memset_s(bytes.data(), bytes.size(), 0, bytes.size()) != 0)
    {
        volatileZero(bytes.data(), bytes.size());
    }
#else
    volatileZero(bytes.data(), bytes.size());
#endif
}
} // namespace obscura::security
