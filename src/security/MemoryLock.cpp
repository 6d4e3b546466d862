#include "obscura/security/MemoryLock.hpp"

#include <atomic>
#include <cstdint>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__unix__) || defined(__APPLE__)
#include <sys/mman.h>
#include <unistd.h>
#endif

// Core-dump exclusion: Linux MADV_DONTDUMP/MADV_DODUMP, FreeBSD MADV_NOCORE/MADV_CORE.
#if defined(__linux__) && defined(MADV_DONTDUMP) && defined(MADV_DODUMP)
#define OBSC_DUMP_EXCLUDE MADV_DONTDUMP
#define OBSC_DUMP_INCLUDE MADV_DODUMP
#elif defined(__FreeBSD__) && defined(MADV_NOCORE) && defined(MADV_CORE)
#define OBSC_DUMP_EXCLUDE MADV_NOCORE
#define OBSC_DUMP_INCLUDE MADV_CORE
#endif

namespace obscura::security
{
namespace
{
std::atomic<std::uint64_t> g_lockFailures{};

#if defined(OBSC_DUMP_EXCLUDE)
struct PageRange final
{
    void* begin;
    std::size_t length;
};

// madvise() only accepts page-aligned ranges.
PageRange coveringPages(void* p, std::size_t bytes) noexcept
{
    const std::uintptr_t page{ systemPageSize() };
    const std::uintptr_t first{ reinterpret_cast<std::uintptr_t>(p) & ~(page - 1U) };
    const std::uintptr_t last{ (reinterpret_cast<std::uintptr_t>(p) + bytes + page - 1U) & ~(page - 1U) };
    return PageRange{ reinterpret_cast<void*>(first), static_cast<std::size_t>(last - first) };
}

void adviseDump(void* p, std::size_t bytes, bool include) noexcept
{
    const PageRange range{ coveringPages(p, bytes) };
    // Advisory only; the lock itself is what matters.
    (void)::madvise(range.begin, range.length, include ? OBSC_DUMP_INCLUDE : OBSC_DUMP_EXCLUDE);
}
#endif
} // namespace

LockStatus lockMemory(void* p, std::size_t bytes) noexcept
{
    if (p == nullptr || bytes == 0U)
    {
        return LockStatus::Locked;
    }
#if defined(_WIN32)
    if (::VirtualLock(p, bytes) == 0)
    {
        g_lockFailures.fetch_add(1U, std::memory_order_relaxed);
        return LockStatus::Failed;
    }
    return LockStatus::Locked;
#elif defined(__unix__) || defined(__APPLE__)
#if defined(OBSC_DUMP_EXCLUDE)
    adviseDump(p, bytes, false);
#endif
    if (::mlock(p, bytes) != 0)
    {
        g_lockFailures.fetch_add(1U, std::memory_order_relaxed);
        return LockStatus::Failed;
    }
    return LockStatus::Locked;
#else
    return LockStatus::Unsupported;
#endif
}

void unlockMemory(void* p, std::size_t bytes) noexcept
{
    if (p == nullptr || bytes == 0U)
    {
        return;
    }
#if defined(_WIN32)
    (void)::VirtualUnlock(p, bytes);
#elif defined(__unix__) || defined(__APPLE__)
    (void)::munlock(p, bytes);
#if defined(OBSC_DUMP_EXCLUDE)
    adviseDump(p, bytes, true);
#endif
#endif
}

bool dumpExclusionSupported() noexcept
{
#if defined(OBSC_DUMP_EXCLUDE)
    return true;
#else
    return false;
#endif
}

std::uint64_t memoryLockFailureCount() noexcept
{
    return g_lockFailures.load(std::memory_order_relaxed);
}

std::size_t systemPageSize() noexcept
{
    constexpr std::size_t kFallbackPageSize{ 4096U };
#if defined(_WIN32)
    SYSTEM_INFO info{};
    ::GetSystemInfo(&info);
    return (info.dwPageSize != 0U) ? static_cast<std::size_t>(info.dwPageSize) : kFallbackPageSize;
#elif defined(__unix__) || defined(__APPLE__)
    const long page{ ::sysconf(_SC_PAGESIZE) };
    return (page > 0) ? static_cast<std::size_t>(page) : kFallbackPageSize;
#else
    return kFallbackPageSize;
#endif
}

} // namespace obscura::security
