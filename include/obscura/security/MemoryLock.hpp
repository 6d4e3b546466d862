#ifndef INCLUDE_OBSCURA_SECURITY_MEMORYLOCK_HPP
#define INCLUDE_OBSCURA_SECURITY_MEMORYLOCK_HPP

#include <cstddef>
#include <cstdint>

namespace obscura::security
{
enum class LockStatus : std::uint8_t
{
    Locked,
    Failed,
    Unsupported,
};

// Best effort: pins the pages covering [p, p + bytes) in RAM and, where the platform supports it,
// excludes them from core dumps. Failures are reported, never thrown.
[[nodiscard]] LockStatus lockMemory(void* p, std::size_t bytes) noexcept;

// Reverses lockMemory(). Unlocking a region that was never locked is harmless.
void unlockMemory(void* p, std::size_t bytes) noexcept;

// True where lockMemory() also excludes the pages from core dumps (Linux, FreeBSD).
[[nodiscard]] bool dumpExclusionSupported() noexcept;

// Number of lockMemory() calls that failed in this process.
[[nodiscard]] std::uint64_t memoryLockFailureCount() noexcept;

[[nodiscard]] std::size_t systemPageSize() noexcept;

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_MEMORYLOCK_HPP
