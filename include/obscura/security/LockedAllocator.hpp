#ifndef INCLUDE_OBSCURA_SECURITY_LOCKEDALLOCATOR_HPP
#define INCLUDE_OBSCURA_SECURITY_LOCKEDALLOCATOR_HPP

#include "obscura/security/MemoryLock.hpp"
#include "obscura/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace obscura::security
{
namespace detail
{
// Every locked region starts on a page boundary and spans whole pages, so unlocking one region
// can never unlock (or re-enable core dumps for) a page that another live region still uses.
[[nodiscard]] inline std::size_t lockedRegionBytes(std::size_t count, std::size_t elementSize)
{
    if (count > (std::numeric_limits<std::size_t>::max() / elementSize))
    {
        throw std::bad_array_new_length{};
    }
    const std::size_t bytes{ count * elementSize };
    const std::size_t page{ systemPageSize() };
    if (bytes > (std::numeric_limits<std::size_t>::max() - (page - 1U)))
    {
        throw std::bad_array_new_length{};
    }
    return ((bytes + page - 1U) / page) * page;
}

[[nodiscard]] inline std::size_t lockedRegionBytesNoThrow(std::size_t count, std::size_t elementSize) noexcept
{
    const std::size_t page{ systemPageSize() };
    return (((count * elementSize) + page - 1U) / page) * page;
}
} // namespace detail

template <class T> struct LockedAllocation final
{
    T* data{ nullptr };
    std::size_t count{};
    LockStatus status{ LockStatus::Locked };
};

template <class T> struct LockedAllocator
{
    LockedAllocator() noexcept = default;

    template <class U> constexpr explicit LockedAllocator([[maybe_unused]] const LockedAllocator<U>& u) noexcept {};

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    // The returned storage is zero-filled and, on a best-effort basis, locked.
    [[nodiscard]] LockedAllocation<T> allocateLocked(std::size_t n)
    {
        if (n == 0U)
        {
            return {};
        }
        const std::size_t regionBytes{ detail::lockedRegionBytes(n, sizeof(T)) };
        void* region{ ::operator new(regionBytes, std::align_val_t{ regionAlignment() }) };
        std::memset(region, 0, regionBytes);
        const LockStatus status{ lockMemory(region, regionBytes) };
        return LockedAllocation<T>{ .data = static_cast<T*>(region), .count = n, .status = status };
    }

    T* allocate(std::size_t n)
    {
        return allocateLocked(n).data;
    }

    // Wipes the whole page-rounded region, not only the n elements the caller used.
    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }

        const std::size_t regionBytes{ detail::lockedRegionBytesNoThrow(n, sizeof(T)) };
        void* region{ static_cast<void*>(p) };
        if (regionBytes != 0U)
        {
            secureWipe(std::span<std::byte>{ static_cast<std::byte*>(region), regionBytes });
            unlockMemory(region, regionBytes);
        }
        ::operator delete(region, std::align_val_t{ regionAlignment() });
    }

private:
    [[nodiscard]] static std::size_t regionAlignment() noexcept
    {
        const std::size_t page{ systemPageSize() };
        return (page >= alignof(T)) ? page : alignof(T);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const LockedAllocator<T>& t,
                          [[maybe_unused]] const LockedAllocator<U>& u) noexcept
{
    return true;
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_LOCKEDALLOCATOR_HPP
