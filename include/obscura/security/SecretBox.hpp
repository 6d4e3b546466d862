#ifndef INCLUDE_OBSCURA_SECURITY_SECRETBOX_HPP
#define INCLUDE_OBSCURA_SECURITY_SECRETBOX_HPP

#include "obscura/security/LockedAllocator.hpp"
#include "obscura/security/MemoryLock.hpp"
#include "obscura/security/MemoryWiper.hpp"
#include "obscura/security/PaddingFree.hpp"
#include "obscura/security/Redacted.hpp"
#include "obscura/security/SecureEquals.hpp"
#include <cstddef>
#include <new>
#include <ostream>
#include <span>
#include <type_traits>
#include <utility>

namespace obscura::security
{
// A single secret value in its own locked allocation.
//
// Disposal never runs ~T: the storage is handled as untyped bytes, wiped, unlocked and freed.
// The all-zero pattern may not be a valid T, so no T-level logic ever sees the wiped bytes.
// T must therefore be trivially destructible; skipping its destructor must not leak anything.
template <typename T>
    requires(std::is_trivially_destructible_v<T> && !std::is_const_v<T> && !std::is_reference_v<T>)
class SecretBox final
{
public:
    using value_type = T;

    // The value is copied into locked storage. A trivially copyable source is wiped afterwards.
    explicit SecretBox(T&& value)
    {
        emplace(std::move(value));
        if constexpr (std::is_trivially_copyable_v<T>)
        {
            secureWipeObject(value);
        }
    }

    template <typename... Args> explicit SecretBox(std::in_place_t, Args&&... args)
    {
        emplace(std::forward<Args>(args)...);
    }

    SecretBox(const SecretBox& other)
        requires std::is_copy_constructible_v<T>
    {
        if (other.m_value != nullptr)
        {
            emplace(*other.m_value);
        }
    }

    SecretBox(SecretBox&& other) noexcept
        : m_storage{ std::exchange(other.m_storage, nullptr) }, m_value{ std::exchange(other.m_value, nullptr) },
          m_lockStatus{ std::exchange(other.m_lockStatus, LockStatus::Locked) }
    {
    }

    SecretBox& operator=(const SecretBox& other)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &other)
        {
            SecretBox copy{ other };
            swap(copy);
        }
        return *this;
    }

    SecretBox& operator=(SecretBox&& other) noexcept
    {
        if (this != &other)
        {
            release();
            m_storage = std::exchange(other.m_storage, nullptr);
            m_value = std::exchange(other.m_value, nullptr);
            m_lockStatus = std::exchange(other.m_lockStatus, LockStatus::Locked);
        }
        return *this;
    }

    ~SecretBox() noexcept
    {
        release();
    }

    // Precondition for both accessors: hasValue().
    [[nodiscard]] const T& unsecure() const noexcept
    {
        return *m_value;
    }

    [[nodiscard]] T& unsecureMut() noexcept
    {
        return *m_value;
    }

    // False only for a moved-from box.
    [[nodiscard]] bool hasValue() const noexcept
    {
        return m_value != nullptr;
    }

    // Overwrites the live value with zero bytes.
    //
    // Precondition: the all-zero bit pattern is a valid value of T. This is not checked; calling it
    // for a T where zero is not a valid representation is undefined behaviour.
    void zeroOutUnchecked() noexcept
    {
        if (m_storage != nullptr)
        {
            secureWipe(std::span<std::byte>{ m_storage, sizeof(T) });
        }
    }

    [[nodiscard]] LockStatus lockStatus() const noexcept
    {
        return m_lockStatus;
    }

    [[nodiscard]] bool isLocked() const noexcept
    {
        return m_lockStatus == LockStatus::Locked;
    }

    void swap(SecretBox& other) noexcept
    {
        std::swap(m_storage, other.m_storage);
        std::swap(m_value, other.m_value);
        std::swap(m_lockStatus, other.m_lockStatus);
    }

    friend void swap(SecretBox& a, SecretBox& b) noexcept
    {
        a.swap(b);
    }

    [[nodiscard]] friend bool operator==(const SecretBox& a, const SecretBox& b) noexcept
        requires PaddingFree<T>
    {
        if (a.m_value == nullptr || b.m_value == nullptr)
        {
            return a.m_value == b.m_value;
        }
        return secureEquals(objectBytes(*a.m_value), objectBytes(*b.m_value));
    }

    friend std::ostream& operator<<(std::ostream& os, [[maybe_unused]] const SecretBox& b)
    {
        return os << g_kRedacted;
    }

private:
    // Locked regions are page aligned; every supported platform has pages of at least 4 KiB.
    static_assert(alignof(T) <= 4096U, "SecretBox: over-aligned types are not supported");

    template <typename... Args> void emplace(Args&&... args)
    {
        const LockedAllocation<std::byte> allocation{ LockedAllocator<std::byte>{}.allocateLocked(sizeof(T)) };
        try
        {
            m_value = ::new (static_cast<void*>(allocation.data)) T(std::forward<Args>(args)...);
        }
        catch (...)
        {
            LockedAllocator<std::byte>{}.deallocate(allocation.data, sizeof(T));
            throw;
        }
        m_storage = allocation.data;
        m_lockStatus = allocation.status;
    }

    // ~T is deliberately not called: the storage goes back as raw bytes.
    void release() noexcept
    {
        if (m_storage != nullptr)
        {
            m_value = nullptr;
            LockedAllocator<std::byte>{}.deallocate(m_storage, sizeof(T));
        }
        m_storage = nullptr;
        m_value = nullptr;
        m_lockStatus = LockStatus::Locked;
    }

    std::byte* m_storage{ nullptr };
    T* m_value{ nullptr };
    LockStatus m_lockStatus{ LockStatus::Locked };
};

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SECRETBOX_HPP
