#ifndef INCLUDE_OBSCURA_SECURITY_SECRETVEC_HPP
#define INCLUDE_OBSCURA_SECURITY_SECRETVEC_HPP

#include "obscura/security/LockedAllocator.hpp"
#include "obscura/security/MemoryLock.hpp"
#include "obscura/security/MemoryWiper.hpp"
#include "obscura/security/PaddingFree.hpp"
#include "obscura/security/Redacted.hpp"
#include "obscura/security/SecureEquals.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace obscura::security
{
namespace detail
{
[[noreturn]] inline void indexOutOfRange(const char* what) noexcept
{
    std::fputs(what, stderr);
    std::fputc('\n', stderr);
    std::terminate();
}
} // namespace detail

// Resizable buffer for secret material.
//
// The allocation is page-locked for its whole lifetime. Whenever it is given back (destruction, or
// growth through resize()) the entire capacity is wiped first, not only the live elements.
// Equality is constant time for equal lengths and only exists for PaddingFree element types.
// Streaming or formatting a SecretVec always yields "***SECRET***".
template <typename T>
    requires std::is_trivially_copyable_v<T>
class SecretVec final
{
public:
    using value_type = T;
    using size_type = std::size_t;

    SecretVec() noexcept = default;

    // Takes over the content of owned. The source buffer is wiped and left empty.
    explicit SecretVec(std::vector<T>&& owned) : SecretVec(std::span<const T>{ owned })
    {
        secureWipe(std::span<T>{ owned });
        owned.clear();
    }

    explicit SecretVec(std::span<const T> content) : SecretVec(ExactCapacity{}, content.size())
    {
        if (!content.empty())
        {
            std::memcpy(m_data, content.data(), content.size_bytes());
        }
        m_size = content.size();
    }

    SecretVec(std::initializer_list<T> init) : SecretVec(std::span<const T>{ init.begin(), init.size() })
    {
    }

    SecretVec(size_type count, const T& fill) : SecretVec(ExactCapacity{}, count)
    {
        for (size_type i{}; i < count; ++i)
        {
            std::memcpy(m_data + i, &fill, sizeof(T));
        }
        m_size = count;
    }

    SecretVec(const SecretVec& other) : SecretVec(other.unsecure())
    {
    }

    SecretVec(SecretVec&& other) noexcept
        : m_data{ std::exchange(other.m_data, nullptr) }, m_size{ std::exchange(other.m_size, 0U) },
          m_capacity{ std::exchange(other.m_capacity, 0U) },
          m_lockStatus{ std::exchange(other.m_lockStatus, LockStatus::Locked) }
    {
    }

    SecretVec& operator=(const SecretVec& other)
    {
        if (this != &other)
        {
            SecretVec copy{ other };
            swap(copy);
        }
        return *this;
    }

    SecretVec& operator=(SecretVec&& other) noexcept
    {
        if (this != &other)
        {
            release();
            m_data = std::exchange(other.m_data, nullptr);
            m_size = std::exchange(other.m_size, 0U);
            m_capacity = std::exchange(other.m_capacity, 0U);
            m_lockStatus = std::exchange(other.m_lockStatus, LockStatus::Locked);
        }
        return *this;
    }

    ~SecretVec() noexcept
    {
        release();
    }

    [[nodiscard]] std::span<const T> unsecure() const noexcept
    {
        return std::span<const T>{ m_data, m_size };
    }

    [[nodiscard]] std::span<T> unsecureMut() noexcept
    {
        return std::span<T>{ m_data, m_size };
    }

    // An index at or past size() terminates the process. The capacity beyond size() may still hold
    // the bytes of a longer previous content, so it is never readable through indexing.
    [[nodiscard]] const T& operator[](size_type i) const noexcept
    {
        if (i >= m_size)
        {
            detail::indexOutOfRange("SecretVec::operator[]: index out of range");
        }
        return m_data[i];
    }

    [[nodiscard]] T& operator[](size_type i) noexcept
    {
        if (i >= m_size)
        {
            detail::indexOutOfRange("SecretVec::operator[]: index out of range");
        }
        return m_data[i];
    }

    // Recoverable variant of operator[].
    [[nodiscard]] const T& at(size_type i) const
    {
        if (i >= m_size)
        {
            throw std::out_of_range("SecretVec::at: index out of range");
        }
        return m_data[i];
    }

    [[nodiscard]] T& at(size_type i)
    {
        if (i >= m_size)
        {
            throw std::out_of_range("SecretVec::at: index out of range");
        }
        return m_data[i];
    }

    // Elements in [first, last). A range outside [0, size()] terminates, like operator[].
    [[nodiscard]] std::span<const T> slice(size_type first, size_type last) const noexcept
    {
        if (first > last || last > m_size)
        {
            detail::indexOutOfRange("SecretVec::slice: range out of bounds");
        }
        return unsecure().subspan(first, last - first);
    }

    // Shrinking only moves the logical end; the tail stays in the locked capacity until zeroOut() or
    // destruction. Growing moves the content into a fresh locked allocation of exactly newLen
    // elements and wipes the old one.
    void resize(size_type newLen, const T& fill)
    {
        if (newLen <= m_size)
        {
            m_size = newLen;
            return;
        }

        // Parentheses: braces would select the initializer_list constructor.
        SecretVec grown(newLen, fill);
        if (m_size != 0U)
        {
            std::memcpy(grown.m_data, m_data, m_size * sizeof(T));
        }
        swap(grown);
    }

    // Wipes the whole capacity and empties the buffer. The allocation itself is kept.
    void zeroOut() noexcept
    {
        secureWipe(std::span<T>{ m_data, m_capacity });
        m_size = 0U;
    }

    [[nodiscard]] size_type size() const noexcept
    {
        return m_size;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_size == 0U;
    }

    [[nodiscard]] size_type capacity() const noexcept
    {
        return m_capacity;
    }

    [[nodiscard]] LockStatus lockStatus() const noexcept
    {
        return m_lockStatus;
    }

    // True when the allocation, if there is one, is pinned in RAM.
    [[nodiscard]] bool isLocked() const noexcept
    {
        return m_lockStatus == LockStatus::Locked;
    }

    // The full capacity as raw bytes, including the part past size().
    [[nodiscard]] std::span<const std::byte> allocationBytes() const noexcept
    {
        return std::as_bytes(std::span<const T>{ m_data, m_capacity });
    }

    void swap(SecretVec& other) noexcept
    {
        std::swap(m_data, other.m_data);
        std::swap(m_size, other.m_size);
        std::swap(m_capacity, other.m_capacity);
        std::swap(m_lockStatus, other.m_lockStatus);
    }

    friend void swap(SecretVec& a, SecretVec& b) noexcept
    {
        a.swap(b);
    }

    [[nodiscard]] friend bool operator==(const SecretVec& a, const SecretVec& b) noexcept
        requires PaddingFree<T>
    {
        if (a.m_size != b.m_size)
        {
            return false;
        }
        return secureEquals(objectBytes(a.unsecure()), objectBytes(b.unsecure()));
    }

    friend std::ostream& operator<<(std::ostream& os, [[maybe_unused]] const SecretVec& v)
    {
        return os << g_kRedacted;
    }

private:
    struct ExactCapacity final
    {
    };

    SecretVec(ExactCapacity, size_type count)
    {
        const LockedAllocation<T> allocation{ LockedAllocator<T>{}.allocateLocked(count) };
        m_data = allocation.data;
        m_capacity = allocation.count;
        m_lockStatus = allocation.status;
    }

    void release() noexcept
    {
        if (m_data != nullptr)
        {
            LockedAllocator<T>{}.deallocate(m_data, m_capacity);
        }
        m_data = nullptr;
        m_size = 0U;
        m_capacity = 0U;
        m_lockStatus = LockStatus::Locked;
    }

    T* m_data{ nullptr };
    size_type m_size{};
    size_type m_capacity{};
    LockStatus m_lockStatus{ LockStatus::Locked };
};

using SecretBytes = SecretVec<std::uint8_t>;

// Copies the bytes of s. The caller stays responsible for wiping s.
[[nodiscard]] inline SecretBytes secretBytesFrom(std::string_view s)
{
    return SecretBytes(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(s.data()), s.size() });
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_SECRETVEC_HPP
