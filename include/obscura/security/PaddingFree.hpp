#ifndef INCLUDE_OBSCURA_SECURITY_PADDINGFREE_HPP
#define INCLUDE_OBSCURA_SECURITY_PADDINGFREE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <tuple>
#include <type_traits>

namespace obscura::security
{
namespace detail
{
template <typename T, typename... Us> inline constexpr bool g_kIsOneOf{ (std::is_same_v<T, Us> || ...) };

template <std::size_t N>
inline constexpr bool g_kIsListedArrayLength{ N <= 32U || N == 64U || N == 128U || N == 256U || N == 512U ||
                                              N == 1024U || N == 2048U || N == 4096U };

template <typename T>
struct PaddingFreeTraits
    : std::bool_constant<g_kIsOneOf<T, std::int8_t, std::int16_t, std::int32_t, std::int64_t, std::uint8_t,
                                    std::uint16_t, std::uint32_t, std::uint64_t, float, double, char32_t, std::tuple<>>>
{
    // Bytes that carry the value. Zero for the unit type, whose single byte is never initialized.
    static constexpr std::size_t kRepresentationBytes{ std::is_same_v<T, std::tuple<>> ? 0U : sizeof(T) };
};

template <typename U, std::size_t N>
struct PaddingFreeTraits<std::array<U, N>>
    : std::bool_constant<g_kIsListedArrayLength<N> && PaddingFreeTraits<U>::value>
{
    // std::array<U, 0> still occupies one indeterminate byte.
    static constexpr std::size_t kRepresentationBytes{ N * PaddingFreeTraits<U>::kRepresentationBytes };
};
} // namespace detail

// Closed allow-list of element types whose object representation has no padding, so raw bytes may be
// compared and hashed. This is a concept rather than a trait: it cannot be specialized from outside.
template <typename T>
concept PaddingFree = detail::PaddingFreeTraits<std::remove_cv_t<T>>::value;

template <PaddingFree T>
inline constexpr std::size_t g_kRepresentationBytes{ detail::PaddingFreeTraits<std::remove_cv_t<T>>::kRepresentationBytes };

template <PaddingFree T> [[nodiscard]] std::span<const std::byte> objectBytes(const T& value) noexcept
{
    if constexpr (g_kRepresentationBytes<T> == 0U)
    {
        return {};
    }
    else
    {
        static_assert(g_kRepresentationBytes<T> == sizeof(T), "padding-free type must have no trailing bytes");
        return std::as_bytes(std::span<const T, 1>{ &value, 1 });
    }
}

// Bytes of a contiguous run of elements.
template <PaddingFree T> [[nodiscard]] std::span<const std::byte> objectBytes(std::span<const T> elements) noexcept
{
    if constexpr (g_kRepresentationBytes<T> == 0U)
    {
        return {};
    }
    else
    {
        static_assert(g_kRepresentationBytes<T> == sizeof(T), "padding-free type must have no trailing bytes");
        return std::as_bytes(elements);
    }
}

} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_PADDINGFREE_HPP
