#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "obscura/security/MemoryWiper.hpp"

namespace
{

struct NonTrivial
{
public:
    NonTrivial() = default;
    ~NonTrivial() = default;

private:
    std::unique_ptr<int> m_p;
};

template <typename T>
concept CanSecureWipe = requires(T buffer) { obscura::security::secureWipe(buffer); };

static_assert(!CanSecureWipe<std::span<const std::uint32_t>>);
static_assert(!CanSecureWipe<std::span<NonTrivial>>);
static_assert(CanSecureWipe<std::span<char32_t>>);

} // namespace

TEST(MemoryWiper, ZerosByteSpan)
{
    constexpr std::size_t byteCount{ 64U };
    constexpr std::byte nonZeroByte{ std::byte{ 0xA5 } };

    std::array<std::byte, byteCount> bytes{};
    bytes.fill(nonZeroByte);

    obscura::security::secureWipe(std::span{ bytes });

    for (const auto b : bytes)
    {
        EXPECT_EQ(b, std::byte{});
    }
}

TEST(MemoryWiper, ZerosTypedSpanViaTemplate)
{
    constexpr std::size_t wordCount{ 16U };
    constexpr std::uint32_t nonZeroWord{ 0xDEADBEEFU };

    std::array<std::uint32_t, wordCount> words{};
    words.fill(nonZeroWord);

    const std::span<std::uint32_t> wordsSpan{ words };
    obscura::security::secureWipe(wordsSpan);

    for (const auto b : std::as_bytes(wordsSpan))
    {
        EXPECT_EQ(b, std::byte{});
    }
}

TEST(MemoryWiper, ZerosSingleObject)
{
    struct Key
    {
        std::uint64_t hi;
        std::uint64_t lo;
    };
    Key key{ .hi = 0x0123456789ABCDEFULL, .lo = 0xFEDCBA9876543210ULL };

    obscura::security::secureWipeObject(key);

    EXPECT_EQ(key.hi, 0U);
    EXPECT_EQ(key.lo, 0U);
}

TEST(MemoryWiper, WipesOnlyTheGivenRange)
{
    constexpr std::uint8_t marker{ 0x5AU };
    std::array<std::uint8_t, 8> bytes{};
    bytes.fill(marker);

    obscura::security::secureWipe(std::span{ bytes }.subspan(2U, 4U));

    EXPECT_EQ(bytes[0], marker);
    EXPECT_EQ(bytes[1], marker);
    for (std::size_t i{ 2U }; i < 6U; ++i)
    {
        EXPECT_EQ(bytes[i], 0U);
    }
    EXPECT_EQ(bytes[6], marker);
    EXPECT_EQ(bytes[7], marker);
}

TEST(MemoryWiper, EmptySpanIsNoOp)
{
    obscura::security::secureWipe(std::span<std::byte>{});
}
