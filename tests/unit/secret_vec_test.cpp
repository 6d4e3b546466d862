#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "obscura/security/SecretVec.hpp"
#include "test_utils/TestUtils.hpp"

using obscura::security::SecretBytes;
using obscura::security::SecretVec;
using obscura::security::secretBytesFrom;

namespace
{
template <typename T>
concept Comparable = requires(const T& a, const T& b) { a == b; };

struct Pair
{
    std::uint8_t a;
    std::uint32_t b;
};

static_assert(Comparable<SecretBytes>);
static_assert(Comparable<SecretVec<char32_t>>);
static_assert(!Comparable<SecretVec<Pair>>);
static_assert(!Comparable<SecretVec<bool>>);

std::vector<std::uint8_t> toVector(const SecretBytes& secret)
{
    const auto view{ secret.unsecure() };
    return std::vector<std::uint8_t>(view.begin(), view.end());
}
} // namespace

TEST(SecretVec, FromStringEqualsFromVector)
{
    const SecretBytes fromString{ secretBytesFrom("hello") };
    const SecretBytes fromVector{ std::vector<std::uint8_t>{ 'h', 'e', 'l', 'l', 'o' } };

    EXPECT_EQ(fromString, fromVector);
    EXPECT_EQ(toVector(fromString), obscura::test_utils::bytesOf("hello"));
}

TEST(SecretVec, ZeroOutWipesAllocation)
{
    SecretBytes secret{ secretBytesFrom("hello") };
    secret.zeroOut();

    EXPECT_TRUE(secret.empty());
    const auto allocation{ secret.allocationBytes() };
    ASSERT_GE(allocation.size(), 5U);
    EXPECT_TRUE(obscura::test_utils::allZero(allocation.first(5U)));
}

TEST(SecretVec, ZeroOutWipesShrunkTail)
{
    SecretBytes secret{ secretBytesFrom("correct horse") };
    secret.resize(3U, 0U);

    // The tail survives a shrink and is only gone after zeroOut().
    EXPECT_FALSE(obscura::test_utils::allZero(secret.allocationBytes().subspan(3U)));

    secret.zeroOut();
    EXPECT_EQ(secret.allocationBytes().size(), 13U);
    EXPECT_TRUE(obscura::test_utils::allZero(secret.allocationBytes()));

    secret.zeroOut();
    EXPECT_TRUE(secret.empty());
}

TEST(SecretVec, DifferentLengthsAreUnequal)
{
    EXPECT_NE(secretBytesFrom("hello"), secretBytesFrom(""));
    EXPECT_NE(secretBytesFrom("abc"), secretBytesFrom("abcd"));
    EXPECT_NE((SecretBytes{ 0U, 0U }), (SecretBytes{ 0U, 0U, 0U }));
}

TEST(SecretVec, EqualityIsExactAndOrderSensitive)
{
    EXPECT_EQ(secretBytesFrom("abc"), secretBytesFrom("abc"));
    EXPECT_NE(secretBytesFrom("abc"), secretBytesFrom("acb"));
    EXPECT_NE(secretBytesFrom("abc"), secretBytesFrom("abd"));
    EXPECT_EQ(SecretBytes{}, secretBytesFrom(""));
}

TEST(SecretVec, ResizeShrinksThenGrows)
{
    SecretBytes secret{ 0U, 1U };

    secret.resize(1U, 0U);
    EXPECT_EQ(toVector(secret), (std::vector<std::uint8_t>{ 0U }));

    secret.resize(16U, 2U);
    std::vector<std::uint8_t> expected(16U, 2U);
    expected[0] = 0U;
    EXPECT_EQ(toVector(secret), expected);
    EXPECT_EQ(secret.capacity(), 16U);
}

TEST(SecretVec, ResizeFromEmpty)
{
    SecretBytes secret;
    secret.resize(4U, 7U);
    EXPECT_EQ(toVector(secret), (std::vector<std::uint8_t>{ 7U, 7U, 7U, 7U }));
}

TEST(SecretVec, CloneIsIndependent)
{
    const SecretBytes original{ secretBytesFrom("secret") };
    const SecretBytes third{ secretBytesFrom("secret") };

    SecretBytes clone{ original };
    EXPECT_EQ(clone, original);
    EXPECT_NE(clone.unsecure().data(), original.unsecure().data());

    clone.zeroOut();
    EXPECT_TRUE(clone.empty());
    EXPECT_EQ(toVector(original), obscura::test_utils::bytesOf("secret"));
    EXPECT_EQ(original, third);
}

TEST(SecretVec, CopyAssignmentReplacesContent)
{
    SecretBytes target{ secretBytesFrom("old") };
    const SecretBytes source{ secretBytesFrom("replacement") };

    target = source;
    EXPECT_EQ(target, source);

    target = target;
    EXPECT_EQ(target, source);
}

TEST(SecretVec, MoveLeavesSourceEmpty)
{
    SecretBytes source{ secretBytesFrom("moving") };
    const std::uint8_t* data{ source.unsecure().data() };

    SecretBytes target{ std::move(source) };
    EXPECT_EQ(target.unsecure().data(), data);
    EXPECT_TRUE(source.empty());
    EXPECT_EQ(source.capacity(), 0U);

    SecretBytes assigned;
    assigned = std::move(target);
    EXPECT_EQ(toVector(assigned), obscura::test_utils::bytesOf("moving"));
    EXPECT_TRUE(target.empty());
}

TEST(SecretVec, VectorSourceIsWipedAndCleared)
{
    std::vector<std::uint8_t> owned{ obscura::test_utils::bytesOf("take me") };
    const std::uint8_t* storage{ owned.data() };
    const std::size_t length{ owned.size() };

    const SecretBytes secret{ std::move(owned) };

    EXPECT_EQ(toVector(secret), obscura::test_utils::bytesOf("take me"));
    EXPECT_TRUE(owned.empty());
    // clear() keeps the buffer, so the old bytes can still be inspected.
    EXPECT_TRUE(std::all_of(storage, storage + length, [](std::uint8_t b) { return b == 0U; }));
}

TEST(SecretVec, IndexingAndSlicingMatchPlainSequence)
{
    const std::vector<std::uint8_t> plain{ 10U, 20U, 30U, 40U, 50U };
    const SecretBytes secret{ std::span<const std::uint8_t>{ plain } };

    for (std::size_t i{}; i < plain.size(); ++i)
    {
        EXPECT_EQ(secret[i], plain[i]);
        EXPECT_EQ(secret.at(i), plain[i]);
    }

    for (std::size_t first{}; first <= plain.size(); ++first)
    {
        for (std::size_t last{ first }; last <= plain.size(); ++last)
        {
            const auto slice{ secret.slice(first, last) };
            ASSERT_EQ(slice.size(), last - first);
            EXPECT_TRUE(std::equal(slice.begin(), slice.end(), plain.begin() + static_cast<std::ptrdiff_t>(first)));
        }
    }
}

TEST(SecretVec, AtThrowsOutOfRange)
{
    SecretBytes secret{ 1U, 2U, 3U };

    EXPECT_THROW({ [[maybe_unused]] auto v = secret.at(3U); }, std::out_of_range);
    EXPECT_TRUE(secret.slice(3U, 3U).empty());
}

TEST(SecretVecDeathTest, IndexPastShrunkLengthTerminates)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    SecretBytes secret{ secretBytesFrom("correct horse") };
    secret.resize(3U, 0U);

    // The old tail is still in the capacity; reading it must not be possible.
    EXPECT_DEATH({ [[maybe_unused]] auto b = secret[5U]; }, "index out of range");
    EXPECT_DEATH({ [[maybe_unused]] auto b = secret[3U]; }, "index out of range");
    EXPECT_EQ(secret[2U], 'r');
}

TEST(SecretVecDeathTest, SliceOutOfBoundsTerminates)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    const SecretBytes secret{ 1U, 2U, 3U };

    EXPECT_DEATH({ [[maybe_unused]] auto s = secret.slice(2U, 4U); }, "range out of bounds");
    EXPECT_DEATH({ [[maybe_unused]] auto s = secret.slice(2U, 1U); }, "range out of bounds");
}

TEST(SecretVecDeathTest, IndexIntoEmptyTerminates)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    SecretBytes secret{ secretBytesFrom("gone") };
    secret.zeroOut();

    EXPECT_DEATH({ [[maybe_unused]] auto b = secret[0U]; }, "index out of range");
}

TEST(SecretVec, MutableViewWritesThrough)
{
    SecretBytes secret{ 0U, 0U, 0U };
    auto view{ secret.unsecureMut() };
    view[1] = 9U;
    secret[2] = 8U;

    EXPECT_EQ(toVector(secret), (std::vector<std::uint8_t>{ 0U, 9U, 8U }));
}

TEST(SecretVec, FillConstructorAndCapacity)
{
    const SecretVec<std::uint64_t> secret(4U, 0xDEADBEEFULL);

    EXPECT_EQ(secret.size(), 4U);
    EXPECT_EQ(secret.capacity(), 4U);
    for (const std::uint64_t v : secret.unsecure())
    {
        EXPECT_EQ(v, 0xDEADBEEFULL);
    }
}

TEST(SecretVec, ReportsLockStatus)
{
    const SecretBytes empty;
    EXPECT_TRUE(empty.isLocked());

    const SecretBytes secret{ secretBytesFrom("pinned") };
    EXPECT_NE(secret.lockStatus(), obscura::security::LockStatus::Unsupported);
}

TEST(SecretVec, WideCharacters)
{
    const std::u32string_view text{ U"Hallo 🦄!" };
    std::vector<char32_t> reversed(text.begin(), text.end());
    std::reverse(reversed.begin(), reversed.end());

    const SecretVec<char32_t> hello{ std::span<const char32_t>{ text.data(), text.size() } };
    const SecretVec<char32_t> same{ std::span<const char32_t>{ text.data(), text.size() } };
    const SecretVec<char32_t> backwards{ std::move(reversed) };

    ASSERT_EQ(hello.size(), 8U);
    EXPECT_EQ(hello, same);
    EXPECT_NE(hello, backwards);

    SecretVec<char32_t> zeroed{ hello };
    zeroed.zeroOut();
    const auto wiped{ zeroed.allocationBytes() };
    ASSERT_EQ(wiped.size(), 8U * sizeof(char32_t));
    EXPECT_TRUE(obscura::test_utils::allZero(wiped));
    EXPECT_EQ(hello, same);
}

TEST(SecretVec, UnitElementsCompareByCount)
{
    const SecretVec<std::tuple<>> three(3U, std::tuple<>{});
    const SecretVec<std::tuple<>> alsoThree(3U, std::tuple<>{});
    const SecretVec<std::tuple<>> two(2U, std::tuple<>{});

    EXPECT_EQ(three, alsoThree);
    EXPECT_NE(three, two);
}

TEST(SecretVec, FloatingPointElements)
{
    const SecretVec<double> a{ 1.5, -2.25 };
    const SecretVec<double> b{ 1.5, -2.25 };
    const SecretVec<double> c{ 1.5, 2.25 };

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
