#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "obscura/security/Serialization.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{
// Collects what a CBOR encoder would receive as byte strings (major type 2) and text strings (major type 3).
struct RecordingEncoder
{
    void writeBytes(std::span<const std::uint8_t> bytes)
    {
        byteStrings.emplace_back(bytes.begin(), bytes.end());
    }

    void writeText(std::string_view text)
    {
        textStrings.emplace_back(text);
    }

    std::vector<std::vector<std::uint8_t>> byteStrings;
    std::vector<std::string> textStrings;
};

struct BytesOnlyEncoder
{
    void writeBytes(std::span<const std::uint8_t> bytes)
    {
        size += bytes.size();
    }

    std::size_t size{};
};

static_assert(obscura::security::ByteStringEncoder<RecordingEncoder>);
static_assert(obscura::security::TextStringEncoder<RecordingEncoder>);
static_assert(obscura::security::ByteStringEncoder<BytesOnlyEncoder>);
static_assert(!obscura::security::TextStringEncoder<BytesOnlyEncoder>);
} // namespace

TEST(Serialization, BytesEncodeAsByteString)
{
    RecordingEncoder encoder;
    obscura::security::encodeSecret(encoder, obscura::security::secretBytesFrom("key"));

    ASSERT_EQ(encoder.byteStrings.size(), 1U);
    EXPECT_TRUE(encoder.textStrings.empty());
    EXPECT_EQ(encoder.byteStrings[0], obscura::test_utils::bytesOf("key"));
}

TEST(Serialization, TextEncodesAsTextString)
{
    RecordingEncoder encoder;
    obscura::security::encodeSecret(encoder, obscura::security::SecretUtf8{ "pass phrase" });

    ASSERT_EQ(encoder.textStrings.size(), 1U);
    EXPECT_TRUE(encoder.byteStrings.empty());
    EXPECT_EQ(encoder.textStrings[0], "pass phrase");
}

TEST(Serialization, DecodeCopiesIntoSecretContainers)
{
    const std::vector<std::uint8_t> wire{ obscura::test_utils::bytesOf("\x01\x02\x03") };
    const auto bytes{ obscura::security::decodeSecretBytes(wire) };
    EXPECT_EQ(bytes, obscura::security::secretBytesFrom("\x01\x02\x03"));

    const auto text{ obscura::security::decodeSecretUtf8("caf\xC3\xA9") };
    EXPECT_EQ(text.unsecure(), "caf\xC3\xA9");
}

TEST(Serialization, DecodeRejectsInvalidText)
{
    EXPECT_THROW({ [[maybe_unused]] auto text = obscura::security::decodeSecretUtf8("\xC3("); }, std::invalid_argument);
}
