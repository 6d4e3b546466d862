#include "obscura/security/SecretUtf8.hpp"

#include "obscura/security/MemoryWiper.hpp"
#include "obscura/security/Utf8.hpp"
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>

namespace obscura::security
{
namespace
{
std::span<const std::uint8_t> asU8(std::string_view text) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(text.data()), text.size() };
}

std::string_view requireUtf8(std::string_view text)
{
    if (!isValidUtf8(text))
    {
        throw std::invalid_argument("SecretUtf8: input is not valid UTF-8");
    }
    return text;
}

std::string_view requireText(const char* text)
{
    if (text == nullptr)
    {
        throw std::invalid_argument("SecretUtf8: null text");
    }
    return std::string_view{ text };
}

constexpr std::uint8_t g_kAsciiCaseBit{ 0x20U };
} // namespace

SecretUtf8::SecretUtf8(Validated, std::string_view text) : m_bytes(asU8(text))
{
}

SecretUtf8::SecretUtf8(std::string_view text) : SecretUtf8(Validated{}, requireUtf8(text))
{
}

SecretUtf8::SecretUtf8(const char* text) : SecretUtf8(requireText(text))
{
}

SecretUtf8::SecretUtf8(std::string&& text) : SecretUtf8(std::string_view{ text })
{
    secureWipe(std::span<char>{ text.data(), text.size() });
    text.clear();
}

std::optional<SecretUtf8> SecretUtf8::tryFrom(std::string_view text)
{
    if (!isValidUtf8(text))
    {
        return std::nullopt;
    }
    return SecretUtf8{ Validated{}, text };
}

std::string_view SecretUtf8::unsecure() const noexcept
{
    const auto content{ m_bytes.unsecure() };
    if (content.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(content.data()), content.size() };
}

// ASCII bytes never occur inside a multi-byte sequence, so flipping their case keeps the text valid.
void SecretUtf8::makeAsciiUppercase() noexcept
{
    for (std::uint8_t& c : m_bytes.unsecureMut())
    {
        if (c >= 'a' && c <= 'z')
        {
            c = static_cast<std::uint8_t>(c & ~g_kAsciiCaseBit);
        }
    }
}

void SecretUtf8::makeAsciiLowercase() noexcept
{
    for (std::uint8_t& c : m_bytes.unsecureMut())
    {
        if (c >= 'A' && c <= 'Z')
        {
            c = static_cast<std::uint8_t>(c | g_kAsciiCaseBit);
        }
    }
}

std::string SecretUtf8::intoUnsecure() &&
{
    std::string out{ unsecure() };
    SecretBytes released{ std::move(m_bytes) };
    return out;
}

void SecretUtf8::zeroOut() noexcept
{
    m_bytes.zeroOut();
}

} // namespace obscura::security
