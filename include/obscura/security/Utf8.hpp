#ifndef INCLUDE_OBSCURA_SECURITY_UTF8_HPP
#define INCLUDE_OBSCURA_SECURITY_UTF8_HPP

#include <cstdint>
#include <span>
#include <string_view>

namespace obscura::security
{
// Well-formed UTF-8 per Unicode table 3-7: rejects overlong forms, surrogates (U+D800..U+DFFF),
// code points above U+10FFFF and truncated sequences.
[[nodiscard]] bool isValidUtf8(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] inline bool isValidUtf8(std::string_view text) noexcept
{
    return isValidUtf8(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(text.data()), text.size() });
}
} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_UTF8_HPP
