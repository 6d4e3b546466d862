#ifndef INCLUDE_OBSCURA_SECURITY_REDACTED_HPP
#define INCLUDE_OBSCURA_SECURITY_REDACTED_HPP

#include <string_view>

namespace obscura::security
{
// Every textual rendering of a secret container produces exactly this.
inline constexpr std::string_view g_kRedacted{ "***SECRET***" };
} // namespace obscura::security

#endif // INCLUDE_OBSCURA_SECURITY_REDACTED_HPP
