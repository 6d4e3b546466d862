#ifndef INCLUDE_OBSCURA_SECURITY_FORMAT_HPP
#define INCLUDE_OBSCURA_SECURITY_FORMAT_HPP

#include "obscura/security/Redacted.hpp"
#include "obscura/security/SecretBox.hpp"
#include "obscura/security/SecretUtf8.hpp"
#include "obscura/security/SecretVec.hpp"
#include <fmt/format.h>

namespace obscura::security::detail
{
// Accepts and discards any format spec ("{}", "{:?}", "{:>20}", ...): the output is always the
// redaction marker, never padded, so not even the requested width reveals anything.
struct RedactedFormatter
{
    template <typename ParseContext> constexpr auto parse(ParseContext& ctx)
    {
        auto it = ctx.begin();
        while (it != ctx.end() && *it != '}')
        {
            ++it;
        }
        return it;
    }

    template <typename Secret, typename FormatContext>
    auto format([[maybe_unused]] const Secret& secret, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", obscura::security::g_kRedacted);
    }
};
} // namespace obscura::security::detail

namespace fmt
{
template <typename T>
struct formatter<obscura::security::SecretVec<T>> : obscura::security::detail::RedactedFormatter
{
};

template <typename T>
struct formatter<obscura::security::SecretBox<T>> : obscura::security::detail::RedactedFormatter
{
};

template <> struct formatter<obscura::security::SecretUtf8> : obscura::security::detail::RedactedFormatter
{
};
} // namespace fmt

#endif // INCLUDE_OBSCURA_SECURITY_FORMAT_HPP
