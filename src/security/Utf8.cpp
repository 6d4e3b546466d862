#include "obscura/security/Utf8.hpp"

#include <cstddef>

namespace obscura::security
{
namespace
{
constexpr std::uint8_t g_kContinuationLow{ 0x80U };
constexpr std::uint8_t g_kContinuationHigh{ 0xBFU };

struct LeadRule final
{
    std::size_t length;
    // Allowed range of the first continuation byte; the rest are always 80..BF.
    std::uint8_t secondLow;
    std::uint8_t secondHigh;
};

// Returns length 0 for bytes that can never start a sequence (80..C1, F5..FF).
constexpr LeadRule leadRule(std::uint8_t lead) noexcept
{
    if (lead <= 0x7FU)
    {
        return { 1U, 0U, 0U };
    }
    if (lead >= 0xC2U && lead <= 0xDFU)
    {
        return { 2U, g_kContinuationLow, g_kContinuationHigh };
    }
    if (lead == 0xE0U)
    {
        return { 3U, 0xA0U, g_kContinuationHigh };
    }
    if (lead == 0xEDU)
    {
        return { 3U, g_kContinuationLow, 0x9FU };
    }
    if (lead >= 0xE1U && lead <= 0xEFU)
    {
        return { 3U, g_kContinuationLow, g_kContinuationHigh };
    }
    if (lead == 0xF0U)
    {
        return { 4U, 0x90U, g_kContinuationHigh };
    }
    if (lead >= 0xF1U && lead <= 0xF3U)
    {
        return { 4U, g_kContinuationLow, g_kContinuationHigh };
    }
    if (lead == 0xF4U)
    {
        return { 4U, g_kContinuationLow, 0x8FU };
    }
    return { 0U, 0U, 0U };
}
} // namespace

bool isValidUtf8(std::span<const std::uint8_t> bytes) noexcept
{
    std::size_t i{};
    while (i < bytes.size())
    {
        const LeadRule rule{ leadRule(bytes[i]) };
        if (rule.length == 0U || rule.length > bytes.size() - i)
        {
            return false;
        }
        if (rule.length > 1U)
        {
            const std::uint8_t second{ bytes[i + 1U] };
            if (second < rule.secondLow || second > rule.secondHigh)
            {
                return false;
            }
            for (std::size_t k{ 2U }; k < rule.length; ++k)
            {
                const std::uint8_t next{ bytes[i + k] };
                if (next < g_kContinuationLow || next > g_kContinuationHigh)
                {
                    return false;
                }
            }
        }
        i += rule.length;
    }
    return true;
}
} // namespace obscura::security
