#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>

#include <obscura/security/SecretVec.hpp>

namespace
{
constexpr char g_kReference[] = "hello more longer test needed here, a few hundred bytes of padding to make timing visible "
                                "once the comparison runs over a realistic key or password length rather than a toy string";

obscura::security::SecretBytes referenceSecret()
{
    return obscura::security::secretBytesFrom(g_kReference);
}

obscura::security::SecretBytes withByteFlipped(std::size_t index)
{
    auto secret = referenceSecret();
    secret[index] = static_cast<std::uint8_t>(secret[index] ^ 0x01U);
    return secret;
}

void compare(benchmark::State &state, const obscura::security::SecretBytes &lhs,
             const obscura::security::SecretBytes &rhs)
{
    for (auto _ : state)
    {
        bool equal = lhs == rhs;
        benchmark::DoNotOptimize(equal);
    }
}
} // namespace

static void eq_same_len(benchmark::State &state)
{
    const auto lhs = referenceSecret();
    const auto rhs = referenceSecret();
    compare(state, lhs, rhs);
}
BENCHMARK(eq_same_len);

// The two mismatch positions should time the same.
static void not_eq_first_byte(benchmark::State &state)
{
    const auto lhs = referenceSecret();
    const auto rhs = withByteFlipped(0U);
    compare(state, lhs, rhs);
}
BENCHMARK(not_eq_first_byte);

static void not_eq_last_byte(benchmark::State &state)
{
    const auto lhs = referenceSecret();
    const auto rhs = withByteFlipped(lhs.size() - 1U);
    compare(state, lhs, rhs);
}
BENCHMARK(not_eq_last_byte);

static void not_eq_diff_len(benchmark::State &state)
{
    const auto lhs = referenceSecret();
    const auto rhs = obscura::security::secretBytesFrom("hello");
    compare(state, lhs, rhs);
}
BENCHMARK(not_eq_diff_len);
