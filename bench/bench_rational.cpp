// bench/bench_rational.cpp — Benchmarks for rational arithmetic and the gcd it depends on.

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <ratkit/ratkit.hpp>

namespace {

namespace core = ratkit::core;

static std::vector<core::rational> make_operands(std::size_t count, std::size_t words) {
    std::mt19937_64 rng(0xbe7c4);
    std::vector<core::rational> operands;
    operands.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        operands.push_back(ratkit::util::random_rational(rng, words));
    }
    return operands;
}

static void BM_RationalAdd(benchmark::State& state) {
    const auto operands = make_operands(64, static_cast<std::size_t>(state.range(0)));
    std::size_t index = 0;
    for (auto _ : state) {
        const auto& lhs = operands[index % operands.size()];
        const auto& rhs = operands[(index + 1) % operands.size()];
        auto sum = core::add(lhs, rhs);
        benchmark::DoNotOptimize(sum.numerator());
        ++index;
    }
}
BENCHMARK(BM_RationalAdd)->Arg(1)->Arg(8)->Arg(64);

static void BM_RationalMultiply(benchmark::State& state) {
    const auto operands = make_operands(64, static_cast<std::size_t>(state.range(0)));
    std::size_t index = 0;
    for (auto _ : state) {
        const auto& lhs = operands[index % operands.size()];
        const auto& rhs = operands[(index + 1) % operands.size()];
        auto product = core::mul(lhs, rhs);
        benchmark::DoNotOptimize(product.denominator());
        ++index;
    }
}
BENCHMARK(BM_RationalMultiply)->Arg(1)->Arg(8)->Arg(64);

static void BM_RationalCompare(benchmark::State& state) {
    const auto operands = make_operands(64, static_cast<std::size_t>(state.range(0)));
    std::size_t index = 0;
    for (auto _ : state) {
        const bool greater = core::gt(operands[index % operands.size()],
                                      operands[(index + 1) % operands.size()]);
        benchmark::DoNotOptimize(greater);
        ++index;
    }
}
BENCHMARK(BM_RationalCompare)->Arg(1)->Arg(8)->Arg(64);

static void BM_HarmonicSum(benchmark::State& state) {
    const auto terms = state.range(0);
    for (auto _ : state) {
        core::rational sum;
        for (std::int64_t k = 1; k <= terms; ++k) {
            sum += core::from_int(1, k);
        }
        benchmark::DoNotOptimize(sum.denominator());
    }
}
BENCHMARK(BM_HarmonicSum)->Arg(32)->Arg(256);

static void BM_BigIntGcd(benchmark::State& state) {
    std::mt19937_64 rng(0x9cd);
    const auto words = static_cast<std::size_t>(state.range(0));
    const core::bigint lhs = ratkit::util::random_bigint(rng, words, false);
    const core::bigint rhs = ratkit::util::random_bigint(rng, words, false);
    for (auto _ : state) {
        auto divisor = core::gcd(lhs, rhs);
        benchmark::DoNotOptimize(divisor);
    }
}
BENCHMARK(BM_BigIntGcd)->Arg(4)->Arg(32)->Arg(256);

} // namespace

BENCHMARK_MAIN();
