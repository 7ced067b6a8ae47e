// bench/bench_longint.cpp — Benchmark for base-256 longint arithmetic.

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include <benchmark/benchmark.h>

#include <matfact/core/longint.hpp>
#include <matfact/io/format.hpp>
#include <matfact/io/parse.hpp>
#include <matfact/util/random.hpp>

namespace {

    enum class Operation : std::uint64_t {
        Add,
        Multiply,
        Divide,
    };

    inline matfact::core::longint random_nonzero_longint(std::mt19937_64 &rng,
                                                         std::size_t digit_count) {
        matfact::core::longint value;
        do {
            value = matfact::util::random_longint(rng, digit_count);
        } while (value.is_zero());
        return value;
    }

    void bench_longint_operation(benchmark::State &state, Operation op) {
        const auto digit_count = static_cast<std::size_t>(state.range(0));
        std::mt19937_64 rng(0x1f2e3d4cull + static_cast<std::uint64_t>(op));
        const auto lhs = matfact::util::random_longint(rng, digit_count * 2);
        const auto rhs = random_nonzero_longint(rng, digit_count);
        for (auto _ : state) {
            matfact::core::longint result;
            switch (op) {
            case Operation::Add:
                result = lhs + rhs;
                break;
            case Operation::Multiply:
                result = lhs * rhs;
                break;
            case Operation::Divide:
                result = lhs / rhs;
                break;
            }
            benchmark::DoNotOptimize(result);
        }
    }

    void bench_decimal_roundtrip(benchmark::State &state) {
        std::mt19937_64 rng(0x5eedull);
        const auto value =
            matfact::util::random_longint(rng, static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            const std::string text = matfact::io::to_string(value);
            auto parsed = matfact::io::from_string<matfact::core::longint>(text);
            benchmark::DoNotOptimize(parsed);
        }
    }

} // namespace

BENCHMARK_CAPTURE(bench_longint_operation, add, Operation::Add)->Arg(8)->Arg(64)->Arg(256);
BENCHMARK_CAPTURE(bench_longint_operation, multiply, Operation::Multiply)
    ->Arg(8)
    ->Arg(64)
    ->Arg(256);
BENCHMARK_CAPTURE(bench_longint_operation, divide, Operation::Divide)->Arg(8)->Arg(64);
BENCHMARK(bench_decimal_roundtrip)->Arg(8)->Arg(32);

BENCHMARK_MAIN();
