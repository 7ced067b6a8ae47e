// bench/bench_decompositions.cpp — Benchmark for LU and QR factorizations of dense matrices.

#include <cstddef>
#include <random>

#include <benchmark/benchmark.h>

#include <matfact/linalg/charpoly.hpp>
#include <matfact/linalg/lu.hpp>
#include <matfact/linalg/qr.hpp>
#include <matfact/util/random.hpp>

namespace {

    using matfact::linalg::QrMethod;

    void bench_lu(benchmark::State &state) {
        std::mt19937_64 rng(0xabcdefull);
        const auto matrix =
            matfact::util::random_diagonally_dominant(rng, static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            auto factors = matfact::linalg::lu_decomposition(matrix);
            benchmark::DoNotOptimize(factors);
        }
    }

    void bench_qr(benchmark::State &state, QrMethod method) {
        std::mt19937_64 rng(0xfedcbaull);
        const auto matrix =
            matfact::util::random_diagonally_dominant(rng, static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            auto factors = matfact::linalg::qr_decompose(matrix, method);
            benchmark::DoNotOptimize(factors);
        }
    }

    void bench_complex_householder(benchmark::State &state) {
        std::mt19937_64 rng(0x13579bull);
        const auto matrix =
            matfact::util::random_complex_matrix(rng, static_cast<std::size_t>(state.range(0)));
        for (auto _ : state) {
            auto factors = matfact::linalg::householder(matrix);
            benchmark::DoNotOptimize(factors);
        }
    }

    void bench_exact_charpoly(benchmark::State &state) {
        const auto size = static_cast<std::size_t>(state.range(0));
        matfact::Matrix<double> matrix(size, size);
        for (std::size_t index = 0; index < size; ++index) {
            matrix(index, index) = 2.0;
            if (index + 1 < size) {
                matrix(index, index + 1) = 1000.0;
                matrix(index + 1, index) = -1000.0;
            }
        }
        for (auto _ : state) {
            auto poly = matfact::linalg::exact_characteristic_polynomial(matrix);
            benchmark::DoNotOptimize(poly);
        }
    }

} // namespace

BENCHMARK(bench_lu)->Arg(16)->Arg(64);
BENCHMARK_CAPTURE(bench_qr, householder, QrMethod::householder)->Arg(16)->Arg(64);
BENCHMARK_CAPTURE(bench_qr, givens, QrMethod::givens)->Arg(16)->Arg(64);
BENCHMARK_CAPTURE(bench_qr, gram_schmidt, QrMethod::gram_schmidt)->Arg(16)->Arg(64);
BENCHMARK(bench_complex_householder)->Arg(16);
BENCHMARK(bench_exact_charpoly)->Arg(8)->Arg(32);

BENCHMARK_MAIN();
