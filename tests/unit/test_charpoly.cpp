// tests/unit/test_charpoly.cpp — Tridiagonal characteristic polynomials over doubles and longint.

#include <matfact/matfact.hpp>

#include <cmath>
#include <cstddef>
#include <iostream>
#include <random>
#include <vector>

namespace {

using M = matfact::Matrix<double>;
using P = matfact::Polynome<double>;
using matfact::core::longint;
using matfact::linalg::characteristic_polynomial;

// Leibniz expansion is fine at these sizes.
double determinant(const M& matrix) {
    const std::size_t size = matrix.width();
    if (size == 1) {
        return matrix(0, 0);
    }
    double result = 0.0;
    for (std::size_t skip = 0; skip < size; ++skip) {
        M block(size - 1, size - 1);
        for (std::size_t row = 1; row < size; ++row) {
            std::size_t target = 0;
            for (std::size_t column = 0; column < size; ++column) {
                if (column == skip) {
                    continue;
                }
                block(row - 1, target++) = matrix(row, column);
            }
        }
        const double sign = skip % 2 == 0 ? 1.0 : -1.0;
        result += sign * matrix(0, skip) * determinant(block);
    }
    return result;
}

bool test_known_tridiagonal() {
    const M matrix = M::from_rows({{2.0, 1.0, 0.0}, {1.0, 2.0, 1.0}, {0.0, 1.0, 2.0}});
    const P poly = characteristic_polynomial(matrix);
    if (!(poly == P(std::vector<double>{4.0, -10.0, 6.0, -1.0}))) {
        std::cerr << "expected [4, -10, 6, -1], got " << matfact::io::to_string(poly) << "\n";
        return false;
    }
    return true;
}

bool test_diagonal(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(-4.0, 4.0);
    for (int iteration = 0; iteration < 16; ++iteration) {
        const double a = dist(rng);
        const double b = dist(rng);
        const P poly = characteristic_polynomial(M::from_rows({{a, 0.0}, {0.0, b}}));
        if (poly.size() != 3 || poly.get(0) != a * b || poly.get(1) != -(a + b) ||
            poly.get(2) != 1.0) {
            std::cerr << "diag(" << a << ", " << b << ") gave " << matfact::io::to_string(poly)
                      << "\n";
            return false;
        }
    }
    return true;
}

bool test_small_sizes() {
    const P single = characteristic_polynomial(M::from_rows({{5.0}}));
    if (!(single == P(std::vector<double>{5.0, -1.0}))) {
        std::cerr << "1x1 should give 5 - x, got " << matfact::io::to_string(single) << "\n";
        return false;
    }
    const P empty = characteristic_polynomial(M());
    if (empty.size() != 1 || empty.get(0) != 0.0) {
        std::cerr << "0x0 should give the zero constant\n";
        return false;
    }
    return true;
}

bool test_matches_determinant(std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(-2.0, 2.0);
    for (std::size_t size = 2; size <= 6; ++size) {
        M matrix(size, size);
        for (std::size_t index = 0; index < size; ++index) {
            matrix(index, index) = dist(rng);
            if (index + 1 < size) {
                matrix(index, index + 1) = dist(rng);
                matrix(index + 1, index) = dist(rng);
            }
        }
        const P poly = characteristic_polynomial(matrix);
        for (const double lambda : {-1.5, 0.0, 0.75, 2.0}) {
            M shifted = matrix;
            for (std::size_t index = 0; index < size; ++index) {
                shifted(index, index) -= lambda;
            }
            const double expected = determinant(shifted);
            const double actual = poly.evaluate(lambda);
            if (std::fabs(expected - actual) > 1e-9 * (1.0 + std::fabs(expected))) {
                std::cerr << "p(" << lambda << ") = " << actual << ", det = " << expected
                          << " at size " << size << "\n";
                return false;
            }
        }
    }
    return true;
}

bool test_tolerance_and_failures() {
    const M nearly = M::from_rows({{1.0, 0.0, 0.005}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}});
    if (!matfact::linalg::is_tridiagonal(nearly)) {
        std::cerr << "entries below the tolerance should be ignored\n";
        return false;
    }
    const M dense = M::from_rows({{1.0, 0.0, 0.5}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}});
    try {
        (void)characteristic_polynomial(dense);
        std::cerr << "dense matrix should fail\n";
        return false;
    } catch (const matfact::matrix_error& error) {
        if (error.kind() != matfact::matrix_errc::not_tridiagonal) {
            std::cerr << "expected not_tridiagonal\n";
            return false;
        }
    }
    try {
        (void)characteristic_polynomial(M(2, 3));
        std::cerr << "non-square matrix should fail\n";
        return false;
    } catch (const matfact::matrix_error& error) {
        if (error.kind() != matfact::matrix_errc::not_square) {
            std::cerr << "expected not_square\n";
            return false;
        }
    }
    return true;
}

bool test_exact_polynomial() {
    const M matrix = M::from_rows({{3.0, 100000.0, 0.0, 0.0},
                                   {100000.0, 3.0, 100000.0, 0.0},
                                   {0.0, 100000.0, 3.0, 100000.0},
                                   {0.0, 0.0, 100000.0, 3.0}});
    const auto poly = matfact::linalg::exact_characteristic_polynomial(matrix);
    // (3 - x)^4 - 3 c (3 - x)^2 + c^2 with c = 10^10.
    const matfact::Polynome<longint> expected(std::vector<longint>{
        matfact::io::from_string<longint>("99999999730000000081"),
        matfact::io::from_string<longint>("179999999892"),
        matfact::io::from_string<longint>("-29999999946"),
        longint(-12),
        longint(1),
    });
    if (!(poly == expected)) {
        std::cerr << "exact polynomial mismatch: " << matfact::io::to_string(poly) << "\n";
        return false;
    }
    const auto truncated =
        matfact::linalg::exact_characteristic_polynomial(M::from_rows({{2.9, 0.0}, {0.0, -1.2}}));
    if (!(truncated == matfact::Polynome<longint>(
                           std::vector<longint>{longint(-2), longint(-1), longint(1)}))) {
        std::cerr << "entries should truncate toward zero, got "
                  << matfact::io::to_string(truncated) << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0xc4a7b01);
    if (!test_known_tridiagonal()) {
        return 1;
    }
    if (!test_diagonal(rng)) {
        return 1;
    }
    if (!test_small_sizes()) {
        return 1;
    }
    if (!test_matches_determinant(rng)) {
        return 1;
    }
    if (!test_tolerance_and_failures()) {
        return 1;
    }
    if (!test_exact_polynomial()) {
        return 1;
    }
    std::cout << "charpoly tests passed\n";
    return 0;
}
