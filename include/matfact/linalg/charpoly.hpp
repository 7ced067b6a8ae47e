// include/matfact/linalg/charpoly.hpp — Characteristic polynomials of tridiagonal matrices.

#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <matfact/config.hpp>
#include <matfact/core/longint.hpp>
#include <matfact/error.hpp>
#include <matfact/matrix.hpp>
#include <matfact/numeric.hpp>
#include <matfact/polynome.hpp>

namespace matfact::linalg {

// Entries off the main, sub and super diagonals must stay below tolerance in squared norm.
template <typename T>
bool is_tridiagonal(const Matrix<T> &matrix, double tolerance = TRIDIAGONAL_TOLERANCE) {
    for (std::size_t row = 0; row < matrix.height(); ++row) {
        for (std::size_t column = 0; column < matrix.width(); ++column) {
            const std::size_t distance = row > column ? row - column : column - row;
            if (distance <= 1) {
                continue;
            }
            if (!(norm_squared(matrix(row, column)) < tolerance)) {
                return false;
            }
        }
    }
    return true;
}

// Ascending coefficients of det(A - lambda I), built from the three-term recurrence
// D_i = (a_ii - lambda) D_{i-1} - a_{i,i-1} a_{i-1,i} D_{i-2}.
template <typename T> Polynome<T> characteristic_polynomial(const Matrix<T> &matrix) {
    if (!matrix.is_square()) {
        throw matrix_error(matrix_errc::not_square, matrix.shape());
    }
    if (!is_tridiagonal(matrix)) {
        throw matrix_error(matrix_errc::not_tridiagonal, matrix.shape());
    }

    const std::size_t size = matrix.width();
    const T minus_one = from_real<T>(-1.0);
    if (size == 0) {
        return Polynome<T>::constant(T{});
    }
    if (size == 1) {
        return Polynome<T>(std::vector<T>{matrix(0, 0), minus_one});
    }

    const T &a = matrix(0, 0);
    const T &b = matrix(0, 1);
    const T &c = matrix(1, 0);
    const T &d = matrix(1, 1);
    Polynome<T> before_previous(std::vector<T>{a, minus_one});
    Polynome<T> previous(std::vector<T>{a * d - c * b, -(a + d), from_real<T>(1.0)});

    for (std::size_t i = 2; i < size; ++i) {
        const Polynome<T> diagonal_term(std::vector<T>{matrix(i, i), minus_one});
        const T coupling = matrix(i, i - 1) * matrix(i - 1, i);
        Polynome<T> current = previous * diagonal_term - before_previous * coupling;
        before_previous = std::move(previous);
        previous = std::move(current);
    }
    return previous;
}

// Rounds every entry toward zero into a longint and runs the recurrence exactly.
Polynome<core::longint> exact_characteristic_polynomial(const Matrix<double> &matrix);

} // namespace matfact::linalg
