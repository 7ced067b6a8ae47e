// include/matfact/linalg/triangular.hpp — Substitution kernels shared by the LU and QR solvers.

#pragma once

#include <cstddef>
#include <utility>

#include <matfact/error.hpp>
#include <matfact/matrix.hpp>

namespace matfact::linalg {

namespace detail {

    // Unit diagonal assumed.
    template <typename T>
    Matrix<T> forward_substitute(const Matrix<T> &lower, const Matrix<T> &rhs) {
        const std::size_t size = lower.width();
        Matrix<T> solution(1, size);
        for (std::size_t i = 0; i < size; ++i) {
            T value = rhs(i, 0);
            for (std::size_t j = 0; j < i; ++j) {
                value = value - lower(i, j) * solution(j, 0);
            }
            solution(i, 0) = std::move(value);
        }
        return solution;
    }

    template <typename T>
    Matrix<T> back_substitute(const Matrix<T> &upper, const Matrix<T> &rhs) {
        const std::size_t size = upper.width();
        Matrix<T> solution(1, size);
        for (std::size_t i = size; i-- > 0;) {
            T value = rhs(i, 0);
            for (std::size_t j = i + 1; j < size; ++j) {
                value = value - upper(i, j) * solution(j, 0);
            }
            solution(i, 0) = value / upper(i, i);
        }
        return solution;
    }

    template <typename T>
    void check_triangular_system(const Matrix<T> &first, const Matrix<T> &second,
                                 const Matrix<T> &rhs) {
        if (!first.is_square() || !second.is_square() || first.width() != second.width() ||
            rhs.width() != 1 || rhs.height() != first.height()) {
            throw matrix_error(matrix_errc::size_mismatch,
                               first.shape() + ", " + second.shape() + " with right-hand side " +
                                   rhs.shape());
        }
    }

} // namespace detail

} // namespace matfact::linalg
