// include/matfact/linalg/lu.hpp — Unpivoted Doolittle LU factorization and triangular solves.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <matfact/error.hpp>
#include <matfact/linalg/triangular.hpp>
#include <matfact/matrix.hpp>
#include <matfact/numeric.hpp>

namespace matfact::linalg {

template <typename T> struct LuFactors {
    Matrix<T> lower;
    Matrix<T> upper;
};

// A zero pivot fails with not_regular; rows are never exchanged.
template <typename T> LuFactors<T> lu_decomposition(const Matrix<T> &matrix) {
    if (!matrix.is_square()) {
        throw matrix_error(matrix_errc::not_square, matrix.shape());
    }
    const std::size_t size = matrix.width();
    const T zero{};
    std::vector<T> lower(size * size, zero);
    std::vector<T> upper(size * size, zero);
    std::vector<T> work = matrix.elements();

    for (std::size_t layer = 0; layer < size; ++layer) {
        const T pivot = work[layer * size + layer];
        if (pivot == zero) {
            throw matrix_error(matrix_errc::not_regular,
                               "zero pivot at " + std::to_string(layer));
        }
        lower[layer * size + layer] = from_real<T>(1.0);
        upper[layer * size + layer] = pivot;

        for (std::size_t i = layer + 1; i < size; ++i) {
            const T &below = work[i * size + layer];
            lower[i * size + layer] = below / pivot;
            upper[layer * size + i] = work[layer * size + i];
            for (std::size_t j = layer + 1; j < size; ++j) {
                work[i * size + j] =
                    work[i * size + j] - work[layer * size + j] * below / pivot;
            }
        }
    }

    return {Matrix<T>::from_vector(std::move(lower), size),
            Matrix<T>::from_vector(std::move(upper), size)};
}

template <typename T>
Matrix<T> gauss_from_lu(const Matrix<T> &lower, const Matrix<T> &upper, const Matrix<T> &rhs) {
    detail::check_triangular_system(lower, upper, rhs);
    const Matrix<T> intermediate = detail::forward_substitute(lower, rhs);
    return detail::back_substitute(upper, intermediate);
}

template <typename T> Matrix<T> lu_solve(const Matrix<T> &matrix, const Matrix<T> &rhs) {
    const LuFactors<T> factors = lu_decomposition(matrix);
    return gauss_from_lu(factors.lower, factors.upper, rhs);
}

} // namespace matfact::linalg
