// include/matfact/linalg/qr.hpp — QR factorization by Householder, Givens and Gram-Schmidt.

#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <matfact/complex.hpp>
#include <matfact/config.hpp>
#include <matfact/error.hpp>
#include <matfact/linalg/triangular.hpp>
#include <matfact/matrix.hpp>
#include <matfact/numeric.hpp>

namespace matfact::linalg {

// Codes 1, 2 and 3 name the methods in problem descriptions.
enum class QrMethod {
    householder = 1,
    givens = 2,
    gram_schmidt = 3,
};

QrMethod qr_method_from_code(int code);
const char *to_string(QrMethod method) noexcept;

template <typename T> struct QrFactors {
    Matrix<T> q;
    Matrix<T> r;
};

namespace detail {

    template <typename T> void require_square(const Matrix<T> &matrix) {
        if (!matrix.is_square()) {
            throw matrix_error(matrix_errc::not_square, matrix.shape());
        }
    }

    // target <- target - 2 v (v^H target), with v of unit length.
    template <typename T> void reflect(Matrix<T> &target, const std::vector<T> &mirror) {
        const T two = from_real<T>(2.0);
        const std::size_t size = target.height();
        for (std::size_t column = 0; column < target.width(); ++column) {
            T dot{};
            for (std::size_t row = 0; row < size; ++row) {
                dot = dot + conjugate(mirror[row]) * target(row, column);
            }
            for (std::size_t row = 0; row < size; ++row) {
                target(row, column) = target(row, column) - two * mirror[row] * dot;
            }
        }
    }

    // Applies the plane rotation [[c, -s], [s, c]] to rows first and second.
    template <typename T>
    void rotate_rows(Matrix<T> &target, std::size_t first, std::size_t second, const T &cosine,
                     const T &sine) {
        for (std::size_t column = 0; column < target.width(); ++column) {
            const T upper = target(first, column);
            const T lower = target(second, column);
            target(first, column) = upper * cosine - lower * sine;
            target(second, column) = upper * sine + lower * cosine;
        }
    }

    // Rescales each R row and the matching Q column by a unit factor so the
    // diagonal of R ends up real and non-negative. Q * R is unchanged.
    template <typename T> void normalize_diagonal_phase(QrFactors<T> &factors) {
        const std::size_t size = factors.r.height();
        for (std::size_t k = 0; k < size; ++k) {
            const double magnitude = norm(factors.r(k, k));
            if (magnitude == 0.0) {
                continue;
            }
            const T phase = factors.r(k, k) / from_real<T>(magnitude);
            const T phase_conj = conjugate(phase);
            for (std::size_t column = 0; column < factors.r.width(); ++column) {
                factors.r(k, column) = phase_conj * factors.r(k, column);
            }
            for (std::size_t row = 0; row < factors.q.height(); ++row) {
                factors.q(row, k) = factors.q(row, k) * phase;
            }
        }
    }

} // namespace detail

template <typename T> QrFactors<T> householder(const Matrix<T> &matrix) {
    detail::require_square(matrix);
    const std::size_t size = matrix.width();
    Matrix<T> r = matrix;
    Matrix<T> accumulated = Matrix<T>::identity(size);

    for (std::size_t pivot = 0; pivot < size; ++pivot) {
        double column_norm_squared = 0.0;
        for (std::size_t row = pivot; row < size; ++row) {
            column_norm_squared += norm_squared(r(row, pivot));
        }
        if (column_norm_squared == 0.0) {
            continue;
        }

        std::vector<T> mirror(size, T{});
        for (std::size_t row = pivot; row < size; ++row) {
            mirror[row] = r(row, pivot);
        }
        const T &head = r(pivot, pivot);
        const double head_norm = norm(head);
        const T column_norm = from_real<T>(std::sqrt(column_norm_squared));
        if (head_norm != 0.0) {
            mirror[pivot] = head + head / from_real<T>(head_norm) * column_norm;
        } else {
            mirror[pivot] = column_norm;
        }

        double mirror_norm_squared = 0.0;
        for (const auto &entry : mirror) {
            mirror_norm_squared += norm_squared(entry);
        }
        const T mirror_norm = from_real<T>(std::sqrt(mirror_norm_squared));
        for (auto &entry : mirror) {
            entry = entry / mirror_norm;
        }

        detail::reflect(r, mirror);
        detail::reflect(accumulated, mirror);
    }

    QrFactors<T> factors{accumulated.hermitian_transpose(), std::move(r)};
    detail::normalize_diagonal_phase(factors);
    return factors;
}

// Real matrices only; complex input fails with unsupported_operation.
template <typename T> QrFactors<T> givens(const Matrix<T> &matrix) {
    detail::require_square(matrix);
    if constexpr (!is_real_value_v<T>) {
        throw matrix_error(matrix_errc::unsupported_operation,
                           "Givens rotations require a real matrix");
    } else {
        const std::size_t size = matrix.width();
        Matrix<T> r = matrix;
        Matrix<T> rotations = Matrix<T>::identity(size);

        for (std::size_t i = 1; i < size; ++i) {
            for (std::size_t j = 0; j < i; ++j) {
                const T a = r(j, j);
                const T b = r(i, j);
                const double hypotenuse = std::sqrt(norm_squared(a) + norm_squared(b));
                if (hypotenuse == 0.0) {
                    continue;
                }
                const T scale = from_real<T>(hypotenuse);
                const T cosine = a / scale;
                const T sine = -b / scale;
                detail::rotate_rows(r, j, i, cosine, sine);
                detail::rotate_rows(rotations, j, i, cosine, sine);
            }
        }

        return {rotations.transpose(), std::move(r)};
    }
}

// Classical Gram-Schmidt; each column is re-projected while a pass still moves it
// by reortho_epsilon or more in squared norm.
template <typename T>
QrFactors<T> gram_schmidt(const Matrix<T> &matrix,
                          double reortho_epsilon = DEFAULT_REORTHO_EPSILON) {
    detail::require_square(matrix);
    const std::size_t size = matrix.width();
    Matrix<T> q(size, size);
    Matrix<T> r(size, size);

    for (std::size_t j = 0; j < size; ++j) {
        std::vector<T> work(size);
        for (std::size_t k = 0; k < size; ++k) {
            work[k] = matrix(k, j);
        }

        while (true) {
            double delta = 0.0;
            for (std::size_t i = 0; i < j; ++i) {
                T dot{};
                for (std::size_t k = 0; k < size; ++k) {
                    dot = dot + conjugate(q(k, i)) * work[k];
                }
                for (std::size_t k = 0; k < size; ++k) {
                    T projected = work[k] - q(k, i) * dot;
                    delta += norm_squared(projected - work[k]);
                    work[k] = std::move(projected);
                }
            }
            if (!(delta >= reortho_epsilon)) {
                break;
            }
        }

        double work_norm_squared = 0.0;
        for (const auto &entry : work) {
            work_norm_squared += norm_squared(entry);
        }
        const T work_norm = from_real<T>(std::sqrt(work_norm_squared));
        for (std::size_t k = 0; k < size; ++k) {
            q(k, j) = work[k] / work_norm;
        }

        for (std::size_t i = 0; i <= j; ++i) {
            T dot{};
            for (std::size_t k = 0; k < size; ++k) {
                dot = dot + conjugate(q(k, i)) * matrix(k, j);
            }
            r(i, j) = std::move(dot);
        }
    }

    return {std::move(q), std::move(r)};
}

// Without a method the Gram-Schmidt variant is used.
template <typename T>
QrFactors<T> qr_decompose(const Matrix<T> &matrix, std::optional<QrMethod> method = std::nullopt,
                          double reortho_epsilon = DEFAULT_REORTHO_EPSILON) {
    switch (method.value_or(QrMethod::gram_schmidt)) {
    case QrMethod::householder:
        return householder(matrix);
    case QrMethod::givens:
        return givens(matrix);
    case QrMethod::gram_schmidt:
        return gram_schmidt(matrix, reortho_epsilon);
    }
    throw std::invalid_argument("unknown QR method");
}

// Solves Q R x = rhs as R x = Q^H rhs.
template <typename T>
Matrix<T> gauss_from_qr(const Matrix<T> &q, const Matrix<T> &r, const Matrix<T> &rhs) {
    detail::check_triangular_system(q, r, rhs);
    return detail::back_substitute(r, q.hermitian_transpose() * rhs);
}

// Without a method the Householder variant is used.
template <typename T>
Matrix<T> qr_solve(const Matrix<T> &matrix, const Matrix<T> &rhs,
                   std::optional<QrMethod> method = std::nullopt) {
    const QrFactors<T> factors = qr_decompose(matrix, method.value_or(QrMethod::householder));
    return gauss_from_qr(factors.q, factors.r, rhs);
}

extern template QrFactors<double> householder(const Matrix<double> &);
extern template QrFactors<double> givens(const Matrix<double> &);
extern template QrFactors<double> gram_schmidt(const Matrix<double> &, double);
extern template QrFactors<Complex<double>> householder(const Matrix<Complex<double>> &);
extern template QrFactors<Complex<double>> gram_schmidt(const Matrix<Complex<double>> &, double);

} // namespace matfact::linalg
