// include/matfact/matrix.hpp — Dense row-major matrices over any numeric value.

#pragma once

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <matfact/complex.hpp>
#include <matfact/error.hpp>
#include <matfact/numeric.hpp>

namespace matfact {

template <typename T> class Matrix {
  public:
    static_assert(is_numeric_value_v<T>, "Matrix requires a numeric value type");

    using value_type = T;

    Matrix() noexcept = default;
    Matrix(std::size_t width, std::size_t height)
        : width_(width), height_(height), elements_(width * height, value_type{}) {
    }

    static Matrix from_vector(std::vector<value_type> elements, std::size_t width) {
        if (width == 0 ? !elements.empty() : elements.size() % width != 0) {
            throw matrix_error(matrix_errc::size_mismatch,
                               std::to_string(elements.size()) + " elements in rows of " +
                                   std::to_string(width));
        }
        Matrix result;
        result.width_ = width;
        result.height_ = width == 0 ? 0 : elements.size() / width;
        result.elements_ = std::move(elements);
        return result;
    }

    static Matrix from_rows(std::initializer_list<std::initializer_list<value_type>> rows) {
        const std::size_t width = rows.size() == 0 ? 0 : rows.begin()->size();
        std::vector<value_type> elements;
        elements.reserve(width * rows.size());
        for (const auto &row : rows) {
            if (row.size() != width) {
                throw matrix_error(matrix_errc::size_mismatch, "ragged row list");
            }
            elements.insert(elements.end(), row.begin(), row.end());
        }
        return from_vector(std::move(elements), width);
    }

    static Matrix identity(std::size_t size) {
        Matrix result(size, size);
        const value_type one = from_real<value_type>(1.0);
        for (std::size_t index = 0; index < size; ++index) {
            result(index, index) = one;
        }
        return result;
    }

    // Every cell receives the value, not only the diagonal.
    static Matrix scalar(const value_type &value, std::size_t size) {
        Matrix result;
        result.width_ = size;
        result.height_ = size;
        result.elements_.assign(size * size, value);
        return result;
    }

    std::size_t width() const noexcept {
        return width_;
    }
    std::size_t height() const noexcept {
        return height_;
    }
    bool is_square() const noexcept {
        return width_ == height_;
    }

    const std::vector<value_type> &elements() const noexcept {
        return elements_;
    }

    value_type &operator()(std::size_t row, std::size_t column) {
        check_index(row, column);
        return elements_[row * width_ + column];
    }

    const value_type &operator()(std::size_t row, std::size_t column) const {
        check_index(row, column);
        return elements_[row * width_ + column];
    }

    const value_type &get(std::size_t row, std::size_t column) const {
        return (*this)(row, column);
    }

    void set(std::size_t row, std::size_t column, value_type value) {
        (*this)(row, column) = std::move(value);
    }

    Matrix transpose() const {
        Matrix result(height_, width_);
        for (std::size_t row = 0; row < height_; ++row) {
            for (std::size_t column = 0; column < width_; ++column) {
                result(column, row) = (*this)(row, column);
            }
        }
        return result;
    }

    Matrix hermitian_transpose() const {
        Matrix result(height_, width_);
        for (std::size_t row = 0; row < height_; ++row) {
            for (std::size_t column = 0; column < width_; ++column) {
                result(column, row) = conjugate((*this)(row, column));
            }
        }
        return result;
    }

    Matrix row(std::size_t index) const {
        Matrix result(width_, 1);
        for (std::size_t column = 0; column < width_; ++column) {
            result(0, column) = (*this)(index, column);
        }
        return result;
    }

    Matrix column(std::size_t index) const {
        Matrix result(1, height_);
        for (std::size_t row = 0; row < height_; ++row) {
            result(row, 0) = (*this)(row, index);
        }
        return result;
    }

    // Sum of the squared norms of all entries.
    double norm_squared() const {
        double sum = 0.0;
        for (const auto &element : elements_) {
            sum += matfact::norm_squared(element);
        }
        return sum;
    }

    double norm() const {
        return std::sqrt(norm_squared());
    }

    Matrix &operator+=(const Matrix &other) {
        ensure_same_shape(other);
        for (std::size_t index = 0; index < elements_.size(); ++index) {
            elements_[index] = elements_[index] + other.elements_[index];
        }
        return *this;
    }

    Matrix &operator-=(const Matrix &other) {
        ensure_same_shape(other);
        for (std::size_t index = 0; index < elements_.size(); ++index) {
            elements_[index] = elements_[index] - other.elements_[index];
        }
        return *this;
    }

    Matrix &operator*=(const value_type &scalar) {
        for (auto &element : elements_) {
            element = element * scalar;
        }
        return *this;
    }

    Matrix &operator/=(const value_type &scalar) {
        for (auto &element : elements_) {
            element = element / scalar;
        }
        return *this;
    }

    friend Matrix operator+(Matrix lhs, const Matrix &rhs) {
        lhs += rhs;
        return lhs;
    }

    friend Matrix operator-(Matrix lhs, const Matrix &rhs) {
        lhs -= rhs;
        return lhs;
    }

    friend Matrix operator*(Matrix lhs, const value_type &scalar) {
        lhs *= scalar;
        return lhs;
    }

    friend Matrix operator*(const value_type &scalar, Matrix rhs) {
        for (auto &element : rhs.elements_) {
            element = scalar * element;
        }
        return rhs;
    }

    friend Matrix operator/(Matrix lhs, const value_type &scalar) {
        lhs /= scalar;
        return lhs;
    }

    friend Matrix operator*(const Matrix &lhs, const Matrix &rhs) {
        if (lhs.width_ != rhs.height_) {
            throw matrix_error(matrix_errc::size_mismatch,
                               lhs.shape() + " times " + rhs.shape());
        }
        Matrix result(rhs.width_, lhs.height_);
        for (std::size_t row = 0; row < lhs.height_; ++row) {
            for (std::size_t column = 0; column < rhs.width_; ++column) {
                value_type sum{};
                for (std::size_t inner = 0; inner < lhs.width_; ++inner) {
                    sum = sum + lhs.elements_[row * lhs.width_ + inner] *
                                    rhs.elements_[inner * rhs.width_ + column];
                }
                result.elements_[row * result.width_ + column] = std::move(sum);
            }
        }
        return result;
    }

    friend bool operator==(const Matrix &lhs, const Matrix &rhs) {
        return lhs.width_ == rhs.width_ && lhs.height_ == rhs.height_ &&
               lhs.elements_ == rhs.elements_;
    }

    std::string shape() const {
        return std::to_string(height_) + "x" + std::to_string(width_);
    }

  private:
    void check_index(std::size_t row, std::size_t column) const {
        if (row >= height_ || column >= width_) {
            throw std::out_of_range("matrix index (" + std::to_string(row) + ", " +
                                    std::to_string(column) + ") outside " + shape());
        }
    }

    void ensure_same_shape(const Matrix &other) const {
        if (width_ != other.width_ || height_ != other.height_) {
            throw matrix_error(matrix_errc::size_mismatch, shape() + " against " + other.shape());
        }
    }

    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::vector<value_type> elements_;
};

// Converts a real matrix entry by entry through from_real.
template <typename To, typename From> Matrix<To> matrix_cast(const Matrix<From> &source) {
    static_assert(is_real_value_v<From>, "matrix_cast reads real-valued sources");
    Matrix<To> result(source.width(), source.height());
    for (std::size_t row = 0; row < source.height(); ++row) {
        for (std::size_t column = 0; column < source.width(); ++column) {
            result(row, column) =
                from_real<To>(number_traits<From>::to_double(source(row, column)));
        }
    }
    return result;
}

template <typename Component>
Matrix<Complex<Component>> make_complex(const Matrix<Component> &real,
                                        const Matrix<Component> &imag) {
    if (real.width() != imag.width() || real.height() != imag.height()) {
        throw matrix_error(matrix_errc::size_mismatch,
                           real.shape() + " real part against " + imag.shape() + " imaginary part");
    }
    Matrix<Complex<Component>> result(real.width(), real.height());
    for (std::size_t row = 0; row < real.height(); ++row) {
        for (std::size_t column = 0; column < real.width(); ++column) {
            result(row, column) = Complex<Component>(real(row, column), imag(row, column));
        }
    }
    return result;
}

template <typename T> double residual_norm(const Matrix<T> &lhs, const Matrix<T> &rhs) {
    return (lhs - rhs).norm();
}

} // namespace matfact
