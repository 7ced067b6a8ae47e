// include/matfact/complex.hpp — Complex numbers over a real component type.

#pragma once

#include <cmath>

#include <matfact/numeric.hpp>

namespace matfact {

template <typename Component> class Complex {
  public:
    using component_type = Component;

    Complex() noexcept = default;
    Complex(Component real) : real_(real) {
    }
    Complex(Component real, Component imag) : real_(real), imag_(imag) {
    }

    const Component &real() const noexcept {
        return real_;
    }
    const Component &imag() const noexcept {
        return imag_;
    }

    Component abs_squared() const {
        return real_ * real_ + imag_ * imag_;
    }
    Component abs() const {
        using std::sqrt;
        return sqrt(abs_squared());
    }
    Complex conjugate() const {
        return Complex(real_, -imag_);
    }

    Complex &operator+=(const Complex &other) {
        real_ += other.real_;
        imag_ += other.imag_;
        return *this;
    }

    Complex &operator-=(const Complex &other) {
        real_ -= other.real_;
        imag_ -= other.imag_;
        return *this;
    }

    Complex &operator*=(const Complex &other) {
        const Component real_part = real_ * other.real_ - imag_ * other.imag_;
        const Component imag_part = real_ * other.imag_ + imag_ * other.real_;
        real_ = real_part;
        imag_ = imag_part;
        return *this;
    }

    // Multiplies by the conjugate of the divisor, then scales by its squared magnitude.
    Complex &operator/=(const Complex &other) {
        const Component scale = other.abs_squared();
        *this *= other.conjugate();
        real_ /= scale;
        imag_ /= scale;
        return *this;
    }

    Complex operator-() const {
        return Complex(-real_, -imag_);
    }

    friend Complex operator+(Complex lhs, const Complex &rhs) {
        lhs += rhs;
        return lhs;
    }

    friend Complex operator-(Complex lhs, const Complex &rhs) {
        lhs -= rhs;
        return lhs;
    }

    friend Complex operator*(Complex lhs, const Complex &rhs) {
        lhs *= rhs;
        return lhs;
    }

    friend Complex operator/(Complex lhs, const Complex &rhs) {
        lhs /= rhs;
        return lhs;
    }

    friend bool operator==(const Complex &lhs, const Complex &rhs) noexcept {
        return lhs.real_ == rhs.real_ && lhs.imag_ == rhs.imag_;
    }

  private:
    Component real_{};
    Component imag_{};
};

template <typename Component> struct number_traits<Complex<Component>> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_real = false;

    static Complex<Component> from_real(double value) {
        return Complex<Component>(number_traits<Component>::from_real(value));
    }
    static double norm_squared(const Complex<Component> &value) {
        return number_traits<Component>::norm_squared(value.real()) +
               number_traits<Component>::norm_squared(value.imag());
    }
    static Complex<Component> conjugate(const Complex<Component> &value) {
        return value.conjugate();
    }
    static Complex<Component> absolute(const Complex<Component> &value) {
        return Complex<Component>(value.abs());
    }
};

} // namespace matfact
