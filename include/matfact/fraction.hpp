// include/matfact/fraction.hpp — Reduced rational numbers over an integer-like type.

#pragma once

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <matfact/core/longint.hpp>
#include <matfact/numeric.hpp>

namespace matfact {

namespace detail {

    template <typename T> T magnitude(const T &value) {
        if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            if (value == std::numeric_limits<T>::min()) {
                throw std::overflow_error("magnitude of the most negative value overflows");
            }
            return value < 0 ? static_cast<T>(-value) : value;
        } else if constexpr (std::is_integral_v<T>) {
            return value;
        } else {
            return abs(value);
        }
    }

    template <typename T> T gcd(T lhs, T rhs) {
        const T zero(0);
        while (!(rhs == zero)) {
            T next = lhs % rhs;
            lhs = std::move(rhs);
            rhs = std::move(next);
        }
        return lhs;
    }

    template <typename T> T power_of_two(int exponent) {
        if constexpr (std::is_integral_v<T>) {
            if (exponent >= std::numeric_limits<T>::digits) {
                throw std::overflow_error("power of two exceeds the fraction base type");
            }
            return static_cast<T>(T(1) << exponent);
        } else {
            return core::longint::one().shifted_left(static_cast<std::size_t>(exponent));
        }
    }

} // namespace detail

template <typename T> class Fraction {
  public:
    using value_type = T;

    Fraction() : numerator_(0), denominator_(1) {
    }
    explicit Fraction(T integer) : numerator_(std::move(integer)), denominator_(1) {
    }
    // Denominator first; the sign ends up on the numerator.
    Fraction(T denominator, T numerator) {
        normalize(std::move(denominator), std::move(numerator));
    }

    static Fraction zero() {
        return Fraction();
    }

    // Exact: every finite double is a dyadic rational.
    static Fraction from_double(double value) {
        if (!std::isfinite(value)) {
            throw std::domain_error("fraction from non-finite value");
        }
        if (value == 0.0) {
            return zero();
        }
        int exponent = 0;
        const double fraction = std::frexp(std::fabs(value), &exponent);
        auto mantissa = static_cast<std::int64_t>(std::ldexp(fraction, 53));
        exponent -= 53;
        while ((mantissa & 1) == 0) {
            mantissa >>= 1;
            ++exponent;
        }
        if constexpr (std::is_integral_v<T>) {
            int width = 0;
            for (std::int64_t probe = mantissa; probe != 0; probe >>= 1) {
                ++width;
            }
            if (width + std::max(exponent, 0) > std::numeric_limits<T>::digits) {
                throw std::overflow_error("value exceeds the fraction base type");
            }
        }
        if (value < 0) {
            mantissa = -mantissa;
        }
        if (exponent >= 0) {
            return Fraction(T(mantissa) * detail::power_of_two<T>(exponent));
        }
        return Fraction(detail::power_of_two<T>(-exponent), T(mantissa));
    }

    const T &numerator() const noexcept {
        return numerator_;
    }
    const T &denominator() const noexcept {
        return denominator_;
    }
    bool is_zero() const {
        return numerator_ == T(0);
    }

    double to_double() const {
        return number_traits<T>::to_double(numerator_) / number_traits<T>::to_double(denominator_);
    }

    Fraction abs() const {
        Fraction copy = *this;
        copy.numerator_ = detail::magnitude(copy.numerator_);
        return copy;
    }

    Fraction operator-() const {
        Fraction copy = *this;
        copy.numerator_ = -copy.numerator_;
        return copy;
    }

    friend Fraction operator+(const Fraction &lhs, const Fraction &rhs) {
        T numerator = lhs.numerator_ * rhs.denominator_ + rhs.numerator_ * lhs.denominator_;
        T denominator = lhs.denominator_ * rhs.denominator_;
        return Fraction(std::move(denominator), std::move(numerator));
    }

    friend Fraction operator-(const Fraction &lhs, const Fraction &rhs) {
        T numerator = lhs.numerator_ * rhs.denominator_ - rhs.numerator_ * lhs.denominator_;
        T denominator = lhs.denominator_ * rhs.denominator_;
        return Fraction(std::move(denominator), std::move(numerator));
    }

    friend Fraction operator*(const Fraction &lhs, const Fraction &rhs) {
        T numerator = lhs.numerator_ * rhs.numerator_;
        T denominator = lhs.denominator_ * rhs.denominator_;
        return Fraction(std::move(denominator), std::move(numerator));
    }

    friend Fraction operator/(const Fraction &lhs, const Fraction &rhs) {
        if (rhs.is_zero()) {
            throw std::domain_error("fraction division by zero");
        }
        T numerator = lhs.numerator_ * rhs.denominator_;
        T denominator = lhs.denominator_ * rhs.numerator_;
        return Fraction(std::move(denominator), std::move(numerator));
    }

    Fraction &operator+=(const Fraction &other) {
        *this = *this + other;
        return *this;
    }
    Fraction &operator-=(const Fraction &other) {
        *this = *this - other;
        return *this;
    }
    Fraction &operator*=(const Fraction &other) {
        *this = *this * other;
        return *this;
    }
    Fraction &operator/=(const Fraction &other) {
        *this = *this / other;
        return *this;
    }

    friend std::strong_ordering operator<=>(const Fraction &lhs, const Fraction &rhs) {
        const T left = lhs.numerator_ * rhs.denominator_;
        const T right = rhs.numerator_ * lhs.denominator_;
        return left <=> right;
    }

    friend bool operator==(const Fraction &lhs, const Fraction &rhs) {
        return lhs.numerator_ == rhs.numerator_ && lhs.denominator_ == rhs.denominator_;
    }

  private:
    void normalize(T denominator, T numerator) {
        const T zero(0);
        if (denominator == zero) {
            throw std::domain_error("fraction with zero denominator");
        }
        const bool negative = (numerator < zero) != (denominator < zero);
        numerator = detail::magnitude(numerator);
        denominator = detail::magnitude(denominator);
        const T divisor = detail::gcd(numerator, denominator);
        numerator_ = numerator / divisor;
        denominator_ = denominator / divisor;
        if (negative) {
            numerator_ = -numerator_;
        }
    }

    T numerator_;
    T denominator_;
};

template <typename T> struct number_traits<Fraction<T>> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_real = true;

    static Fraction<T> from_real(double value) {
        return Fraction<T>::from_double(value);
    }
    static double to_double(const Fraction<T> &value) {
        return value.to_double();
    }
    static double norm_squared(const Fraction<T> &value) {
        const double approx = value.to_double();
        return approx * approx;
    }
    static Fraction<T> conjugate(const Fraction<T> &value) {
        return value;
    }
    static Fraction<T> absolute(const Fraction<T> &value) {
        return value.abs();
    }
};

} // namespace matfact
