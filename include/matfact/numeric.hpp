// include/matfact/numeric.hpp — Numeric value traits shared by every matrix algorithm.

#pragma once

#include <cmath>
#include <type_traits>

#include <matfact/core/longint.hpp>

namespace matfact {

// Specialized for every scalar the engines accept. Each specialization supplies
// from_real, norm_squared (a double approximation), conjugate and absolute.
template <typename T, typename = void> struct number_traits {
    static constexpr bool is_specialized = false;
    static constexpr bool is_real = false;
};

template <typename T> struct number_traits<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_real = true;

    static T from_real(double value) { return static_cast<T>(value); }
    static double to_double(T value) noexcept { return static_cast<double>(value); }
    static double norm_squared(T value) noexcept {
        return static_cast<double>(value) * static_cast<double>(value);
    }
    static T conjugate(T value) noexcept { return value; }
    static T absolute(T value) noexcept { return std::abs(value); }
};

template <typename T>
struct number_traits<T,
                     std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_real = true;

    static T from_real(double value) { return static_cast<T>(value); }
    static double to_double(T value) noexcept { return static_cast<double>(value); }
    static double norm_squared(T value) noexcept {
        const double widened = static_cast<double>(value);
        return widened * widened;
    }
    static T conjugate(T value) noexcept { return value; }
    static T absolute(T value) noexcept { return value < 0 ? -value : value; }
};

template <> struct number_traits<core::longint> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_real = true;

    static core::longint from_real(double value) { return core::longint::from_double(value); }
    static double to_double(const core::longint& value) noexcept { return value.to_double(); }
    static double norm_squared(const core::longint& value) noexcept {
        const double approx = value.to_double();
        return approx * approx;
    }
    static core::longint conjugate(const core::longint& value) { return value; }
    static core::longint absolute(const core::longint& value) { return value.abs(); }
};

template <typename T> inline constexpr bool is_numeric_value_v = number_traits<T>::is_specialized;

template <typename T> inline constexpr bool is_real_value_v = number_traits<T>::is_real;

template <typename T> inline T from_real(double value) {
    return number_traits<T>::from_real(value);
}

template <typename T> inline double norm_squared(const T& value) {
    return number_traits<T>::norm_squared(value);
}

template <typename T> inline double norm(const T& value) {
    return std::sqrt(number_traits<T>::norm_squared(value));
}

template <typename T> inline T conjugate(const T& value) {
    return number_traits<T>::conjugate(value);
}

template <typename T> inline T absolute(const T& value) {
    return number_traits<T>::absolute(value);
}

} // namespace matfact
