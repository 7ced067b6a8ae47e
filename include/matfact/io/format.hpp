// include/matfact/io/format.hpp — Human-readable rendering of scalars, polynomials and matrices.

#pragma once

#include <algorithm>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <matfact/complex.hpp>
#include <matfact/core/longint.hpp>
#include <matfact/fraction.hpp>
#include <matfact/matrix.hpp>
#include <matfact/polynome.hpp>

namespace matfact::io {

    inline std::string to_string(const matfact::core::longint &value, int base = 10) {
        if (base < 2 || base > 36) {
            throw std::invalid_argument("supported bases are 2..36");
        }
        if (value.is_zero()) {
            return "0";
        }
        matfact::core::longint cursor = value.abs();
        const matfact::core::longint base_value(base);
        std::string digits;
        while (!cursor.is_zero()) {
            auto [quotient, remainder] = matfact::core::longint::div_mod(cursor, base_value);
            cursor = std::move(quotient);
            const int digit_value = remainder.is_zero() ? 0 : remainder.digit(0);
            if (digit_value < 10) {
                digits.push_back(static_cast<char>('0' + digit_value));
            } else {
                digits.push_back(static_cast<char>('a' + digit_value - 10));
            }
        }
        if (value.is_negative()) {
            digits.push_back('-');
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    // Base-256 digits as two uppercase nibbles each, least significant first: "|2C|01|".
    inline std::string to_hex_string(const matfact::core::longint &value) {
        if (value.is_zero()) {
            return "|00|";
        }
        static constexpr char nibbles[] = "0123456789ABCDEF";
        std::string result = value.is_negative() ? "-|" : "|";
        for (const auto digit : value.digits()) {
            result.push_back(nibbles[digit >> 4]);
            result.push_back(nibbles[digit & 0x0F]);
            result.push_back('|');
        }
        return result;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    inline std::string to_string(Int value) {
        return std::to_string(value);
    }

    inline std::string to_string(double value) {
        std::ostringstream os;
        os << value;
        return os.str();
    }

    // "a+bi", "a-bi", "bi", "a" or "0".
    template <typename Component> std::string to_string(const Complex<Component> &value) {
        const Component zero{};
        if (value.real() == zero) {
            if (value.imag() == zero) {
                return "0";
            }
            return to_string(value.imag()) + "i";
        }
        if (value.imag() == zero) {
            return to_string(value.real());
        }
        const std::string sign = value.imag() > zero ? "+" : "";
        return to_string(value.real()) + sign + to_string(value.imag()) + "i";
    }

    template <typename T> std::string to_string(const Fraction<T> &value) {
        return to_string(value.numerator()) + "/" + to_string(value.denominator());
    }

    // Highest power first, as an Octave column vector: "[-1; 6; -10; 4]".
    template <typename T> std::string to_string(const Polynome<T> &value) {
        if (value.empty()) {
            return "[]";
        }
        std::string result = "[";
        const auto &coeffs = value.coefficients();
        for (std::size_t index = coeffs.size(); index-- > 0;) {
            result += to_string(coeffs[index]);
            result += index == 0 ? "]" : "; ";
        }
        return result;
    }

    // One "| a b |" line per row.
    template <typename T> std::string to_string(const Matrix<T> &value) {
        if (value.width() == 0 || value.height() == 0) {
            return "[ ]";
        }
        std::string result;
        for (std::size_t row = 0; row < value.height(); ++row) {
            result += "| ";
            for (std::size_t column = 0; column < value.width(); ++column) {
                result += to_string(value(row, column));
                result += ' ';
            }
            result += "|\n";
        }
        return result;
    }

    inline std::ostream &operator<<(std::ostream &os, const matfact::core::longint &value) {
        return os << to_string(value);
    }

    template <typename Component>
    std::ostream &operator<<(std::ostream &os, const Complex<Component> &value) {
        return os << to_string(value);
    }

    template <typename T> std::ostream &operator<<(std::ostream &os, const Fraction<T> &value) {
        return os << to_string(value);
    }

    template <typename T> std::ostream &operator<<(std::ostream &os, const Polynome<T> &value) {
        return os << to_string(value);
    }

    template <typename T> std::ostream &operator<<(std::ostream &os, const Matrix<T> &value) {
        return os << to_string(value);
    }

} // namespace matfact::io
