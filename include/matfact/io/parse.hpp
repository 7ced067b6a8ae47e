// include/matfact/io/parse.hpp — Parsing longint and fraction values from text.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <matfact/core/longint.hpp>
#include <matfact/fraction.hpp>

namespace matfact::io {

namespace detail {

    inline int digit_value(char ch) noexcept {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'a' && ch <= 'z') {
            return ch - 'a' + 10;
        }
        if (ch >= 'A' && ch <= 'Z') {
            return ch - 'A' + 10;
        }
        return -1;
    }

} // namespace detail

template <typename Int>
inline Int from_string(std::string_view text, int base = 10) {
    static_assert(std::is_same_v<Int, matfact::core::longint>, "from_string supports longint");
    if (base < 2 || base > 36) {
        throw std::invalid_argument("supported bases are 2..36");
    }
    if (text.empty()) {
        throw std::invalid_argument("empty string");
    }
    std::size_t index = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = (text[0] == '-');
        ++index;
        if (index == text.size()) {
            throw std::invalid_argument("string has only a sign");
        }
    }
    matfact::core::longint accumulator;
    const matfact::core::longint base_value(base);
    for (; index < text.size(); ++index) {
        const int digit = detail::digit_value(text[index]);
        if (digit < 0 || digit >= base) {
            throw std::invalid_argument("invalid digit in string");
        }
        accumulator *= base_value;
        accumulator += matfact::core::longint(digit);
    }
    if (negative) {
        accumulator = -accumulator;
    }
    return accumulator;
}

// Accepts "n" or "n/d" in decimal.
inline Fraction<matfact::core::longint> fraction_from_string(std::string_view text) {
    const std::size_t slash = text.find('/');
    if (slash == std::string_view::npos) {
        return Fraction<matfact::core::longint>(from_string<matfact::core::longint>(text));
    }
    return Fraction<matfact::core::longint>(
        from_string<matfact::core::longint>(text.substr(slash + 1)),
        from_string<matfact::core::longint>(text.substr(0, slash)));
}

} // namespace matfact::io
