// include/matfact/core/longint.hpp — Arbitrary-precision signed integer on base-256 digits.

#pragma once

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace matfact::core {

class longint {
public:
    using digit_type = std::uint8_t;
    static constexpr int DIGIT_BITS = 8;
    static constexpr unsigned RADIX = 256;

    longint() noexcept = default;
    longint(const longint&) = default;
    longint(longint&&) noexcept = default;
    longint& operator=(const longint&) = default;
    longint& operator=(longint&&) noexcept = default;

    template <typename Int,
              typename = std::enable_if_t<std::is_integral_v<Int> && !std::is_same_v<Int, bool>>>
    explicit longint(Int value) {
        if (value == 0) {
            return;
        }
        using unsigned_type = std::make_unsigned_t<Int>;
        std::uint64_t magnitude = static_cast<unsigned_type>(value);
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                negative_ = true;
                magnitude = static_cast<unsigned_type>(static_cast<unsigned_type>(0) -
                                                       static_cast<unsigned_type>(value));
            }
        }
        while (magnitude != 0) {
            digits_.push_back(static_cast<digit_type>(magnitude & 0xFFu));
            magnitude >>= DIGIT_BITS;
        }
    }

    static longint zero() noexcept { return {}; }
    static longint one() { return longint(1); }

    static longint from_digits(std::vector<digit_type> digits, bool negative) {
        longint result;
        result.digits_ = std::move(digits);
        result.negative_ = negative;
        result.normalize();
        return result;
    }

    // Truncates toward zero.
    static longint from_double(double value) {
        if (!std::isfinite(value)) {
            throw std::domain_error("longint from non-finite value");
        }
        const double truncated = std::trunc(std::fabs(value));
        if (truncated == 0.0) {
            return zero();
        }
        int exponent = 0;
        const double fraction = std::frexp(truncated, &exponent);
        longint result;
        if (exponent <= 63) {
            result = longint(static_cast<std::uint64_t>(truncated));
        } else {
            const auto mantissa = static_cast<std::uint64_t>(std::ldexp(fraction, 53));
            result = longint(mantissa).shifted_left(static_cast<std::size_t>(exponent - 53));
        }
        result.negative_ = value < 0;
        return result;
    }

    bool is_zero() const noexcept { return digits_.empty(); }
    bool is_negative() const noexcept { return negative_; }
    int signum() const noexcept {
        if (is_zero()) {
            return 0;
        }
        return negative_ ? -1 : 1;
    }

    std::size_t digit_count() const noexcept { return digits_.size(); }
    const std::vector<digit_type>& digits() const noexcept { return digits_; }

    digit_type digit(std::size_t index) const {
        if (index >= digits_.size()) {
            throw std::out_of_range("longint digit index out of range");
        }
        return digits_[index];
    }

    double to_double() const noexcept {
        double result = 0.0;
        for (std::size_t index = digits_.size(); index-- > 0;) {
            result = result * static_cast<double>(RADIX) + static_cast<double>(digits_[index]);
        }
        return negative_ ? -result : result;
    }

    longint abs() const {
        longint copy = *this;
        copy.negative_ = false;
        return copy;
    }

    longint shifted_left(std::size_t bits) const {
        if (is_zero() || bits == 0) {
            return *this;
        }
        const std::size_t whole = bits / DIGIT_BITS;
        const unsigned partial = static_cast<unsigned>(bits % DIGIT_BITS);
        longint result;
        result.negative_ = negative_;
        result.digits_.assign(whole, 0);
        result.digits_.reserve(whole + digits_.size() + 1);
        unsigned carry = 0;
        for (const digit_type value : digits_) {
            const unsigned widened = (static_cast<unsigned>(value) << partial) | carry;
            result.digits_.push_back(static_cast<digit_type>(widened & 0xFFu));
            carry = widened >> DIGIT_BITS;
        }
        if (carry != 0) {
            result.digits_.push_back(static_cast<digit_type>(carry));
        }
        result.normalize();
        return result;
    }

    friend std::strong_ordering operator<=>(const longint& lhs, const longint& rhs) noexcept {
        return lhs.compare(rhs);
    }

    friend bool operator==(const longint& lhs, const longint& rhs) noexcept {
        return lhs.negative_ == rhs.negative_ && lhs.digits_ == rhs.digits_;
    }

    longint& operator+=(const longint& other) {
        if (other.is_zero()) {
            return *this;
        }
        if (is_zero()) {
            *this = other;
            return *this;
        }
        if (negative_ == other.negative_) {
            digits_ = add_magnitude(digits_, other.digits_);
        } else {
            const auto magnitude_cmp = compare_magnitude(digits_, other.digits_);
            if (magnitude_cmp == std::strong_ordering::equal) {
                digits_.clear();
                negative_ = false;
                return *this;
            }
            if (magnitude_cmp == std::strong_ordering::greater) {
                digits_ = subtract_magnitude(digits_, other.digits_);
            } else {
                digits_ = subtract_magnitude(other.digits_, digits_);
                negative_ = other.negative_;
            }
        }
        normalize();
        return *this;
    }

    longint& operator-=(const longint& other) {
        if (other.is_zero()) {
            return *this;
        }
        if (is_zero()) {
            *this = -other;
            return *this;
        }
        if (negative_ != other.negative_) {
            digits_ = add_magnitude(digits_, other.digits_);
        } else {
            const auto magnitude_cmp = compare_magnitude(digits_, other.digits_);
            if (magnitude_cmp == std::strong_ordering::equal) {
                digits_.clear();
                negative_ = false;
                return *this;
            }
            if (magnitude_cmp == std::strong_ordering::greater) {
                digits_ = subtract_magnitude(digits_, other.digits_);
            } else {
                digits_ = subtract_magnitude(other.digits_, digits_);
                negative_ = !negative_;
            }
        }
        normalize();
        return *this;
    }

    longint& operator*=(const longint& other) {
        if (is_zero() || other.is_zero()) {
            digits_.clear();
            negative_ = false;
            return *this;
        }
        digits_ = multiply_magnitude(digits_, other.digits_);
        negative_ = negative_ != other.negative_;
        normalize();
        return *this;
    }

    longint operator-() const {
        if (is_zero()) {
            return *this;
        }
        longint result = *this;
        result.negative_ = !result.negative_;
        return result;
    }

    longint& operator/=(const longint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        *this = std::move(quotient);
        return *this;
    }

    longint& operator%=(const longint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        *this = std::move(remainder);
        return *this;
    }

    friend longint operator+(longint lhs, const longint& rhs) {
        lhs += rhs;
        return lhs;
    }
    friend longint operator-(longint lhs, const longint& rhs) {
        lhs -= rhs;
        return lhs;
    }
    friend longint operator*(longint lhs, const longint& rhs) {
        lhs *= rhs;
        return lhs;
    }
    friend longint operator/(longint lhs, const longint& rhs) {
        lhs /= rhs;
        return lhs;
    }
    friend longint operator%(longint lhs, const longint& rhs) {
        lhs %= rhs;
        return lhs;
    }

    // Quotient truncates toward zero, remainder carries the dividend's sign.
    static std::pair<longint, longint> div_mod(const longint& dividend, const longint& divisor) {
        if (divisor.is_zero()) {
            throw std::domain_error("division by zero");
        }
        if (dividend.is_zero()) {
            return {longint::zero(), longint::zero()};
        }
        longint quotient;
        longint remainder;
        if (compare_magnitude(dividend.digits_, divisor.digits_) == std::strong_ordering::less) {
            remainder.digits_ = dividend.digits_;
        } else {
            auto [quotient_digits, remainder_digits] =
                divide_magnitude(dividend.digits_, divisor.digits_);
            quotient.digits_ = std::move(quotient_digits);
            remainder.digits_ = std::move(remainder_digits);
        }
        quotient.negative_ = !quotient.is_zero() && (dividend.negative_ != divisor.negative_);
        remainder.negative_ = !remainder.is_zero() && dividend.negative_;
        return {std::move(quotient), std::move(remainder)};
    }

private:
    static void trim(std::vector<digit_type>& digits) {
        while (!digits.empty() && digits.back() == 0) {
            digits.pop_back();
        }
    }

    static std::strong_ordering compare_magnitude(const std::vector<digit_type>& lhs,
                                                  const std::vector<digit_type>& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return lhs.size() <=> rhs.size();
        }
        for (std::size_t index = lhs.size(); index-- > 0;) {
            if (lhs[index] != rhs[index]) {
                return lhs[index] <=> rhs[index];
            }
        }
        return std::strong_ordering::equal;
    }

    static std::vector<digit_type> add_magnitude(const std::vector<digit_type>& lhs,
                                                 const std::vector<digit_type>& rhs) {
        const std::size_t max_len = std::max(lhs.size(), rhs.size());
        std::vector<digit_type> result;
        result.reserve(max_len + 1);
        std::uint16_t carry = 0;
        for (std::size_t index = 0; index < max_len; ++index) {
            std::uint16_t sum = carry;
            if (index < lhs.size()) {
                sum = static_cast<std::uint16_t>(sum + lhs[index]);
            }
            if (index < rhs.size()) {
                sum = static_cast<std::uint16_t>(sum + rhs[index]);
            }
            result.push_back(static_cast<digit_type>(sum & 0xFFu));
            carry = static_cast<std::uint16_t>(sum >> DIGIT_BITS);
        }
        if (carry != 0) {
            result.push_back(static_cast<digit_type>(carry));
        }
        return result;
    }

    // Requires |lhs| >= |rhs|.
    static std::vector<digit_type> subtract_magnitude(const std::vector<digit_type>& lhs,
                                                      const std::vector<digit_type>& rhs) {
        std::vector<digit_type> result;
        result.reserve(lhs.size());
        int borrow = 0;
        for (std::size_t index = 0; index < lhs.size(); ++index) {
            int difference = static_cast<int>(lhs[index]) - borrow;
            if (index < rhs.size()) {
                difference -= static_cast<int>(rhs[index]);
            }
            borrow = 0;
            if (difference < 0) {
                difference += static_cast<int>(RADIX);
                borrow = 1;
            }
            result.push_back(static_cast<digit_type>(difference));
        }
        trim(result);
        return result;
    }

    // 255 + 255 * 255 + 255 == 65535, so every step fits the 16-bit accumulator.
    static std::vector<digit_type> multiply_magnitude(const std::vector<digit_type>& lhs,
                                                      const std::vector<digit_type>& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        std::vector<digit_type> result(lhs.size() + rhs.size(), 0);
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            std::uint16_t carry = 0;
            for (std::size_t j = 0; j < rhs.size(); ++j) {
                const std::uint16_t product = static_cast<std::uint16_t>(
                    result[i + j] + static_cast<std::uint16_t>(lhs[i]) * rhs[j] + carry);
                result[i + j] = static_cast<digit_type>(product & 0xFFu);
                carry = static_cast<std::uint16_t>(product >> DIGIT_BITS);
            }
            std::size_t index = i + rhs.size();
            while (carry != 0) {
                const std::uint16_t sum = static_cast<std::uint16_t>(result[index] + carry);
                result[index] = static_cast<digit_type>(sum & 0xFFu);
                carry = static_cast<std::uint16_t>(sum >> DIGIT_BITS);
                ++index;
            }
        }
        trim(result);
        return result;
    }

    static void shift_left_one_bit(std::vector<digit_type>& digits) {
        unsigned carry = 0;
        for (auto& value : digits) {
            const unsigned widened = (static_cast<unsigned>(value) << 1) | carry;
            value = static_cast<digit_type>(widened & 0xFFu);
            carry = widened >> DIGIT_BITS;
        }
        if (carry != 0) {
            digits.push_back(static_cast<digit_type>(carry));
        }
    }

    // Binary long division, one dividend bit at a time from the top.
    static std::pair<std::vector<digit_type>, std::vector<digit_type>>
    divide_magnitude(const std::vector<digit_type>& dividend,
                     const std::vector<digit_type>& divisor) {
        std::vector<digit_type> quotient(dividend.size(), 0);
        std::vector<digit_type> remainder;
        remainder.reserve(divisor.size() + 1);
        for (std::size_t index = dividend.size(); index-- > 0;) {
            for (int bit = DIGIT_BITS - 1; bit >= 0; --bit) {
                shift_left_one_bit(remainder);
                if (((dividend[index] >> bit) & 1u) != 0) {
                    if (remainder.empty()) {
                        remainder.push_back(1);
                    } else {
                        remainder[0] = static_cast<digit_type>(remainder[0] | 1u);
                    }
                }
                if (compare_magnitude(remainder, divisor) != std::strong_ordering::less) {
                    remainder = subtract_magnitude(remainder, divisor);
                    quotient[index] = static_cast<digit_type>(quotient[index] | (1u << bit));
                }
            }
        }
        trim(quotient);
        return {std::move(quotient), std::move(remainder)};
    }

    std::strong_ordering compare(const longint& other) const noexcept {
        if (negative_ != other.negative_) {
            return negative_ ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        const auto magnitude_cmp = compare_magnitude(digits_, other.digits_);
        if (negative_) {
            return 0 <=> magnitude_cmp;
        }
        return magnitude_cmp;
    }

    void normalize() {
        trim(digits_);
        if (digits_.empty()) {
            negative_ = false;
        }
    }

    std::vector<digit_type> digits_;
    bool negative_ = false;
};

inline longint abs(const longint& value) {
    return value.abs();
}

} // namespace matfact::core
