// tests/unit/test_longint.cpp — Unit tests for longint arithmetic, division and formatting.

#include <matfact/matfact.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using matfact::core::longint;

longint random_small_longint(std::mt19937_64& rng) {
    static std::uniform_int_distribution<std::int64_t> dist(-1'000'000, 1'000'000);
    return longint(dist(rng));
}

bool check_equal(const longint& lhs, const longint& rhs, std::string_view label) {
    if (lhs == rhs) {
        return true;
    }
    std::cerr << label << " mismatch: " << matfact::io::to_string(lhs) << " != "
              << matfact::io::to_string(rhs) << "\n";
    return false;
}

bool check_text(const std::string& actual, const std::string& expected, std::string_view label) {
    if (actual == expected) {
        return true;
    }
    std::cerr << label << ": expected \"" << expected << "\", got \"" << actual << "\"\n";
    return false;
}

bool test_construction() {
    if (!longint().is_zero() || longint().is_negative() || longint().signum() != 0) {
        std::cerr << "default longint is not canonical zero\n";
        return false;
    }
    const longint value(300);
    if (value.digit_count() != 2 || value.digit(0) != 0x2C || value.digit(1) != 0x01) {
        std::cerr << "300 should be stored as little-endian base-256 digits\n";
        return false;
    }
    if (longint(-5).signum() != -1 || longint(5).signum() != 1) {
        std::cerr << "signum mismatch\n";
        return false;
    }
    if (!longint::from_digits({0, 0, 0}, true).is_zero() ||
        longint::from_digits({0, 0, 0}, true).is_negative()) {
        std::cerr << "zero digits must normalize to positive zero\n";
        return false;
    }
    if (!check_equal(-longint(0), longint(0), "negated zero")) {
        return false;
    }
    try {
        (void)value.digit(2);
        std::cerr << "digit index past the end should throw\n";
        return false;
    } catch (const std::out_of_range&) {
    }
    return true;
}

bool test_multiply_scenario() {
    const longint product = longint(300) * longint(300);
    if (!check_text(matfact::io::to_string(product), "90000", "300 * 300")) {
        return false;
    }
    if (!check_text(matfact::io::to_string(longint(-7) * longint(6)), "-42", "-7 * 6")) {
        return false;
    }
    return check_text(matfact::io::to_string(longint(-7) * longint(-6)), "42", "-7 * -6");
}

bool test_add_sub_properties(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 64; ++iteration) {
        const auto a = random_small_longint(rng);
        const auto b = random_small_longint(rng);
        if (!check_equal((a + b) - b, a, "(a + b) - b")) {
            return false;
        }
        if (!check_equal(a - b, -(b - a), "a - b antisymmetry")) {
            return false;
        }
        if (!check_equal(a + b, b + a, "addition commutes")) {
            return false;
        }
    }
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = matfact::util::random_longint(rng, 24);
        const auto b = matfact::util::random_longint(rng, 17);
        if (!check_equal((a + b) - b, a, "wide (a + b) - b")) {
            return false;
        }
    }
    return true;
}

bool test_sign_cases() {
    const std::vector<std::int64_t> values = {-300, -256, -255, -1, 0, 1, 255, 256, 300, 65536};
    for (const auto lhs : values) {
        for (const auto rhs : values) {
            if (!check_equal(longint(lhs) + longint(rhs), longint(lhs + rhs), "signed sum")) {
                return false;
            }
            if (!check_equal(longint(lhs) - longint(rhs), longint(lhs - rhs), "signed difference")) {
                return false;
            }
            if (!check_equal(longint(lhs) * longint(rhs), longint(lhs * rhs), "signed product")) {
                return false;
            }
            const auto ordering = longint(lhs) <=> longint(rhs);
            if (ordering != (lhs <=> rhs)) {
                std::cerr << "ordering mismatch for " << lhs << " and " << rhs << "\n";
                return false;
            }
        }
    }
    return true;
}

bool test_div_mod(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 64; ++iteration) {
        const auto dividend = random_small_longint(rng);
        auto divisor = random_small_longint(rng);
        if (divisor.is_zero()) {
            divisor = longint(1);
        }
        const auto [quotient, remainder] = longint::div_mod(dividend, divisor);
        if (!check_equal(quotient * divisor + remainder, dividend, "div_mod reconstruction")) {
            return false;
        }
        if (!remainder.is_zero()) {
            if (remainder.is_negative() != dividend.is_negative()) {
                std::cerr << "remainder sign does not match dividend\n";
                return false;
            }
            if (!(remainder.abs() < divisor.abs())) {
                std::cerr << "remainder magnitude not less than divisor\n";
                return false;
            }
        }
    }
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = matfact::util::random_longint(rng, 20);
        auto b = matfact::util::random_longint(rng, 9);
        if (b.is_zero()) {
            b = longint(3);
        }
        if (a.is_zero()) {
            continue;
        }
        if (!check_equal((a * b) / b, a, "(a * b) / b")) {
            return false;
        }
        if (!(((a * b) % b).is_zero())) {
            std::cerr << "(a * b) % b should vanish\n";
            return false;
        }
    }
    if (!check_equal(longint(-7) / longint(2), longint(-3), "truncating quotient")) {
        return false;
    }
    return check_equal(longint(-7) % longint(2), longint(-1), "remainder follows dividend");
}

bool test_division_by_zero() {
    try {
        (void)(longint(12) / longint());
        std::cerr << "division by zero should throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    try {
        (void)(longint(12) % longint());
        std::cerr << "modulus by zero should throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

bool test_decimal_roundtrip(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 16; ++iteration) {
        const auto original = matfact::util::random_longint(rng, 1 + iteration);
        const std::string text = matfact::io::to_string(original);
        const auto parsed = matfact::io::from_string<longint>(text);
        if (!check_equal(parsed, original, "decimal roundtrip")) {
            return false;
        }
    }
    const std::string big = "123456789012345678901234567890";
    const auto value = matfact::io::from_string<longint>(big);
    if (!check_text(matfact::io::to_string(value), big, "long decimal")) {
        return false;
    }
    if (!check_text(matfact::io::to_string(longint(255), 16), "ff", "base 16")) {
        return false;
    }
    try {
        (void)matfact::io::from_string<longint>("12x4");
        std::cerr << "invalid digit should throw\n";
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_hex_format() {
    if (!check_text(matfact::io::to_hex_string(longint()), "|00|", "zero hex")) {
        return false;
    }
    if (!check_text(matfact::io::to_hex_string(longint(300)), "|2C|01|", "300 hex")) {
        return false;
    }
    return check_text(matfact::io::to_hex_string(longint(-300)), "-|2C|01|", "-300 hex");
}

bool test_real_conversions() {
    if (!check_equal(longint::from_double(-2.7), longint(-2), "truncation toward zero")) {
        return false;
    }
    if (!check_equal(longint::from_double(0.5), longint(), "fraction below one")) {
        return false;
    }
    if (!check_text(matfact::io::to_string(longint::from_double(1e20)), "100000000000000000000",
                    "wide double")) {
        return false;
    }
    if (longint(123456789).to_double() != 123456789.0) {
        std::cerr << "to_double mismatch\n";
        return false;
    }
    if (matfact::norm_squared(longint(-12)) != 144.0) {
        std::cerr << "norm_squared of longint\n";
        return false;
    }
    if (!check_equal(matfact::absolute(longint(-12)), longint(12), "absolute")) {
        return false;
    }
    if (!check_equal(matfact::conjugate(longint(-12)), longint(-12), "conjugate")) {
        return false;
    }
    try {
        (void)matfact::from_real<longint>(std::numeric_limits<double>::infinity());
        std::cerr << "infinite input should throw\n";
        return false;
    } catch (const std::domain_error&) {
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0x5eed1234);
    if (!test_construction()) {
        return 1;
    }
    if (!test_multiply_scenario()) {
        return 1;
    }
    if (!test_add_sub_properties(rng)) {
        return 1;
    }
    if (!test_sign_cases()) {
        return 1;
    }
    if (!test_div_mod(rng)) {
        return 1;
    }
    if (!test_division_by_zero()) {
        return 1;
    }
    if (!test_decimal_roundtrip(rng)) {
        return 1;
    }
    if (!test_hex_format()) {
        return 1;
    }
    if (!test_real_conversions()) {
        return 1;
    }
    std::cout << "longint tests passed\n";
    return 0;
}
