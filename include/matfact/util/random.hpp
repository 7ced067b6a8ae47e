#pragma once

#include <cstddef>
#include <random>
#include <utility>
#include <vector>

#include <matfact/complex.hpp>
#include <matfact/core/longint.hpp>
#include <matfact/matrix.hpp>

namespace matfact::util {

inline matfact::core::longint random_longint(std::mt19937_64& generator,
                                             std::size_t digit_count,
                                             bool allow_negative = true) {
    if (digit_count == 0) {
        return matfact::core::longint::zero();
    }
    std::uniform_int_distribution<int> digit_dist(0, 255);
    std::vector<matfact::core::longint::digit_type> digits(digit_count);
    for (auto& digit : digits) {
        digit = static_cast<matfact::core::longint::digit_type>(digit_dist(generator));
    }
    bool negative = false;
    if (allow_negative) {
        std::bernoulli_distribution sign_dist(0.5);
        negative = sign_dist(generator);
    }
    return matfact::core::longint::from_digits(std::move(digits), negative);
}

inline matfact::Matrix<double> random_matrix(std::mt19937_64& generator,
                                             std::size_t width,
                                             std::size_t height,
                                             double low = -1.0,
                                             double high = 1.0) {
    std::uniform_real_distribution<double> value_dist(low, high);
    std::vector<double> elements(width * height);
    for (auto& element : elements) {
        element = value_dist(generator);
    }
    return matfact::Matrix<double>::from_vector(std::move(elements), width);
}

// Adds size to each diagonal entry so every leading principal minor stays away from zero.
inline matfact::Matrix<double> random_diagonally_dominant(std::mt19937_64& generator,
                                                          std::size_t size) {
    matfact::Matrix<double> result = random_matrix(generator, size, size);
    for (std::size_t index = 0; index < size; ++index) {
        result(index, index) += static_cast<double>(size);
    }
    return result;
}

inline matfact::Matrix<matfact::Complex<double>>
random_complex_matrix(std::mt19937_64& generator, std::size_t size) {
    const auto real = random_matrix(generator, size, size);
    const auto imag = random_matrix(generator, size, size);
    return matfact::make_complex(real, imag);
}

} // namespace matfact::util
