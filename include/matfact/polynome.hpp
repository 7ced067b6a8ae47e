// include/matfact/polynome.hpp — Dense polynomials with ascending coefficients.

#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace matfact {

// The coefficient vector only grows: set() extends it for a non-zero value past
// the end, and nothing ever trims a cancelled leading coefficient.
template <typename Coefficient> class Polynome {
  public:
    Polynome() = default;
    explicit Polynome(std::vector<Coefficient> coeffs) : coeffs_(std::move(coeffs)) {
    }

    static Polynome constant(Coefficient value) {
        return Polynome(std::vector<Coefficient>{std::move(value)});
    }

    bool empty() const noexcept {
        return coeffs_.empty();
    }
    std::size_t size() const noexcept {
        return coeffs_.size();
    }

    std::size_t degree() const {
        if (coeffs_.empty()) {
            throw std::out_of_range("degree of an empty polynome");
        }
        return coeffs_.size() - 1;
    }

    const Coefficient &leading() const {
        if (coeffs_.empty()) {
            throw std::out_of_range("leading coefficient of an empty polynome");
        }
        return coeffs_.back();
    }

    const std::vector<Coefficient> &coefficients() const noexcept {
        return coeffs_;
    }

    const Coefficient &get(std::size_t power) const {
        if (power >= coeffs_.size()) {
            static const Coefficient zero{};
            return zero;
        }
        return coeffs_[power];
    }

    const Coefficient &operator[](std::size_t power) const {
        return get(power);
    }

    void set(std::size_t power, Coefficient value) {
        if (power < coeffs_.size()) {
            coeffs_[power] = std::move(value);
            return;
        }
        if (!(value == Coefficient{})) {
            coeffs_.resize(power + 1, Coefficient{});
            coeffs_[power] = std::move(value);
        }
    }

    Coefficient evaluate(const Coefficient &point) const {
        Coefficient result{};
        for (auto it = coeffs_.rbegin(); it != coeffs_.rend(); ++it) {
            result = result * point + *it;
        }
        return result;
    }

    Polynome normalize() const {
        return *this / leading();
    }

    friend Polynome operator+(const Polynome &lhs, const Polynome &rhs) {
        const std::size_t length = std::max(lhs.size(), rhs.size());
        Polynome result;
        for (std::size_t power = 0; power < length; ++power) {
            result.set(power, lhs.get(power) + rhs.get(power));
        }
        return result;
    }

    friend Polynome operator-(const Polynome &lhs, const Polynome &rhs) {
        const std::size_t length = std::max(lhs.size(), rhs.size());
        Polynome result;
        for (std::size_t power = 0; power < length; ++power) {
            result.set(power, lhs.get(power) - rhs.get(power));
        }
        return result;
    }

    // Both operands are walked from the highest power down.
    friend Polynome operator*(const Polynome &lhs, const Polynome &rhs) {
        Polynome result;
        for (std::size_t i = lhs.size(); i-- > 0;) {
            for (std::size_t j = rhs.size(); j-- > 0;) {
                result.set(i + j, result.get(i + j) + lhs.coeffs_[i] * rhs.coeffs_[j]);
            }
        }
        return result;
    }

    friend Polynome operator*(const Polynome &lhs, const Coefficient &scalar) {
        std::vector<Coefficient> coeffs;
        coeffs.reserve(lhs.size());
        for (const auto &coeff : lhs.coeffs_) {
            coeffs.push_back(coeff * scalar);
        }
        return Polynome(std::move(coeffs));
    }

    friend Polynome operator/(const Polynome &lhs, const Coefficient &scalar) {
        std::vector<Coefficient> coeffs;
        coeffs.reserve(lhs.size());
        for (const auto &coeff : lhs.coeffs_) {
            coeffs.push_back(coeff / scalar);
        }
        return Polynome(std::move(coeffs));
    }

    friend bool operator==(const Polynome &lhs, const Polynome &rhs) {
        return lhs.coeffs_ == rhs.coeffs_;
    }

  private:
    std::vector<Coefficient> coeffs_;
};

} // namespace matfact
