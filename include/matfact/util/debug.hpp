#pragma once

#include <ostream>

#include <matfact/core/longint.hpp>
#include <matfact/io/format.hpp>
#include <matfact/matrix.hpp>
#include <matfact/polynome.hpp>

namespace matfact::util {

inline std::ostream& dump(std::ostream& os, const matfact::core::longint& value) {
    return os << "longint(" << matfact::io::to_string(value) << ' '
              << matfact::io::to_hex_string(value) << ')';
}

template <typename T> std::ostream& dump(std::ostream& os, const matfact::Polynome<T>& value) {
    return os << "polynome(" << value.size() << " coefficients) "
              << matfact::io::to_string(value);
}

template <typename T> std::ostream& dump(std::ostream& os, const matfact::Matrix<T>& value) {
    return os << "matrix " << value.shape() << " norm " << value.norm() << '\n'
              << matfact::io::to_string(value);
}

} // namespace matfact::util
