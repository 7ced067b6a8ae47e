#include "matfact/linalg/charpoly.hpp"

namespace matfact::linalg {

Polynome<core::longint> exact_characteristic_polynomial(const Matrix<double> &matrix) {
    return characteristic_polynomial(matrix_cast<core::longint>(matrix));
}

} // namespace matfact::linalg
