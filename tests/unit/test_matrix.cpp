// tests/unit/test_matrix.cpp — Matrix construction, indexing, products and conversions.

#include <matfact/matfact.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using M = matfact::Matrix<double>;
using matfact::matrix_errc;
using matfact::matrix_error;

template <typename Fn> bool expect_kind(Fn&& fn, matrix_errc expected, const char* label) {
    try {
        fn();
    } catch (const matrix_error& error) {
        if (error.kind() == expected) {
            return true;
        }
        std::cerr << label << ": wrong kind " << matfact::to_string(error.kind()) << "\n";
        return false;
    }
    std::cerr << label << ": no matrix_error thrown\n";
    return false;
}

bool test_construction() {
    const M zero(3, 2);
    if (zero.width() != 3 || zero.height() != 2 || zero.is_square() || zero.shape() != "2x3") {
        std::cerr << "shape mismatch\n";
        return false;
    }
    for (const auto value : zero.elements()) {
        if (value != 0.0) {
            std::cerr << "new matrix must be zero filled\n";
            return false;
        }
    }
    const M rows = M::from_rows({{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
    if (rows(1, 0) != 4.0 || rows.get(0, 2) != 3.0) {
        std::cerr << "row-major layout mismatch\n";
        return false;
    }
    const M identity = M::identity(3);
    if (identity(0, 0) != 1.0 || identity(2, 2) != 1.0 || identity(0, 1) != 0.0) {
        std::cerr << "identity mismatch\n";
        return false;
    }
    const M filled = M::scalar(7.0, 2);
    for (const auto value : filled.elements()) {
        if (value != 7.0) {
            std::cerr << "scalar() should fill every cell\n";
            return false;
        }
    }
    if (!expect_kind([] { (void)M::from_vector({1.0, 2.0, 3.0}, 2); }, matrix_errc::size_mismatch,
                     "from_vector")) {
        return false;
    }
    try {
        (void)rows(2, 0);
        std::cerr << "row index past the end should throw\n";
        return false;
    } catch (const std::out_of_range&) {
    }
    return true;
}

bool test_views() {
    const M value = M::from_rows({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
    const M transposed = value.transpose();
    if (transposed.width() != 3 || transposed.height() != 2 || transposed(1, 2) != 6.0) {
        std::cerr << "transpose mismatch\n";
        return false;
    }
    const M row = value.row(1);
    const M column = value.column(1);
    if (row.shape() != "1x2" || row(0, 1) != 4.0 || column.shape() != "3x1" ||
        column(2, 0) != 6.0) {
        std::cerr << "row or column extraction mismatch\n";
        return false;
    }
    if (value.norm_squared() != 91.0) {
        std::cerr << "norm_squared mismatch\n";
        return false;
    }
    return true;
}

bool test_arithmetic() {
    const M lhs = M::from_rows({{1.0, 2.0}, {3.0, 4.0}});
    const M rhs = M::from_rows({{0.0, 1.0}, {1.0, 0.0}});
    if (!(lhs * rhs == M::from_rows({{2.0, 1.0}, {4.0, 3.0}}))) {
        std::cerr << "product mismatch\n";
        return false;
    }
    if (!(lhs + rhs == M::from_rows({{1.0, 3.0}, {4.0, 4.0}})) ||
        !(lhs - rhs == M::from_rows({{1.0, 1.0}, {2.0, 4.0}}))) {
        std::cerr << "sum or difference mismatch\n";
        return false;
    }
    if (!(lhs * 2.0 == 2.0 * lhs) || !((lhs * 2.0) / 2.0 == lhs)) {
        std::cerr << "scalar scaling mismatch\n";
        return false;
    }
    const M wide(3, 2);
    if (!expect_kind([&] { (void)(lhs * lhs.row(0)); }, matrix_errc::size_mismatch, "product")) {
        return false;
    }
    if (!expect_kind([&] { (void)(lhs + wide); }, matrix_errc::size_mismatch, "sum")) {
        return false;
    }
    if (matfact::residual_norm(lhs, lhs) != 0.0) {
        std::cerr << "residual of equal matrices should vanish\n";
        return false;
    }
    return true;
}

bool test_complex_and_casts() {
    const M real = M::from_rows({{1.0, 0.0}, {2.0, -1.0}});
    const M imag = M::from_rows({{0.0, 3.0}, {-1.0, 0.0}});
    const auto joined = matfact::make_complex(real, imag);
    if (!(joined(0, 1) == matfact::Complex<double>(0.0, 3.0))) {
        std::cerr << "make_complex mismatch\n";
        return false;
    }
    const auto adjoint = joined.hermitian_transpose();
    if (!(adjoint(1, 0) == matfact::Complex<double>(0.0, -3.0))) {
        std::cerr << "hermitian transpose should conjugate\n";
        return false;
    }
    if (!expect_kind([&] { (void)matfact::make_complex(real, M(3, 2)); },
                     matrix_errc::size_mismatch, "make_complex")) {
        return false;
    }
    const auto exact = matfact::matrix_cast<matfact::core::longint>(
        M::from_rows({{2.9, -2.9}, {1e18, 0.0}}));
    const auto tall_empty = matfact::matrix_cast<matfact::core::longint>(M(0, 3));
    if (tall_empty.width() != 0 || tall_empty.height() != 3) {
        std::cerr << "matrix_cast should keep a 3x0 shape, got " << tall_empty.shape() << "\n";
        return false;
    }
    const auto complex_empty = matfact::make_complex(M(0, 2), M(0, 2));
    if (complex_empty.shape() != "2x0") {
        std::cerr << "make_complex should keep a 2x0 shape, got " << complex_empty.shape()
                  << "\n";
        return false;
    }
    if (exact(0, 0) != matfact::core::longint(2) || exact(0, 1) != matfact::core::longint(-2) ||
        matfact::io::to_string(exact(1, 0)) != "1000000000000000000") {
        std::cerr << "matrix_cast to longint mismatch\n";
        return false;
    }
    return true;
}

bool test_display() {
    const M value = M::from_rows({{1.0, 2.0}, {3.0, 4.5}});
    if (matfact::io::to_string(value) != "| 1 2 |\n| 3 4.5 |\n") {
        std::cerr << "display mismatch:\n" << matfact::io::to_string(value);
        return false;
    }
    if (matfact::io::to_string(M()) != "[ ]") {
        std::cerr << "empty display mismatch\n";
        return false;
    }
    std::ostringstream dumped;
    matfact::util::dump(dumped, M::identity(2));
    if (dumped.str().rfind("matrix 2x2", 0) != 0) {
        std::cerr << "dump header mismatch: " << dumped.str() << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_construction()) {
        return 1;
    }
    if (!test_views()) {
        return 1;
    }
    if (!test_arithmetic()) {
        return 1;
    }
    if (!test_complex_and_casts()) {
        return 1;
    }
    if (!test_display()) {
        return 1;
    }
    std::cout << "matrix tests passed\n";
    return 0;
}
