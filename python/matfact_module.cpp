// python/matfact_module.cpp — Pybind11 module entrypoint exposing matfact.

#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <matfact/matfact.hpp>

namespace py = pybind11;
using matfact::core::longint;

namespace {

using Rows = std::vector<std::vector<double>>;
using ComplexRows = std::vector<std::vector<std::complex<double>>>;
using RealMatrix = matfact::Matrix<double>;

RealMatrix matrix_from_rows(const Rows& rows) {
    const std::size_t width = rows.empty() ? 0 : rows.front().size();
    std::vector<double> elements;
    elements.reserve(width * rows.size());
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw matfact::matrix_error(matfact::matrix_errc::size_mismatch, "ragged row list");
        }
        elements.insert(elements.end(), row.begin(), row.end());
    }
    return RealMatrix::from_vector(std::move(elements), width);
}

matfact::ComplexMatrix matrix_from_rows(const ComplexRows& rows) {
    const std::size_t width = rows.empty() ? 0 : rows.front().size();
    std::vector<matfact::Complex<double>> elements;
    elements.reserve(width * rows.size());
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw matfact::matrix_error(matfact::matrix_errc::size_mismatch, "ragged row list");
        }
        for (const auto& value : row) {
            elements.emplace_back(value.real(), value.imag());
        }
    }
    return matfact::ComplexMatrix::from_vector(std::move(elements), width);
}

Rows to_rows(const RealMatrix& matrix) {
    Rows rows(matrix.height(), std::vector<double>(matrix.width()));
    for (std::size_t row = 0; row < matrix.height(); ++row) {
        for (std::size_t column = 0; column < matrix.width(); ++column) {
            rows[row][column] = matrix(row, column);
        }
    }
    return rows;
}

ComplexRows to_rows(const matfact::ComplexMatrix& matrix) {
    ComplexRows rows(matrix.height(), std::vector<std::complex<double>>(matrix.width()));
    for (std::size_t row = 0; row < matrix.height(); ++row) {
        for (std::size_t column = 0; column < matrix.width(); ++column) {
            const auto& value = matrix(row, column);
            rows[row][column] = std::complex<double>(value.real(), value.imag());
        }
    }
    return rows;
}

std::optional<matfact::linalg::QrMethod> method_from_code(std::optional<int> code) {
    if (!code) {
        return std::nullopt;
    }
    return matfact::linalg::qr_method_from_code(*code);
}

py::int_ to_python_int(const longint& value) {
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(matfact::io::to_string(value));
}

template <typename Row> auto column_vector(const std::vector<Row>& rhs) {
    std::vector<std::vector<Row>> rows;
    rows.reserve(rhs.size());
    for (const auto& value : rhs) {
        rows.push_back({value});
    }
    return matrix_from_rows(rows);
}

template <typename Matrix> auto flatten_column(const Matrix& column) {
    auto rows = to_rows(column);
    std::vector<typename decltype(rows)::value_type::value_type> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        values.push_back(row.front());
    }
    return values;
}

} // namespace

PYBIND11_MODULE(matfact, module) {
    module.doc() = "Generic LU/QR factorization and tridiagonal characteristic polynomials";
    module.attr("__version__") = std::to_string(matfact::MATFACT_VERSION_MAJOR) + "." +
                                 std::to_string(matfact::MATFACT_VERSION_MINOR) + "." +
                                 std::to_string(matfact::MATFACT_VERSION_PATCH);

    py::register_exception<matfact::matrix_error>(module, "MatrixError", PyExc_ValueError);

    py::class_<longint>(module, "LongInt", "Arbitrary precision integer in base 256")
        .def(py::init<>())
        .def(py::init<long long>(), py::arg("value"))
        .def(py::init([](const std::string& text) { return matfact::io::from_string<longint>(text); }),
             py::arg("text"))
        .def("is_zero", &longint::is_zero)
        .def("is_negative", &longint::is_negative)
        .def("signum", &longint::signum)
        .def("abs", &longint::abs)
        .def("to_int", &to_python_int)
        .def("to_double", &longint::to_double)
        .def("to_hex", [](const longint& self) { return matfact::io::to_hex_string(self); })
        .def("to_string",
             [](const longint& self, int base) { return matfact::io::to_string(self, base); },
             py::arg("base") = 10)
        .def("__add__", [](const longint& a, const longint& b) { return a + b; })
        .def("__sub__", [](const longint& a, const longint& b) { return a - b; })
        .def("__mul__", [](const longint& a, const longint& b) { return a * b; })
        .def("__floordiv__", [](const longint& a, const longint& b) { return a / b; })
        .def("__mod__", [](const longint& a, const longint& b) { return a % b; })
        .def("__neg__", [](const longint& a) { return -a; })
        .def("__eq__", [](const longint& a, const longint& b) { return a == b; })
        .def("__lt__", [](const longint& a, const longint& b) { return a < b; })
        .def("__int__", &to_python_int)
        .def("__str__", [](const longint& self) { return matfact::io::to_string(self); })
        .def("__repr__", [](const longint& self) {
            return "LongInt(" + matfact::io::to_string(self) + ")";
        });

    module.def(
        "lu",
        [](const Rows& rows) {
            const auto factors = matfact::linalg::lu_decomposition(matrix_from_rows(rows));
            return py::make_tuple(to_rows(factors.lower), to_rows(factors.upper));
        },
        py::arg("matrix"), "Doolittle factors (L, U) without pivoting");

    module.def(
        "lu_solve",
        [](const Rows& rows, const std::vector<double>& rhs) {
            return flatten_column(
                matfact::linalg::lu_solve(matrix_from_rows(rows), column_vector(rhs)));
        },
        py::arg("matrix"), py::arg("rhs"));

    module.def(
        "qr",
        [](const Rows& rows, std::optional<int> method) {
            const auto factors =
                matfact::linalg::qr_decompose(matrix_from_rows(rows), method_from_code(method));
            return py::make_tuple(to_rows(factors.q), to_rows(factors.r));
        },
        py::arg("matrix"), py::arg("method") = py::none(),
        "QR factors; method 1 = Householder, 2 = Givens, 3 = Gram-Schmidt (default)");

    module.def(
        "qr_complex",
        [](const ComplexRows& rows, std::optional<int> method) {
            const auto factors =
                matfact::linalg::qr_decompose(matrix_from_rows(rows), method_from_code(method));
            return py::make_tuple(to_rows(factors.q), to_rows(factors.r));
        },
        py::arg("matrix"), py::arg("method") = py::none());

    module.def(
        "qr_solve",
        [](const Rows& rows, const std::vector<double>& rhs, std::optional<int> method) {
            return flatten_column(matfact::linalg::qr_solve(
                matrix_from_rows(rows), column_vector(rhs), method_from_code(method)));
        },
        py::arg("matrix"), py::arg("rhs"), py::arg("method") = py::none());

    module.def(
        "qr_solve_complex",
        [](const ComplexRows& rows, const std::vector<std::complex<double>>& rhs,
           std::optional<int> method) {
            return flatten_column(matfact::linalg::qr_solve(
                matrix_from_rows(rows), column_vector(rhs), method_from_code(method)));
        },
        py::arg("matrix"), py::arg("rhs"), py::arg("method") = py::none());

    module.def(
        "characteristic_polynomial",
        [](const Rows& rows) {
            return matfact::linalg::characteristic_polynomial(matrix_from_rows(rows))
                .coefficients();
        },
        py::arg("matrix"), "Ascending coefficients of det(A - x I) for a tridiagonal matrix");

    module.def(
        "exact_characteristic_polynomial",
        [](const Rows& rows) {
            const auto poly =
                matfact::linalg::exact_characteristic_polynomial(matrix_from_rows(rows));
            py::list coefficients;
            for (const auto& value : poly.coefficients()) {
                coefficients.append(to_python_int(value));
            }
            return coefficients;
        },
        py::arg("matrix"), "Entries truncated to integers, coefficients computed exactly");
}
