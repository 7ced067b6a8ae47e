// include/matfact/error.hpp — Typed failures raised by matrix operations.

#pragma once

#include <stdexcept>
#include <string>

namespace matfact {

enum class matrix_errc {
    not_square,
    not_regular,
    not_tridiagonal,
    size_mismatch,
    unsupported_operation,
};

inline const char* to_string(matrix_errc kind) noexcept {
    switch (kind) {
    case matrix_errc::not_square:
        return "matrix is not square";
    case matrix_errc::not_regular:
        return "matrix is not regular";
    case matrix_errc::not_tridiagonal:
        return "matrix is not tridiagonal";
    case matrix_errc::size_mismatch:
        return "matrix size mismatch";
    case matrix_errc::unsupported_operation:
        return "operation not supported for this element type";
    }
    return "unknown matrix error";
}

class matrix_error : public std::runtime_error {
public:
    explicit matrix_error(matrix_errc kind) : std::runtime_error(to_string(kind)), kind_(kind) {}
    matrix_error(matrix_errc kind, const std::string& detail)
        : std::runtime_error(std::string(to_string(kind)) + ": " + detail), kind_(kind) {}

    matrix_errc kind() const noexcept { return kind_; }

private:
    matrix_errc kind_;
};

} // namespace matfact
