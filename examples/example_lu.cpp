#include <iostream>

#include <matfact/matfact.hpp>

int main() {
    const auto matrix = matfact::Matrix<double>::from_rows({{4.0, 3.0}, {6.0, 3.0}});
    const auto factors = matfact::linalg::lu_decomposition(matrix);
    const auto rhs = matfact::Matrix<double>::from_rows({{10.0}, {12.0}});
    const auto solution = matfact::linalg::gauss_from_lu(factors.lower, factors.upper, rhs);

    using matfact::io::operator<<;
    std::cout << "L =\n" << factors.lower << "U =\n" << factors.upper;
    std::cout << "x =\n" << solution;
    std::cout << "|L*U - A| = " << matfact::residual_norm(factors.lower * factors.upper, matrix)
              << '\n';
    std::cout << "|A*x - b| = " << matfact::residual_norm(matrix * solution, rhs) << '\n';

    for (const auto method : {matfact::linalg::QrMethod::householder,
                              matfact::linalg::QrMethod::givens,
                              matfact::linalg::QrMethod::gram_schmidt}) {
        const auto qr = matfact::linalg::qr_decompose(matrix, method);
        std::cout << matfact::linalg::to_string(method) << ": |Q*R - A| = "
                  << matfact::residual_norm(qr.q * qr.r, matrix) << '\n';
    }
    return 0;
}
