#include <iostream>

#include <matfact/matfact.hpp>

int main() {
    const auto matrix = matfact::Matrix<double>::from_rows(
        {{2.0, 1.0, 0.0}, {1.0, 2.0, 1.0}, {0.0, 1.0, 2.0}});
    const auto poly = matfact::linalg::characteristic_polynomial(matrix);
    const auto exact = matfact::linalg::exact_characteristic_polynomial(matrix);

    using matfact::io::operator<<;
    std::cout << "det(A - x I) = " << poly << '\n';
    std::cout << "over longint  = " << exact << '\n';
    std::cout << "p(2) = " << poly.evaluate(2.0) << '\n';
    matfact::util::dump(std::cout, exact.leading()) << '\n';
    return 0;
}
