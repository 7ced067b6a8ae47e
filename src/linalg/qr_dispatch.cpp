#include "matfact/linalg/qr.hpp"

#include <stdexcept>
#include <string>

namespace matfact::linalg {

QrMethod qr_method_from_code(int code) {
    switch (code) {
    case 1:
        return QrMethod::householder;
    case 2:
        return QrMethod::givens;
    case 3:
        return QrMethod::gram_schmidt;
    default:
        throw std::invalid_argument("unknown QR method code " + std::to_string(code));
    }
}

const char *to_string(QrMethod method) noexcept {
    switch (method) {
    case QrMethod::householder:
        return "householder";
    case QrMethod::givens:
        return "givens";
    case QrMethod::gram_schmidt:
        return "gram-schmidt";
    }
    return "unknown";
}

template QrFactors<double> householder(const Matrix<double> &);
template QrFactors<double> givens(const Matrix<double> &);
template QrFactors<double> gram_schmidt(const Matrix<double> &, double);
template QrFactors<Complex<double>> householder(const Matrix<Complex<double>> &);
template QrFactors<Complex<double>> gram_schmidt(const Matrix<Complex<double>> &, double);

} // namespace matfact::linalg
