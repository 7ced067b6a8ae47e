// include/matfact/matfact.hpp — Umbrella header that exposes the matfact components.

#pragma once

// Umbrella header for matfact.
// Users should generally include only this file.

#include <matfact/complex.hpp>
#include <matfact/config.hpp>
#include <matfact/core/longint.hpp>
#include <matfact/error.hpp>
#include <matfact/fraction.hpp>
#include <matfact/io/format.hpp>
#include <matfact/io/parse.hpp>
#include <matfact/linalg/charpoly.hpp>
#include <matfact/linalg/lu.hpp>
#include <matfact/linalg/qr.hpp>
#include <matfact/matrix.hpp>
#include <matfact/numeric.hpp>
#include <matfact/polynome.hpp>
#include <matfact/util/debug.hpp>
#include <matfact/util/random.hpp>

namespace matfact {

    using LongInt = core::longint;
    using Rational = Fraction<core::longint>;
    using ComplexMatrix = Matrix<Complex<double>>;

} // namespace matfact
