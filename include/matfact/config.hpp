// include/matfact/config.hpp — Library version and numeric tuning constants.

#pragma once

namespace matfact {

inline constexpr int MATFACT_VERSION_MAJOR = 0;
inline constexpr int MATFACT_VERSION_MINOR = 1;
inline constexpr int MATFACT_VERSION_PATCH = 0;

// Gram-Schmidt repeats a projection pass while the summed squared change stays at or above this.
inline constexpr double DEFAULT_REORTHO_EPSILON = 0.1;

// Entries off the three central diagonals must have a squared norm below this.
inline constexpr double TRIDIAGONAL_TOLERANCE = 1e-4;

} // namespace matfact
