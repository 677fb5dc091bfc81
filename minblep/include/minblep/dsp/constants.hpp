#pragma once

#include <cmath>

namespace minblep {

inline constexpr double PI = 3.14159265358979323846;

// Table defaults: cutoff as a fraction of the naive rate, transition band
// as a fraction of the cutoff region
inline constexpr double DEFAULT_CUTOFF = 0.475;
inline constexpr double DEFAULT_TRANSITION = 0.05;

// Floor for spectral magnitudes before taking the log (exp(-100))
inline const double MIN_MAGNITUDE = std::exp(-100.0);

}  // namespace minblep
