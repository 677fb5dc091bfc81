#pragma once

#include "constants.hpp"
#include <cmath>
#include <cstddef>
#include <vector>

namespace minblep {

// Symmetric Blackman window of the given length (endpoints are zero)
inline std::vector<double> blackman(std::size_t size) {
    if (size == 0) return {};
    if (size == 1) return {1.0};

    std::vector<double> window(size);
    const double denom = static_cast<double>(size - 1);
    for (std::size_t n = 0; n < size; ++n) {
        const double phase = 2.0 * PI * static_cast<double>(n) / denom;
        window[n] = 0.42 - 0.5 * std::cos(phase) + 0.08 * std::cos(2.0 * phase);
    }
    return window;
}

// Normalized sinc: sin(pi*x)/(pi*x), 1 at x == 0
inline double sinc(double x) {
    if (x == 0.0) return 1.0;
    const double px = PI * x;
    return std::sin(px) / px;
}

}  // namespace minblep
