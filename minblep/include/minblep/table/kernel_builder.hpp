#pragma once

#include "scale.hpp"
#include <cstddef>
#include <vector>

namespace minblep {

/// Intermediate and final products of the minimum-phase step construction
struct KernelResult {
    int order = 0;                 // Even filter order, nearest to 4/transition
    std::size_t kernel_size = 0;   // order * scale + 1
    std::size_t size = 0;          // Transform size, power of two >= kernel_size
    std::size_t midpoint = 0;      // size / 2, peak of the padded sinc
    std::vector<double> bli;       // Zero-padded windowed sinc, length size
    std::vector<double> minbli;    // Minimum-phase impulse response, length size
    std::vector<float> minblep;    // Padded step table, length mixin_size * scale
    std::size_t mixin_size = 0;
};

/// Even filter order closest to 4/transition, rounding half up.
/// Throws ConfigurationError if the order does not fit in an int.
[[nodiscard]] int filter_order(double transition);

/// Windowed sinc low-pass at `scale` times the naive rate, converted to a
/// minimum-phase step via the real cepstrum. Throws ConfigurationError if the
/// parameters give a degenerate filter.
[[nodiscard]] KernelResult build_kernel(const RateParameters& params);

}  // namespace minblep
