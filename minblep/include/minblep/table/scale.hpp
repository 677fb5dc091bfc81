#pragma once

#include "../dsp/constants.hpp"
#include <optional>

namespace minblep {

/// Fully resolved table parameters. Immutable once returned by
/// resolve_parameters().
struct RateParameters {
    int naiverate = 0;
    int outrate = 0;
    int scale = 0;        // naiverate / gcd(naiverate, outrate)
    double cutoff = DEFAULT_CUTOFF;
    double transition = DEFAULT_TRANSITION;

    bool operator==(const RateParameters&) const = default;
};

/// Ideal scale for the rate pair. Throws ScaleMismatchError if `scale` is
/// given and differs, ConfigurationError if either rate is not positive.
[[nodiscard]] int resolve_scale(int naiverate, int outrate, std::optional<int> scale = std::nullopt);

/// outrate / gcd(naiverate, outrate): output samples per `scale` naive samples
[[nodiscard]] int dual_scale(int naiverate, int outrate);

/// Resolve the scale and validate cutoff (0, 0.5] and transition (0, 1)
[[nodiscard]] RateParameters resolve_parameters(int naiverate, int outrate,
                                                std::optional<int> scale,
                                                double cutoff = DEFAULT_CUTOFF,
                                                double transition = DEFAULT_TRANSITION);

}  // namespace minblep
