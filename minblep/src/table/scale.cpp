#include "minblep/table/scale.hpp"
#include "minblep/errors.hpp"
#include <cmath>
#include <numeric>
#include <string>

namespace minblep {

namespace {

void check_rates(int naiverate, int outrate) {
    if (naiverate <= 0 || outrate <= 0) {
        throw ConfigurationError("Sample rates must be positive, got naiverate " +
                                 std::to_string(naiverate) + " and outrate " +
                                 std::to_string(outrate) + ".");
    }
}

}  // namespace

int resolve_scale(int naiverate, int outrate, std::optional<int> scale) {
    check_rates(naiverate, outrate);
    const int ideal = naiverate / std::gcd(naiverate, outrate);
    if (scale && *scale != ideal) {
        throw ScaleMismatchError(*scale, ideal);
    }
    return ideal;
}

int dual_scale(int naiverate, int outrate) {
    check_rates(naiverate, outrate);
    return outrate / std::gcd(naiverate, outrate);
}

RateParameters resolve_parameters(int naiverate, int outrate, std::optional<int> scale,
                                  double cutoff, double transition) {
    RateParameters params;
    params.naiverate = naiverate;
    params.outrate = outrate;
    params.scale = resolve_scale(naiverate, outrate, scale);

    if (!std::isfinite(cutoff) || cutoff <= 0.0 || cutoff > 0.5) {
        throw ConfigurationError("Cutoff must be in (0, 0.5], got " + std::to_string(cutoff) + ".");
    }
    if (!std::isfinite(transition) || transition <= 0.0 || transition >= 1.0) {
        throw ConfigurationError("Transition must be in (0, 1), got " +
                                 std::to_string(transition) + ".");
    }
    params.cutoff = cutoff;
    params.transition = transition;
    return params;
}

}  // namespace minblep
