#pragma once

#include "minblep/table/min_bleps.hpp"
#include <cstdint>
#include <vector>

namespace minblep_cli {

// Naive square wave at the table's naive rate, as per-sample discontinuities.
// diff[0] carries the initial step up from silence.
std::vector<float> square_diffs(double freq, std::int64_t naive_count, int naiverate);

// Convert the naive discontinuities to a band-limited signal at the table's
// output rate. Returns get_out_count(0, diff.size()) samples.
std::vector<float> render(const minblep::MinBleps& table, const std::vector<float>& diff);

}  // namespace minblep_cli
