#pragma once

#include <cstddef>
#include <cstdint>

namespace minblep {

// Accumulate band-limited steps into `out`.
//
// diff[i] is the naive discontinuity at naive index naivex + i. Each nonzero
// entry adds diff[i] * demultiplexed[naivex2off[x] .. + mixin_size) to `out`
// starting at naivex2outx[x] - naivex2outx[naivex], where x wraps to zero at
// naiverate and each wrap moves the output origin forward by outrate.
// Writes past out_len are dropped. `naivex` must be in [0, naiverate).
void paste_minbleps(std::size_t diff_len, float* out, std::size_t out_len,
                    const std::int32_t* naivex2outx, const float* demultiplexed,
                    const std::int32_t* naivex2off, const float* diff,
                    std::int32_t naivex, std::int32_t naiverate, std::int32_t outrate,
                    std::size_t mixin_size);

}  // namespace minblep
