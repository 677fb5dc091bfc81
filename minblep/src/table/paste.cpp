#include "minblep/table/paste.hpp"
#include <algorithm>

namespace minblep {

void paste_minbleps(std::size_t diff_len, float* out, std::size_t out_len,
                    const std::int32_t* naivex2outx, const float* demultiplexed,
                    const std::int32_t* naivex2off, const float* diff,
                    std::int32_t naivex, std::int32_t naiverate, std::int32_t outrate,
                    std::size_t mixin_size) {
    // Output index of naivex + i is naivex2outx[x] + origin
    std::int64_t origin = -static_cast<std::int64_t>(naivex2outx[naivex]);

    for (std::size_t i = 0; i < diff_len; ++i) {
        const float amp = diff[i];
        if (amp != 0.0f) {
            const std::int64_t outx = origin + naivex2outx[naivex];
            if (outx < static_cast<std::int64_t>(out_len)) {
                const std::size_t start = static_cast<std::size_t>(outx);
                const std::size_t limit = std::min(mixin_size, out_len - start);
                const float* mixin = demultiplexed + naivex2off[naivex];
                float* dst = out + start;
                for (std::size_t j = 0; j < limit; ++j) {
                    dst[j] += amp * mixin[j];
                }
            }
        }
        if (++naivex == naiverate) {
            naivex = 0;
            origin += outrate;
        }
    }
}

}  // namespace minblep
