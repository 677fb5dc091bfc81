#include "minblep/table/index_maps.hpp"
#include "minblep/table/scale.hpp"

namespace minblep {

std::vector<float> demultiplex(std::span<const float> minblep, int scale) {
    const std::size_t phases = static_cast<std::size_t>(scale);
    const std::size_t mixin_size = minblep.size() / phases;

    std::vector<float> out(minblep.size());
    for (std::size_t i = 0; i < phases; ++i) {
        float* run = out.data() + i * mixin_size;
        for (std::size_t j = 0; j < mixin_size; ++j) {
            run[j] = minblep[i + j * phases];
        }
    }
    return out;
}

IndexMaps build_index_maps(int naiverate, int outrate, int scale, std::size_t mixin_size) {
    const std::int64_t dualscale = dual_scale(naiverate, outrate);
    const auto naive_count = static_cast<std::size_t>(naiverate);

    IndexMaps maps;
    maps.naivex2outx.resize(naive_count);
    maps.naivex2shape.resize(naive_count);
    maps.naivex2off.resize(naive_count);

    for (std::size_t n = 0; n < naive_count; ++n) {
        // Position on the common grid where both rates are integers
        const std::int64_t nearest = static_cast<std::int64_t>(n) * dualscale;
        const std::int64_t outx = nearest / scale;
        const std::int64_t shape = outx * scale - nearest + scale - 1;
        maps.naivex2outx[n] = static_cast<std::int32_t>(outx);
        maps.naivex2shape[n] = static_cast<std::int32_t>(shape);
        maps.naivex2off[n] = static_cast<std::int32_t>(shape * static_cast<std::int64_t>(mixin_size));
    }

    // Descending sweep leaves the smallest naive index per output index.
    // Output indices no naive index lands on (outrate > naiverate) take the
    // next naive index that lands later, or naiverate past the last one.
    maps.outx2minnaivex.assign(static_cast<std::size_t>(outrate), naiverate);
    std::int32_t next = naiverate;
    std::int32_t outx = outrate - 1;
    for (std::int32_t n = naiverate - 1; n >= 0; --n) {
        const std::int32_t target = maps.naivex2outx[static_cast<std::size_t>(n)];
        for (; outx > target; --outx) {
            maps.outx2minnaivex[static_cast<std::size_t>(outx)] = next;
        }
        maps.outx2minnaivex[static_cast<std::size_t>(target)] = n;
        next = n;
    }

    return maps;
}

}  // namespace minblep
