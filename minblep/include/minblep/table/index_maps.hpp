#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace minblep {

/// Maps between the naive and output time axes over one period (one second)
struct IndexMaps {
    std::vector<std::int32_t> naivex2outx;     // naiverate entries: output index of each naive index
    std::vector<std::int32_t> naivex2shape;    // naiverate entries: phase in [0, scale)
    std::vector<std::int32_t> naivex2off;      // naiverate entries: phase * mixin_size
    std::vector<std::int32_t> outx2minnaivex;  // outrate entries: smallest naive index per output index

    bool operator==(const IndexMaps&) const = default;
};

/// Rearrange the step table into `scale` contiguous phase runs:
/// run i holds minblep[i], minblep[i + scale], minblep[i + 2*scale], ...
/// minblep.size() must be a multiple of scale.
[[nodiscard]] std::vector<float> demultiplex(std::span<const float> minblep, int scale);

[[nodiscard]] IndexMaps build_index_maps(int naiverate, int outrate, int scale, std::size_t mixin_size);

}  // namespace minblep
