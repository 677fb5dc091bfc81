#include "square_render.hpp"
#include <cmath>

namespace minblep_cli {

std::vector<float> square_diffs(double freq, std::int64_t naive_count, int naiverate) {
    std::vector<float> diff(static_cast<std::size_t>(naive_count), 0.0f);
    float previous = 0.0f;
    for (std::int64_t n = 0; n < naive_count; ++n) {
        const double phase = std::fmod(static_cast<double>(n) * freq / naiverate, 1.0);
        const float value = phase < 0.5 ? 1.0f : -1.0f;
        diff[static_cast<std::size_t>(n)] = value - previous;
        previous = value;
    }
    return diff;
}

std::vector<float> render(const minblep::MinBleps& table, const std::vector<float>& diff) {
    const auto naive_count = static_cast<std::int64_t>(diff.size());
    const auto out_count = static_cast<std::size_t>(table.get_out_count(0, naive_count));
    const std::size_t mixin_size = table.mixin_size();

    std::vector<float> out(out_count + mixin_size, 0.0f);
    table.paste(0, diff, out);

    // Each pasted step only covers mixin_size samples; past that the new
    // level has to be carried by hand
    const auto& naivex2outx = table.maps().naivex2outx;
    std::vector<float> carry(out.size() + 1, 0.0f);
    for (std::int64_t n = 0; n < naive_count; ++n) {
        const float amp = diff[static_cast<std::size_t>(n)];
        if (amp == 0.0f) continue;
        const std::int64_t period = n / table.naiverate();
        const std::int64_t outx = naivex2outx[static_cast<std::size_t>(n % table.naiverate())] +
                                  period * table.outrate();
        const auto tail = static_cast<std::size_t>(outx) + mixin_size;
        if (tail < carry.size()) carry[tail] += amp;
    }
    float level = 0.0f;
    for (std::size_t i = 0; i < out_count; ++i) {
        level += carry[i];
        out[i] += level;
    }

    out.resize(out_count);
    return out;
}

}  // namespace minblep_cli
