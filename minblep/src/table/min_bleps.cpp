#include "minblep/table/min_bleps.hpp"
#include "minblep/cache/cache_store.hpp"
#include "minblep/log.hpp"
#include "minblep/table/kernel_builder.hpp"
#include "minblep/table/paste.hpp"
#include <string>

namespace minblep {

namespace {

// Floor division; shifts are never negative for normalized input but the
// naive side of get_min_naive_n can go below zero
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

}  // namespace

MinBleps::MinBleps(const RateParameters& params) {
    log_debug("Creating minBLEPs.");

    auto kernel = build_kernel(params);
    data_.params = params;
    data_.mixin_size = kernel.mixin_size;
    data_.demultiplexed = demultiplex(kernel.minblep, params.scale);
    data_.minblep = std::move(kernel.minblep);
    data_.maps = build_index_maps(params.naiverate, params.outrate, params.scale, data_.mixin_size);

    log_debug(std::to_string(params.scale) + " minBLEPs created.");
}

MinBleps MinBleps::create(int naiverate, int outrate, std::optional<int> scale,
                          double cutoff, double transition) {
    return MinBleps(resolve_parameters(naiverate, outrate, scale, cutoff, transition));
}

MinBleps MinBleps::load_or_create(CacheStore& store, int naiverate, int outrate,
                                  std::optional<int> scale, double cutoff, double transition) {
    const auto params = resolve_parameters(naiverate, outrate, scale, cutoff, transition);
    const auto key = cache_key(params);
    if (store.exists(key)) {
        return store.load(key);
    }
    MinBleps table(params);
    store.atomic_store(key, table);
    return table;
}

MinBleps MinBleps::load_or_create(int naiverate, int outrate, std::optional<int> scale,
                                  double cutoff, double transition) {
    DirectoryCacheStore store(CacheConfig::from_environment());
    return load_or_create(store, naiverate, outrate, scale, cutoff, transition);
}

std::int64_t MinBleps::get_out_count(std::int64_t naivex, std::int64_t naive_n) const {
    const auto& naivex2outx = data_.maps.naivex2outx;
    std::int64_t out0 = naivex2outx[static_cast<std::size_t>(naivex)];
    naivex += naive_n;
    const std::int64_t shift = floor_div(naivex, naiverate());
    out0 -= static_cast<std::int64_t>(outrate()) * shift;
    naivex -= static_cast<std::int64_t>(naiverate()) * shift;
    // First output sample that can't be produced yet
    return naivex2outx[static_cast<std::size_t>(naivex)] - out0;
}

std::int64_t MinBleps::get_min_naive_n(std::int64_t naivex, std::int64_t out_count) const {
    std::int64_t outx = data_.maps.naivex2outx[static_cast<std::size_t>(naivex)] + out_count;
    const std::int64_t shift = floor_div(outx, outrate());
    outx -= static_cast<std::int64_t>(outrate()) * shift;
    naivex -= static_cast<std::int64_t>(naiverate()) * shift;
    return data_.maps.outx2minnaivex[static_cast<std::size_t>(outx)] - naivex;
}

void MinBleps::paste(std::int32_t naivex, std::span<const float> diff, std::span<float> out) const {
    paste_minbleps(diff.size(), out.data(), out.size(),
                   data_.maps.naivex2outx.data(), data_.demultiplexed.data(),
                   data_.maps.naivex2off.data(), diff.data(),
                   naivex, naiverate(), outrate(), data_.mixin_size);
}

}  // namespace minblep
