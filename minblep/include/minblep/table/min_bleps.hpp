#pragma once

#include "index_maps.hpp"
#include "scale.hpp"
#include "../dsp/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace minblep {

class CacheStore;

/// Everything a built table consists of; the unit that is cached
struct TableData {
    RateParameters params;
    std::size_t mixin_size = 0;
    std::vector<float> minblep;        // Padded step, mixin_size * scale samples
    std::vector<float> demultiplexed;  // Same samples grouped by phase
    IndexMaps maps;

    bool operator==(const TableData&) const = default;
};

/// Immutable minBLEP table for one (naiverate, outrate) pair.
///
/// Built once, then shared read-only: every query is const and safe to call
/// concurrently. paste() writes only to the caller's buffer, so concurrent
/// pastes into the same buffer need external locking.
class MinBleps {
public:
    /// Build the table, bypassing any cache
    [[nodiscard]] static MinBleps create(int naiverate, int outrate, std::optional<int> scale,
                                         double cutoff = DEFAULT_CUTOFF,
                                         double transition = DEFAULT_TRANSITION);

    /// Load the table from `store`, or build and publish it there
    [[nodiscard]] static MinBleps load_or_create(CacheStore& store, int naiverate, int outrate,
                                                 std::optional<int> scale,
                                                 double cutoff = DEFAULT_CUTOFF,
                                                 double transition = DEFAULT_TRANSITION);

    /// Same, using the directory store configured from the environment
    [[nodiscard]] static MinBleps load_or_create(int naiverate, int outrate, std::optional<int> scale,
                                                 double cutoff = DEFAULT_CUTOFF,
                                                 double transition = DEFAULT_TRANSITION);

    /// Wrap an already built table, e.g. one decoded from a snapshot
    explicit MinBleps(TableData data) : data_(std::move(data)) {}

    /// True if naivex lies in [0, naiverate), the range every query expects
    [[nodiscard]] bool is_normalized(std::int64_t naivex) const noexcept {
        return naivex >= 0 && naivex < data_.params.naiverate;
    }

    /// Output samples produced while consuming naive_n naive samples from naivex
    [[nodiscard]] std::int64_t get_out_count(std::int64_t naivex, std::int64_t naive_n) const;

    /// Naive samples needed from naivex before out_count output samples are final
    [[nodiscard]] std::int64_t get_min_naive_n(std::int64_t naivex, std::int64_t out_count) const;

    /// Add a band-limited step for every nonzero diff[i] (naive index
    /// naivex + i) into out, relative to the output index of naivex
    void paste(std::int32_t naivex, std::span<const float> diff, std::span<float> out) const;

    [[nodiscard]] const TableData& data() const noexcept { return data_; }
    [[nodiscard]] const RateParameters& params() const noexcept { return data_.params; }
    [[nodiscard]] int naiverate() const noexcept { return data_.params.naiverate; }
    [[nodiscard]] int outrate() const noexcept { return data_.params.outrate; }
    [[nodiscard]] int scale() const noexcept { return data_.params.scale; }
    [[nodiscard]] std::size_t mixin_size() const noexcept { return data_.mixin_size; }
    [[nodiscard]] const std::vector<float>& minblep() const noexcept { return data_.minblep; }
    [[nodiscard]] const std::vector<float>& demultiplexed() const noexcept { return data_.demultiplexed; }
    [[nodiscard]] const IndexMaps& maps() const noexcept { return data_.maps; }

    bool operator==(const MinBleps&) const = default;

private:
    // Unchecked: params must come from resolve_parameters()
    explicit MinBleps(const RateParameters& params);

    TableData data_;
};

}  // namespace minblep
