#pragma once

#include "../table/min_bleps.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace minblep {

// Versioned binary snapshot of a TableData, little-endian:
//   "MBLP" u32 version
//   i32 naiverate, i32 outrate, i32 scale, f64 cutoff, f64 transition, u64 mixin_size
//   u64 n, f32[n] minblep
//   u64 n, f32[n] demultiplexed
//   u64 n, i32[n] naivex2outx / naivex2shape / naivex2off / outx2minnaivex
inline constexpr char SNAPSHOT_MAGIC[4] = {'M', 'B', 'L', 'P'};
inline constexpr std::uint32_t SNAPSHOT_VERSION = 1;

struct SnapshotData {
    TableData table;
    bool success = false;
    std::string error_message;
};

class Snapshot {
public:
    [[nodiscard]] static std::vector<std::uint8_t> encode(const TableData& table);
    [[nodiscard]] static SnapshotData decode(const std::uint8_t* data, std::size_t size);
};

/// Canonical cache key, e.g. "MinBleps(48000,44100,160,0.475,0.05)".
/// Doubles use the shortest representation that round-trips.
[[nodiscard]] std::string cache_key(const RateParameters& params);

}  // namespace minblep
