#include "minblep/cache/snapshot.hpp"
#include <bit>
#include <charconv>
#include <cstring>
#include <string>

namespace minblep {

namespace {

class Writer {
public:
    explicit Writer(std::vector<std::uint8_t>& out) : out_(out) {}

    void u32(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (i * 8)));
    }
    void u64(std::uint64_t v) {
        for (int i = 0; i < 8; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (i * 8)));
    }
    void i32(std::int32_t v) { u32(static_cast<std::uint32_t>(v)); }
    void f32(float v) { u32(std::bit_cast<std::uint32_t>(v)); }
    void f64(double v) { u64(std::bit_cast<std::uint64_t>(v)); }

    void floats(const std::vector<float>& values) {
        u64(values.size());
        for (float v : values) f32(v);
    }
    void ints(const std::vector<std::int32_t>& values) {
        u64(values.size());
        for (std::int32_t v : values) i32(v);
    }

private:
    std::vector<std::uint8_t>& out_;
};

class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    [[nodiscard]] bool ok() const { return ok_; }
    [[nodiscard]] bool at_end() const { return offset_ == size_; }

    std::uint32_t u32() {
        std::uint32_t v = 0;
        if (!take(4)) return 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(data_[offset_ - 4 + i]) << (i * 8);
        return v;
    }
    std::uint64_t u64() {
        std::uint64_t v = 0;
        if (!take(8)) return 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(data_[offset_ - 8 + i]) << (i * 8);
        return v;
    }
    std::int32_t i32() { return static_cast<std::int32_t>(u32()); }
    float f32() { return std::bit_cast<float>(u32()); }
    double f64() { return std::bit_cast<double>(u64()); }

    bool floats(std::vector<float>& values) {
        const std::uint64_t n = u64();
        if (!ok_ || n > (size_ - offset_) / 4) return ok_ = false;
        values.resize(static_cast<std::size_t>(n));
        for (auto& v : values) v = f32();
        return ok_;
    }
    bool ints(std::vector<std::int32_t>& values) {
        const std::uint64_t n = u64();
        if (!ok_ || n > (size_ - offset_) / 4) return ok_ = false;
        values.resize(static_cast<std::size_t>(n));
        for (auto& v : values) v = i32();
        return ok_;
    }

private:
    bool take(std::size_t n) {
        if (!ok_ || size_ - offset_ < n) return ok_ = false;
        offset_ += n;
        return true;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
    bool ok_ = true;
};

void append_double(std::string& out, double value) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, ptr);
}

}  // namespace

std::vector<std::uint8_t> Snapshot::encode(const TableData& table) {
    std::vector<std::uint8_t> out;
    out.reserve(64 + (table.minblep.size() + table.demultiplexed.size()) * 4 +
                (table.maps.naivex2outx.size() * 3 + table.maps.outx2minnaivex.size()) * 4);

    out.insert(out.end(), std::begin(SNAPSHOT_MAGIC), std::end(SNAPSHOT_MAGIC));
    Writer w(out);
    w.u32(SNAPSHOT_VERSION);
    w.i32(table.params.naiverate);
    w.i32(table.params.outrate);
    w.i32(table.params.scale);
    w.f64(table.params.cutoff);
    w.f64(table.params.transition);
    w.u64(table.mixin_size);
    w.floats(table.minblep);
    w.floats(table.demultiplexed);
    w.ints(table.maps.naivex2outx);
    w.ints(table.maps.naivex2shape);
    w.ints(table.maps.naivex2off);
    w.ints(table.maps.outx2minnaivex);
    return out;
}

SnapshotData Snapshot::decode(const std::uint8_t* data, std::size_t size) {
    SnapshotData result{};
    result.success = false;

    if (size < sizeof(SNAPSHOT_MAGIC) ||
        std::memcmp(data, SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC)) != 0) {
        result.error_message = "Not a minBLEP snapshot (missing MBLP header)";
        return result;
    }

    Reader r(data + sizeof(SNAPSHOT_MAGIC), size - sizeof(SNAPSHOT_MAGIC));
    const std::uint32_t version = r.u32();
    if (r.ok() && version != SNAPSHOT_VERSION) {
        result.error_message = "Unsupported snapshot version " + std::to_string(version);
        return result;
    }

    TableData& t = result.table;
    t.params.naiverate = r.i32();
    t.params.outrate = r.i32();
    t.params.scale = r.i32();
    t.params.cutoff = r.f64();
    t.params.transition = r.f64();
    t.mixin_size = static_cast<std::size_t>(r.u64());
    r.floats(t.minblep);
    r.floats(t.demultiplexed);
    r.ints(t.maps.naivex2outx);
    r.ints(t.maps.naivex2shape);
    r.ints(t.maps.naivex2off);
    r.ints(t.maps.outx2minnaivex);

    if (!r.ok()) {
        result.error_message = "Truncated snapshot";
        return result;
    }
    if (!r.at_end()) {
        result.error_message = "Trailing bytes after snapshot";
        return result;
    }

    const auto& p = t.params;
    if (p.naiverate <= 0 || p.outrate <= 0 || p.scale <= 0) {
        result.error_message = "Corrupt snapshot (non-positive rate or scale)";
        return result;
    }
    const auto naive_count = static_cast<std::size_t>(p.naiverate);
    const std::size_t table_size = t.mixin_size * static_cast<std::size_t>(p.scale);
    if (t.minblep.size() != table_size || t.demultiplexed.size() != table_size ||
        t.maps.naivex2outx.size() != naive_count || t.maps.naivex2shape.size() != naive_count ||
        t.maps.naivex2off.size() != naive_count ||
        t.maps.outx2minnaivex.size() != static_cast<std::size_t>(p.outrate)) {
        result.error_message = "Corrupt snapshot (array sizes do not match parameters)";
        return result;
    }
    for (std::size_t n = 0; n < naive_count; ++n) {
        const std::int32_t outx = t.maps.naivex2outx[n];
        const std::int32_t off = t.maps.naivex2off[n];
        if (outx < 0 || outx >= p.outrate || off < 0 ||
            static_cast<std::size_t>(off) + t.mixin_size > table_size) {
            result.error_message = "Corrupt snapshot (index map out of range)";
            return result;
        }
    }

    result.success = true;
    return result;
}

std::string cache_key(const RateParameters& params) {
    std::string key = "MinBleps(";
    key += std::to_string(params.naiverate);
    key += ',';
    key += std::to_string(params.outrate);
    key += ',';
    key += std::to_string(params.scale);
    key += ',';
    append_double(key, params.cutoff);
    key += ',';
    append_double(key, params.transition);
    key += ')';
    return key;
}

}  // namespace minblep
