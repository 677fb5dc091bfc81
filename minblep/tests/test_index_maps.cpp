#include <catch2/catch_test_macros.hpp>

#include <minblep/table/index_maps.hpp>
#include <minblep/table/scale.hpp>

#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

using namespace minblep;

// ============================================================================
// Unit Tests [index_maps]
// ============================================================================

TEST_CASE("demultiplex groups samples by phase", "[index_maps]") {
    std::vector<float> minblep(12);
    std::iota(minblep.begin(), minblep.end(), 0.0f);

    SECTION("scale 3") {
        auto out = demultiplex(minblep, 3);
        std::vector<float> expected{0, 3, 6, 9, 1, 4, 7, 10, 2, 5, 8, 11};
        CHECK(out == expected);
    }

    SECTION("scale 1 is the identity") {
        CHECK(demultiplex(minblep, 1) == minblep);
    }
}

TEST_CASE("Index maps for equal rates", "[index_maps]") {
    auto maps = build_index_maps(4, 4, 1, 128);
    CHECK(maps.naivex2outx == std::vector<std::int32_t>{0, 1, 2, 3});
    CHECK(maps.naivex2shape == std::vector<std::int32_t>{0, 0, 0, 0});
    CHECK(maps.naivex2off == std::vector<std::int32_t>{0, 0, 0, 0});
    CHECK(maps.outx2minnaivex == std::vector<std::int32_t>{0, 1, 2, 3});
}

TEST_CASE("Index maps for downsampling 6 -> 4", "[index_maps]") {
    // scale 3, dualscale 2
    auto maps = build_index_maps(6, 4, 3, 10);
    CHECK(maps.naivex2outx == std::vector<std::int32_t>{0, 0, 1, 2, 2, 3});
    CHECK(maps.naivex2shape == std::vector<std::int32_t>{2, 0, 1, 2, 0, 1});
    CHECK(maps.naivex2off == std::vector<std::int32_t>{20, 0, 10, 20, 0, 10});
    CHECK(maps.outx2minnaivex == std::vector<std::int32_t>{0, 2, 3, 5});
}

TEST_CASE("Index maps for upsampling 2 -> 5", "[index_maps]") {
    // scale 2, dualscale 5; output indices 1, 3 and 4 have no naive index
    auto maps = build_index_maps(2, 5, 2, 7);
    CHECK(maps.naivex2outx == std::vector<std::int32_t>{0, 2});
    CHECK(maps.naivex2shape == std::vector<std::int32_t>{1, 0});
    CHECK(maps.naivex2off == std::vector<std::int32_t>{7, 0});
    CHECK(maps.outx2minnaivex == std::vector<std::int32_t>{0, 1, 1, 2, 2});
}

TEST_CASE("Index maps are consistent for real rates", "[index_maps]") {
    const std::pair<int, int> rates[] = {
        {48000, 44100}, {44100, 48000}, {250000, 44100}, {96000, 48000}, {7, 3},
    };

    for (auto [naiverate, outrate] : rates) {
        const int scale = resolve_scale(naiverate, outrate);
        auto maps = build_index_maps(naiverate, outrate, scale, 17);

        REQUIRE(maps.naivex2outx.size() == static_cast<std::size_t>(naiverate));
        REQUIRE(maps.naivex2shape.size() == static_cast<std::size_t>(naiverate));
        REQUIRE(maps.naivex2off.size() == static_cast<std::size_t>(naiverate));
        REQUIRE(maps.outx2minnaivex.size() == static_cast<std::size_t>(outrate));

        bool consistent = true;
        bool shapes_in_range = true;
        bool monotonic = true;
        for (std::size_t n = 0; n < maps.naivex2outx.size(); ++n) {
            const auto outx = maps.naivex2outx[n];
            const auto minnaivex = maps.outx2minnaivex[static_cast<std::size_t>(outx)];
            consistent = consistent && maps.naivex2outx[static_cast<std::size_t>(minnaivex)] == outx &&
                         minnaivex <= static_cast<std::int32_t>(n);
            shapes_in_range = shapes_in_range && maps.naivex2shape[n] >= 0 &&
                              maps.naivex2shape[n] < scale &&
                              maps.naivex2off[n] == maps.naivex2shape[n] * 17;
            if (n > 0) {
                monotonic = monotonic && maps.naivex2outx[n] >= maps.naivex2outx[n - 1];
            }
        }
        CHECK(consistent);
        CHECK(shapes_in_range);
        CHECK(monotonic);
        CHECK(maps.naivex2outx.front() == 0);
        CHECK(maps.naivex2outx.back() < outrate);
    }
}
