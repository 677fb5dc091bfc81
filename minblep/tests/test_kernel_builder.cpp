#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <minblep/errors.hpp>
#include <minblep/table/kernel_builder.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

using namespace minblep;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Unit Tests [kernel]
// ============================================================================

TEST_CASE("filter_order rounds to the nearest even order", "[kernel]") {
    CHECK(filter_order(0.05) == 80);
    CHECK(filter_order(0.1) == 40);
    CHECK(filter_order(0.3) == 14);   // 4/0.3 = 13.33
    CHECK(filter_order(0.5) == 8);
    CHECK(filter_order(0.99) == 4);
}

TEST_CASE("Tiny transitions are rejected before sizing the filter", "[kernel]") {
    CHECK_THROWS_AS(filter_order(1e-10), ConfigurationError);
    CHECK_THROWS_AS(build_kernel(resolve_parameters(4, 4, std::nullopt, 0.475, 1e-10)),
                    ConfigurationError);
}

TEST_CASE("Kernel sizes for scale 1", "[kernel]") {
    auto kernel = build_kernel(resolve_parameters(4, 4, std::nullopt));

    CHECK(kernel.order == 80);
    CHECK(kernel.kernel_size == 81);
    CHECK(kernel.size == 128);
    CHECK(kernel.midpoint == 64);
    CHECK(kernel.bli.size() == 128);
    CHECK(kernel.minbli.size() == 128);
    CHECK(kernel.minblep.size() == 128);
    CHECK(kernel.mixin_size == 128);

    SECTION("padded sinc peaks at the midpoint and is symmetric about it") {
        auto peak = std::max_element(kernel.bli.begin(), kernel.bli.end());
        CHECK(static_cast<std::size_t>(peak - kernel.bli.begin()) == kernel.midpoint);
        // lpad = 24, rpad = 23
        for (std::size_t i = 0; i < 24; ++i) {
            CHECK(kernel.bli[i] == 0.0);
        }
        for (std::size_t d = 1; d <= 40; ++d) {
            CHECK_THAT(kernel.bli[kernel.midpoint - d],
                       WithinAbs(kernel.bli[kernel.midpoint + d], 1e-12));
        }
        // Passband gain at the peak: cutoff * 2 / scale
        CHECK_THAT(kernel.bli[kernel.midpoint], WithinAbs(0.95, 1e-12));
    }
}

TEST_CASE("Minimum-phase step for a 48000 -> 44100 table", "[kernel]") {
    auto params = resolve_parameters(48000, 44100, std::nullopt);
    auto kernel = build_kernel(params);
    const std::size_t scale = static_cast<std::size_t>(params.scale);

    CHECK(kernel.kernel_size == 12801);
    CHECK(kernel.size == 16384);
    CHECK(kernel.minblep.size() % scale == 0);
    CHECK(kernel.mixin_size == kernel.minblep.size() / scale);
    CHECK(kernel.minblep.size() >= kernel.size + scale - 1);
    CHECK(kernel.minblep.size() < kernel.size + 2 * scale);

    SECTION("leading zeros") {
        for (std::size_t i = 0; i + 1 < scale; ++i) {
            CHECK(kernel.minblep[i] == 0.0f);
        }
        CHECK(std::abs(kernel.minblep[scale - 1]) < 1e-3f);
    }

    SECTION("tail settles at one") {
        const std::size_t n = kernel.minblep.size();
        for (std::size_t i = n - kernel.mixin_size; i < n; ++i) {
            CHECK_THAT(kernel.minblep[i], WithinAbs(1.0f, 1e-3f));
        }
    }

    SECTION("minimum phase keeps the DC gain and moves energy forward") {
        const double dc_linear = std::accumulate(kernel.bli.begin(), kernel.bli.end(), 0.0);
        const double dc_min = std::accumulate(kernel.minbli.begin(), kernel.minbli.end(), 0.0);
        CHECK_THAT(dc_min, WithinAbs(dc_linear, 1e-6));

        auto peak = std::max_element(kernel.minbli.begin(), kernel.minbli.end(),
                                     [](double a, double b) { return std::abs(a) < std::abs(b); });
        CHECK(static_cast<std::size_t>(peak - kernel.minbli.begin()) < kernel.midpoint / 2);
    }
}

TEST_CASE("Kernel construction is deterministic", "[kernel]") {
    auto params = resolve_parameters(6, 4, std::nullopt);
    auto a = build_kernel(params);
    auto b = build_kernel(params);
    CHECK(a.minblep == b.minblep);
    CHECK(a.minbli == b.minbli);
}
