#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <minblep/dsp/constants.hpp>
#include <minblep/dsp/fft.hpp>
#include <minblep/dsp/window.hpp>

#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using namespace minblep;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<Complex> naive_dft(const std::vector<Complex>& x) {
    const std::size_t n = x.size();
    std::vector<Complex> out(n);
    for (std::size_t k = 0; k < n; ++k) {
        Complex sum = 0.0;
        for (std::size_t j = 0; j < n; ++j) {
            const double a = -2.0 * PI * static_cast<double>(k * j) / static_cast<double>(n);
            sum += x[j] * Complex(std::cos(a), std::sin(a));
        }
        out[k] = sum;
    }
    return out;
}

}  // namespace

// ============================================================================
// Unit Tests [fft]
// ============================================================================

TEST_CASE("FFT size helpers", "[fft]") {
    CHECK(FFT::next_pow2(0) == 1);
    CHECK(FFT::next_pow2(1) == 1);
    CHECK(FFT::next_pow2(81) == 128);
    CHECK(FFT::next_pow2(128) == 128);
    CHECK(FFT::next_pow2(12801) == 16384);
    CHECK(FFT::is_pow2(64));
    CHECK_FALSE(FFT::is_pow2(0));
    CHECK_FALSE(FFT::is_pow2(96));
}

TEST_CASE("FFT forward transform", "[fft]") {
    SECTION("impulse gives a flat spectrum") {
        std::vector<Complex> data(16, 0.0);
        data[0] = 1.0;
        FFT::forward(data);
        for (const auto& c : data) {
            CHECK_THAT(c.real(), WithinAbs(1.0, 1e-12));
            CHECK_THAT(c.imag(), WithinAbs(0.0, 1e-12));
        }
    }

    SECTION("matches a direct DFT") {
        std::mt19937 rng(42);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        std::vector<Complex> data(32);
        for (auto& c : data) c = Complex(dist(rng), dist(rng));

        auto expected = naive_dft(data);
        FFT::forward(data);
        for (std::size_t k = 0; k < data.size(); ++k) {
            CHECK_THAT(data[k].real(), WithinAbs(expected[k].real(), 1e-9));
            CHECK_THAT(data[k].imag(), WithinAbs(expected[k].imag(), 1e-9));
        }
    }

    SECTION("rejects sizes that are not powers of two") {
        std::vector<Complex> data(12, 0.0);
        CHECK_THROWS_AS(FFT::forward(data), std::invalid_argument);
    }
}

TEST_CASE("FFT inverse undoes forward", "[fft]") {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<Complex> original(1024);
    for (auto& c : original) c = Complex(dist(rng), dist(rng));

    auto data = original;
    FFT::forward(data);
    FFT::inverse(data);
    for (std::size_t i = 0; i < data.size(); ++i) {
        CHECK_THAT(data[i].real(), WithinAbs(original[i].real(), 1e-12));
        CHECK_THAT(data[i].imag(), WithinAbs(original[i].imag(), 1e-12));
    }
}

TEST_CASE("Window and sinc", "[fft]") {
    SECTION("blackman is symmetric with unit peak") {
        auto w = blackman(9);
        REQUIRE(w.size() == 9);
        CHECK_THAT(w[0], WithinAbs(0.0, 1e-12));
        CHECK_THAT(w[4], WithinAbs(1.0, 1e-12));
        for (std::size_t i = 0; i < w.size(); ++i) {
            CHECK_THAT(w[i], WithinAbs(w[w.size() - 1 - i], 1e-12));
        }
        CHECK(blackman(1) == std::vector<double>{1.0});
        CHECK(blackman(0).empty());
    }

    SECTION("sinc zeros at integers") {
        CHECK(sinc(0.0) == 1.0);
        CHECK_THAT(sinc(1.0), WithinAbs(0.0, 1e-15));
        CHECK_THAT(sinc(-3.0), WithinAbs(0.0, 1e-15));
        CHECK_THAT(sinc(0.5), WithinAbs(2.0 / PI, 1e-15));
    }
}
