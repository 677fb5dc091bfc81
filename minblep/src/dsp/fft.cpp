#include "minblep/dsp/fft.hpp"
#include "minblep/dsp/constants.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace minblep {

std::size_t FFT::next_pow2(std::size_t n) noexcept {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

bool FFT::is_pow2(std::size_t n) noexcept {
    return n != 0 && (n & (n - 1)) == 0;
}

void FFT::bit_reverse(std::vector<Complex>& data) {
    const std::size_t n = data.size();
    for (std::size_t i = 1, j = 0; i < n; ++i) {
        std::size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(data[i], data[j]);
        }
    }
}

void FFT::transform(std::vector<Complex>& data, bool inverse) {
    const std::size_t n = data.size();
    if (n <= 1) return;
    if (!is_pow2(n)) {
        throw std::invalid_argument("FFT size must be a power of two");
    }

    bit_reverse(data);

    for (std::size_t len = 2; len <= n; len <<= 1) {
        const double angle = (inverse ? 2.0 : -2.0) * PI / static_cast<double>(len);
        const std::size_t half = len / 2;
        for (std::size_t i = 0; i < n; i += len) {
            for (std::size_t j = 0; j < half; ++j) {
                // Twiddles computed directly to keep rounding error flat for large n
                const double a = angle * static_cast<double>(j);
                const Complex w(std::cos(a), std::sin(a));
                const Complex u = data[i + j];
                const Complex t = w * data[i + j + half];
                data[i + j] = u + t;
                data[i + j + half] = u - t;
            }
        }
    }

    if (inverse) {
        const double scale = 1.0 / static_cast<double>(n);
        for (auto& x : data) {
            x *= scale;
        }
    }
}

void FFT::forward(std::vector<Complex>& data) {
    transform(data, false);
}

void FFT::inverse(std::vector<Complex>& data) {
    transform(data, true);
}

}  // namespace minblep
