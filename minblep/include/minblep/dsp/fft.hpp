#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace minblep {

using Complex = std::complex<double>;

// In-place iterative radix-2 FFT
// Sizes must be powers of two. Forward uses exp(-2*pi*i*k*n/N) with no
// scaling, inverse uses exp(+2*pi*i*k*n/N) and divides by N.
class FFT {
public:
    static void forward(std::vector<Complex>& data);
    static void inverse(std::vector<Complex>& data);

    // Smallest power of two >= n (1 for n == 0)
    [[nodiscard]] static std::size_t next_pow2(std::size_t n) noexcept;
    [[nodiscard]] static bool is_pow2(std::size_t n) noexcept;

private:
    static void transform(std::vector<Complex>& data, bool inverse);
    static void bit_reverse(std::vector<Complex>& data);
};

}  // namespace minblep
