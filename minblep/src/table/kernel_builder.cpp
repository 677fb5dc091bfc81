#include "minblep/table/kernel_builder.hpp"
#include "minblep/dsp/constants.hpp"
#include "minblep/dsp/fft.hpp"
#include "minblep/dsp/window.hpp"
#include "minblep/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace minblep {

int filter_order(double transition) {
    // +0.5 then truncate
    const double half_order = 4.0 / transition / 2.0 + 0.5;
    if (!(half_order >= 0.0) || half_order >= static_cast<double>(std::numeric_limits<int>::max() / 2)) {
        throw ConfigurationError("Transition " + std::to_string(transition) +
                                 " gives an unrepresentable filter order.");
    }
    return static_cast<int>(half_order) * 2;
}

KernelResult build_kernel(const RateParameters& params) {
    KernelResult result;
    const int scale = params.scale;

    result.order = filter_order(params.transition);
    if (result.order <= 0 || scale <= 0) {
        throw ConfigurationError("Degenerate filter: order " + std::to_string(result.order) +
                                 ", scale " + std::to_string(scale) + ".");
    }
    result.kernel_size = static_cast<std::size_t>(result.order) * static_cast<std::size_t>(scale) + 1;
    result.size = FFT::next_pow2(result.kernel_size);
    result.midpoint = result.size / 2;

    // Windowed sinc over [-order*cutoff, order*cutoff], unity passband gain
    const std::size_t kernel_size = result.kernel_size;
    const double extent = static_cast<double>(result.order) * params.cutoff;
    const auto window = blackman(kernel_size);
    const double gain = params.cutoff * 2.0 / static_cast<double>(scale);

    const std::size_t rpad = (result.size - kernel_size) / 2;
    const std::size_t lpad = rpad + 1;
    result.bli.assign(result.size, 0.0);
    for (std::size_t i = 0; i < kernel_size; ++i) {
        const double x = (static_cast<double>(i) / static_cast<double>(kernel_size - 1) * 2.0 - 1.0) * extent;
        result.bli[lpad + i] = window[i] * sinc(x) * gain;
    }

    // Real cepstrum of the magnitude spectrum, phase discarded
    std::vector<Complex> spectrum(result.bli.begin(), result.bli.end());
    FFT::forward(spectrum);
    std::vector<Complex> cepstrum(result.size);
    for (std::size_t i = 0; i < result.size; ++i) {
        cepstrum[i] = std::log(std::max(MIN_MAGNITUDE, std::abs(spectrum[i])));
    }
    FFT::inverse(cepstrum);

    // Fold the anti-causal half onto the causal half. Index 0 and the
    // midpoint are shared by both halves and stay as they are.
    for (std::size_t i = 1; i < result.midpoint; ++i) {
        cepstrum[i] *= 2.0;
    }
    for (std::size_t i = result.midpoint + 1; i < result.size; ++i) {
        cepstrum[i] = 0.0;
    }

    FFT::forward(cepstrum);
    for (auto& c : cepstrum) {
        c = std::exp(c);
    }
    FFT::inverse(cepstrum);

    result.minbli.resize(result.size);
    for (std::size_t i = 0; i < result.size; ++i) {
        result.minbli[i] = cepstrum[i].real();
    }

    // Integrate to the step, with scale-1 leading zeros and trailing ones up
    // to a multiple of scale
    const std::size_t lead = static_cast<std::size_t>(scale) - 1;
    const std::size_t unpadded = lead + result.size;
    const std::size_t scale_sz = static_cast<std::size_t>(scale);
    const std::size_t padded = (unpadded + scale_sz - 1) / scale_sz * scale_sz;

    result.minblep.assign(padded, 1.0f);
    std::fill_n(result.minblep.begin(), lead, 0.0f);
    double sum = 0.0;
    for (std::size_t i = 0; i < result.size; ++i) {
        sum += result.minbli[i];
        result.minblep[lead + i] = static_cast<float>(sum);
    }
    result.mixin_size = padded / scale_sz;

    return result;
}

}  // namespace minblep
