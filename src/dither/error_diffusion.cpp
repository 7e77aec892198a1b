#include "error_diffusion.hpp"

#include <stdexcept>
#include <string>

namespace halftone {

ErrorDiffuser::ErrorDiffuser(const DiffusionKernel& kernel, const Config& config)
    : kernel_(kernel), config_(config) {}

void ErrorDiffuser::distribute(FloatRaster& work, int x, int y, const float* error) const {
    const int channels = work.channels();
    for (const auto& tap : kernel_.taps) {
        int nx = x + tap.dx;
        int ny = y + tap.dy;
        if (!work.contains(nx, ny)) continue;

        float* dst = work.pixel(nx, ny);
        for (int c = 0; c < channels; ++c) {
            dst[c] += error[c] * tap.weight;
        }
    }
}

Raster ErrorDiffuser::process(const Raster& input, const Quantizer& quantizer) const {
    if (input.channels() != quantizer.channels()) {
        throw std::invalid_argument(std::string(kernel_.name) + ": raster has " +
                                    std::to_string(input.channels()) + " channel(s), quantizer expects " +
                                    std::to_string(quantizer.channels()));
    }

    FloatRaster work(input);
    const int w = work.width();
    const int h = work.height();
    const int channels = work.channels();
    const float strength = config_.strength;

    float quantized[3];
    float error[3];

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            float* px = work.pixel(x, y);
            quantizer.quantize(px, quantized);
            for (int c = 0; c < channels; ++c) {
                error[c] = (px[c] - quantized[c]) * strength;
                px[c] = quantized[c];
            }
            distribute(work, x, y, error);
        }
    }

    return work.to_raster();
}

}
