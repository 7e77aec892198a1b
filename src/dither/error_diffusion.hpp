#pragma once

#include "core/types.hpp"
#include "dither/kernels.hpp"
#include "dither/quantizer.hpp"

namespace halftone {

// Scan-and-propagate error diffusion shared by Floyd-Steinberg, Atkinson
// and Jarvis-Judice-Ninke.
//
// Pixels are visited in row-major order. Each pixel is quantized against its
// accumulated value (input plus error received from earlier pixels), and
// (accumulated - quantized) * strength is pushed to the kernel taps. Taps that
// land outside the raster are dropped; their share of the error is lost.
// The scan is inherently sequential.
class ErrorDiffuser {
public:
    struct Config {
        float strength = 1.0f;
    };

    explicit ErrorDiffuser(const DiffusionKernel& kernel) : ErrorDiffuser(kernel, Config{}) {}
    ErrorDiffuser(const DiffusionKernel& kernel, const Config& config);

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }
    const DiffusionKernel& kernel() const { return kernel_; }

    /// Throws std::invalid_argument when the raster channel count does not
    /// match the quantizer.
    Raster process(const Raster& input, const Quantizer& quantizer) const;

private:
    const DiffusionKernel& kernel_;
    Config config_;

    void distribute(FloatRaster& work, int x, int y, const float* error) const;
};

}
