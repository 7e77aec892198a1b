#pragma once

#include "core/types.hpp"
#include "dither/kernels.hpp"
#include "dither/palette.hpp"

namespace halftone {

// Bayer-matrix ordered dithering. Each pixel is compared against
// matrix[y % n][x % n] * 255; no error is carried between pixels.
class OrderedDitherer {
public:
    struct Config {
        int matrix_size = 4;
    };

    OrderedDitherer() : OrderedDitherer(Config{}) {}
    /// Throws std::invalid_argument for a matrix size other than 2, 4 or 8.
    explicit OrderedDitherer(const Config& config);

    const Config& config() const { return config_; }
    const ThresholdMatrix& matrix() const { return matrix_; }

    float threshold(int x, int y) const { return matrix_.at(x, y) * 255.0f; }

    /// Grayscale: 255 where value > threshold, else 0.
    Raster process_gray(const Raster& input) const;

    /// Colour with a two-entry palette compares the channel mean against the
    /// threshold and picks palette[1] above it, palette[0] otherwise. Any other
    /// palette size falls back to nearest-colour matching and ignores the
    /// threshold matrix entirely.
    Raster process_color(const Raster& input, const Palette& palette) const;

private:
    Config config_;
    ThresholdMatrix matrix_;
};

}
