#pragma once

#include "core/types.hpp"
#include "dither/palette.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace halftone {

// Source of uniform noise for random-threshold dithering.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    /// Uniform draw in [lo, hi].
    virtual float uniform(float lo, float hi) = 0;
};

class MersenneRandomSource : public RandomSource {
public:
    /// Seeds from std::random_device.
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);

    float uniform(float lo, float hi) override;

private:
    std::mt19937 engine_;
};

/// Seeded source when a seed is given, nondeterministic otherwise.
std::unique_ptr<RandomSource> make_random_source(std::optional<uint32_t> seed);

// Threshold dithering with an independently drawn perturbation per pixel.
// Draws happen in row-major order: one per pixel in grayscale, three per
// pixel (R, G, B) in colour.
class RandomDitherer {
public:
    struct Config {
        float threshold_variance = 50.0f;
    };

    explicit RandomDitherer(RandomSource& source) : RandomDitherer(source, Config{}) {}
    RandomDitherer(RandomSource& source, const Config& config);

    const Config& config() const { return config_; }

    /// 255 where value > 128 + U(-v, v), else 0.
    Raster process_gray(const Raster& input);

    /// Adds U(-v, v) to each channel, clamps to 0..255 and picks the nearest
    /// palette colour.
    Raster process_color(const Raster& input, const Palette& palette);

private:
    RandomSource& source_;
    Config config_;
};

}
