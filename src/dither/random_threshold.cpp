#include "random_threshold.hpp"

#include <algorithm>
#include <stdexcept>

namespace halftone {

MersenneRandomSource::MersenneRandomSource() : engine_(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : engine_(seed) {}

float MersenneRandomSource::uniform(float lo, float hi) {
    if (!(hi > lo)) return lo;
    // Drawn in double so hi - lo stays finite for any float bounds.
    std::uniform_real_distribution<double> dist(lo, hi);
    return static_cast<float>(dist(engine_));
}

std::unique_ptr<RandomSource> make_random_source(std::optional<uint32_t> seed) {
    if (seed) {
        return std::make_unique<MersenneRandomSource>(*seed);
    }
    return std::make_unique<MersenneRandomSource>();
}

RandomDitherer::RandomDitherer(RandomSource& source, const Config& config)
    : source_(source), config_(config) {}

Raster RandomDitherer::process_gray(const Raster& input) {
    if (input.channels() != 1) {
        throw std::invalid_argument("random: grayscale mode requires a single-channel raster");
    }

    const float v = config_.threshold_variance;
    const int w = input.width();
    const int h = input.height();
    Raster out(w, h, 1);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            float threshold = 128.0f + source_.uniform(-v, v);
            out.at(x, y) = static_cast<float>(input.at(x, y)) > threshold ? 255 : 0;
        }
    }
    return out;
}

Raster RandomDitherer::process_color(const Raster& input, const Palette& palette) {
    if (input.channels() != 3) {
        throw std::invalid_argument("random: colour mode requires a 3-channel raster");
    }
    if (palette.empty()) {
        throw std::invalid_argument("random: palette is empty");
    }

    const float v = config_.threshold_variance;
    const int w = input.width();
    const int h = input.height();
    Raster out(w, h, 3);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            float noisy[3];
            for (int c = 0; c < 3; ++c) {
                float n = source_.uniform(-v, v);
                noisy[c] = std::clamp(static_cast<float>(input.at(x, y, c)) + n, 0.0f, 255.0f);
            }
            PaletteColor chosen = nearest_color(noisy[0], noisy[1], noisy[2], palette).color;
            out.at(x, y, 0) = static_cast<uint8_t>(chosen.r);
            out.at(x, y, 1) = static_cast<uint8_t>(chosen.g);
            out.at(x, y, 2) = static_cast<uint8_t>(chosen.b);
        }
    }
    return out;
}

}
