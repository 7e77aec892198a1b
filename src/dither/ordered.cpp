#include "ordered.hpp"

#include <stdexcept>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace halftone {

OrderedDitherer::OrderedDitherer(const Config& config)
    : config_(config), matrix_(config.matrix_size) {}

Raster OrderedDitherer::process_gray(const Raster& input) const {
    if (input.channels() != 1) {
        throw std::invalid_argument("ordered: grayscale mode requires a single-channel raster");
    }

    const int w = input.width();
    const int h = input.height();
    Raster out(w, h, 1);

#ifdef HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            float v = static_cast<float>(input.at(x, y));
            out.at(x, y) = v > threshold(x, y) ? 255 : 0;
        }
    }
    return out;
}

Raster OrderedDitherer::process_color(const Raster& input, const Palette& palette) const {
    if (input.channels() != 3) {
        throw std::invalid_argument("ordered: colour mode requires a 3-channel raster");
    }
    if (palette.empty()) {
        throw std::invalid_argument("ordered: palette is empty");
    }

    const int w = input.width();
    const int h = input.height();
    const bool binary = palette.size() == 2;
    Raster out(w, h, 3);

#ifdef HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            float r = static_cast<float>(input.at(x, y, 0));
            float g = static_cast<float>(input.at(x, y, 1));
            float b = static_cast<float>(input.at(x, y, 2));

            PaletteColor chosen;
            if (binary) {
                float mean = (r + g + b) / 3.0f;
                chosen = mean > threshold(x, y) ? palette[1] : palette[0];
            } else {
                chosen = nearest_color(r, g, b, palette).color;
            }

            out.at(x, y, 0) = static_cast<uint8_t>(chosen.r);
            out.at(x, y, 1) = static_cast<uint8_t>(chosen.g);
            out.at(x, y, 2) = static_cast<uint8_t>(chosen.b);
        }
    }
    return out;
}

}
