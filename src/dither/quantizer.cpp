#include "quantizer.hpp"

#include <stdexcept>

namespace halftone {

PaletteQuantizer::PaletteQuantizer(const Palette& palette) : palette_(palette) {
    if (palette_.empty()) {
        throw std::invalid_argument("palette quantizer requires a non-empty palette");
    }
}

void PaletteQuantizer::quantize(const float* in, float* out) const {
    PaletteMatch m = nearest_color(in[0], in[1], in[2], palette_);
    out[0] = static_cast<float>(m.color.r);
    out[1] = static_cast<float>(m.color.g);
    out[2] = static_cast<float>(m.color.b);
}

}
