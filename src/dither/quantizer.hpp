#pragma once

#include "dither/palette.hpp"

namespace halftone {

// Maps one working pixel (1 or 3 float channels) onto the output palette.
class Quantizer {
public:
    virtual ~Quantizer() = default;
    virtual int channels() const = 0;
    virtual void quantize(const float* in, float* out) const = 0;
};

// Grayscale: 255 above the cutoff, 0 otherwise.
class ThresholdQuantizer : public Quantizer {
public:
    static constexpr float kDefaultCutoff = 128.0f;

    explicit ThresholdQuantizer(float cutoff = kDefaultCutoff) : cutoff_(cutoff) {}

    int channels() const override { return 1; }
    void quantize(const float* in, float* out) const override {
        out[0] = in[0] > cutoff_ ? 255.0f : 0.0f;
    }

private:
    float cutoff_;
};

class PaletteQuantizer : public Quantizer {
public:
    /// Throws std::invalid_argument on an empty palette.
    explicit PaletteQuantizer(const Palette& palette);

    int channels() const override { return 3; }
    void quantize(const float* in, float* out) const override;

private:
    Palette palette_;
};

}
