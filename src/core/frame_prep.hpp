#pragma once

#include "core/types.hpp"

namespace halftone {

// Turns a decoded RGBA frame into the dither engines' working raster:
// resized to the target size, then either 3-channel RGB (colour) or
// 1-channel BT.601 luma (grayscale).
class FramePrep {
public:
    struct Config {
        int target_width = 540;
        int target_height = 960;
        bool color = false;
    };

    FramePrep() : FramePrep(Config{}) {}
    explicit FramePrep(const Config& config) : config_(config) {}

    void set_config(const Config& config) { config_ = config; }
    const Config& config() const { return config_; }

    /// Returns an empty raster for an empty frame.
    Raster process(const FrameBuffer& input) const;

    /// Bilinear resample to exactly width x height, aspect ratio not kept.
    static FrameBuffer resize(const FrameBuffer& input, int width, int height);

    static Raster to_rgb(const FrameBuffer& input);
    static Raster to_luma(const FrameBuffer& input);

    static uint8_t luma(uint8_t r, uint8_t g, uint8_t b);

private:
    Config config_;
};

}
