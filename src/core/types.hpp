#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <string>

namespace halftone {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    MEMORY_ERROR,
    PROCESSING_ERROR,
    INVALID_ARGUMENT,
    IO_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}
};

// Decoded RGBA frame as delivered by a FrameSource.
class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                set_pixel(x, y, c);
            }
        }
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

// Interleaved 8-bit raster with 1 (intensity) or 3 (R, G, B) channels.
// This is the unit of work of the dither engines.
class Raster {
public:
    Raster() = default;
    Raster(int w, int h, int channels, uint8_t fill = 0)
        : width_(w), height_(h), channels_(channels),
          data_(static_cast<size_t>(w) * h * channels, fill) {}

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    bool is_color() const { return channels_ == 3; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    size_t index(int x, int y) const {
        return (static_cast<size_t>(y) * width_ + x) * channels_;
    }

    uint8_t at(int x, int y, int c = 0) const { return data_[index(x, y) + c]; }
    uint8_t& at(int x, int y, int c = 0) { return data_[index(x, y) + c]; }

    bool same_shape(const Raster& other) const {
        return width_ == other.width_ && height_ == other.height_ && channels_ == other.channels_;
    }

    bool operator==(const Raster& other) const {
        return same_shape(other) && data_ == other.data_;
    }
    bool operator!=(const Raster& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    int channels_ = 1;
    std::vector<uint8_t> data_;
};

// Float working copy of a Raster. Holds the running values, including
// diffused error, for one engine invocation.
class FloatRaster {
public:
    FloatRaster() = default;
    FloatRaster(int w, int h, int channels)
        : width_(w), height_(h), channels_(channels),
          data_(static_cast<size_t>(w) * h * channels, 0.0f) {}

    explicit FloatRaster(const Raster& src)
        : width_(src.width()), height_(src.height()), channels_(src.channels()),
          data_(src.byte_size()) {
        const uint8_t* s = src.data();
        for (size_t i = 0; i < data_.size(); ++i) {
            data_[i] = static_cast<float>(s[i]);
        }
    }

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    bool contains(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

    float* pixel(int x, int y) {
        return data_.data() + (static_cast<size_t>(y) * width_ + x) * channels_;
    }
    const float* pixel(int x, int y) const {
        return data_.data() + (static_cast<size_t>(y) * width_ + x) * channels_;
    }

    // Clamps to [0,255] and truncates, the same conversion a saturating
    // float->uint8 cast performs.
    Raster to_raster() const {
        Raster out(width_, height_, channels_);
        uint8_t* d = out.data();
        for (size_t i = 0; i < data_.size(); ++i) {
            d[i] = static_cast<uint8_t>(std::clamp(data_[i], 0.0f, 255.0f));
        }
        return out;
    }

private:
    int width_ = 0;
    int height_ = 0;
    int channels_ = 1;
    std::vector<float> data_;
};

}
