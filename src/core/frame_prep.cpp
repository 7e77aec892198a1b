#include "frame_prep.hpp"

#include <algorithm>
#include <cmath>

#ifdef HALFTONE_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace halftone {

uint8_t FramePrep::luma(uint8_t r, uint8_t g, uint8_t b) {
    float y = 0.299f * r + 0.587f * g + 0.114f * b;
    return static_cast<uint8_t>(std::clamp(std::lround(y), 0L, 255L));
}

FrameBuffer FramePrep::resize(const FrameBuffer& input, int width, int height) {
    if (input.empty() || width <= 0 || height <= 0) {
        return FrameBuffer();
    }
    if (input.width() == width && input.height() == height) {
        return input;
    }

#ifdef HALFTONE_USE_OPENCV
    cv::Mat input_mat(input.height(), input.width(), CV_8UC4,
                      const_cast<uint8_t*>(input.data()));
    cv::Mat scaled_mat;
    cv::resize(input_mat, scaled_mat, cv::Size(width, height), 0, 0, cv::INTER_LINEAR);

    FrameBuffer output(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            cv::Vec4b pixel = scaled_mat.at<cv::Vec4b>(y, x);
            output.set_pixel(x, y, Color(pixel[0], pixel[1], pixel[2], pixel[3]));
        }
    }
    return output;
#else
    FrameBuffer output(width, height);

    const float x_ratio = static_cast<float>(input.width()) / width;
    const float y_ratio = static_cast<float>(input.height()) / height;
    const int max_x = input.width() - 1;
    const int max_y = input.height() - 1;

#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int y = 0; y < height; ++y) {
        // Pixel-centre alignment, same convention as cv::INTER_LINEAR.
        float src_y = std::clamp((y + 0.5f) * y_ratio - 0.5f, 0.0f, static_cast<float>(max_y));
        int y0 = static_cast<int>(src_y);
        int y1 = std::min(y0 + 1, max_y);
        float fy = src_y - y0;

        for (int x = 0; x < width; ++x) {
            float src_x = std::clamp((x + 0.5f) * x_ratio - 0.5f, 0.0f, static_cast<float>(max_x));
            int x0 = static_cast<int>(src_x);
            int x1 = std::min(x0 + 1, max_x);
            float fx = src_x - x0;

            Color p00 = input.get_pixel(x0, y0);
            Color p10 = input.get_pixel(x1, y0);
            Color p01 = input.get_pixel(x0, y1);
            Color p11 = input.get_pixel(x1, y1);

            auto bilinear = [&](uint8_t c00, uint8_t c10, uint8_t c01, uint8_t c11) -> uint8_t {
                float v0 = c00 * (1 - fx) + c10 * fx;
                float v1 = c01 * (1 - fx) + c11 * fx;
                return static_cast<uint8_t>(std::clamp(std::round(v0 * (1 - fy) + v1 * fy), 0.0f, 255.0f));
            };

            output.set_pixel(x, y, Color(bilinear(p00.r, p10.r, p01.r, p11.r),
                                         bilinear(p00.g, p10.g, p01.g, p11.g),
                                         bilinear(p00.b, p10.b, p01.b, p11.b),
                                         bilinear(p00.a, p10.a, p01.a, p11.a)));
        }
    }
    return output;
#endif
}

Raster FramePrep::to_rgb(const FrameBuffer& input) {
    Raster out(input.width(), input.height(), 3);
    const uint8_t* src = input.data();
    uint8_t* dst = out.data();
    const size_t total = static_cast<size_t>(input.width()) * input.height();
    for (size_t i = 0; i < total; ++i) {
        dst[i * 3 + 0] = src[i * 4 + 0];
        dst[i * 3 + 1] = src[i * 4 + 1];
        dst[i * 3 + 2] = src[i * 4 + 2];
    }
    return out;
}

Raster FramePrep::to_luma(const FrameBuffer& input) {
    Raster out(input.width(), input.height(), 1);
    const uint8_t* src = input.data();
    uint8_t* dst = out.data();
    const int total = input.width() * input.height();

#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int i = 0; i < total; ++i) {
        const size_t idx = static_cast<size_t>(i) * 4;
        dst[i] = luma(src[idx], src[idx + 1], src[idx + 2]);
    }
    return out;
}

Raster FramePrep::process(const FrameBuffer& input) const {
    if (input.empty()) {
        return Raster();
    }
    FrameBuffer sized = resize(input, config_.target_width, config_.target_height);
    return config_.color ? to_rgb(sized) : to_luma(sized);
}

}
