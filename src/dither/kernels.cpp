#include "kernels.hpp"

#include <stdexcept>
#include <string>

namespace halftone {

namespace {

constexpr int kBayer2[2][2] = {
    {0, 2},
    {3, 1}
};

constexpr int kBayer4[4][4] = {
    { 0,  8,  2, 10},
    {12,  4, 14,  6},
    { 3, 11,  1,  9},
    {15,  7, 13,  5}
};

constexpr int kBayer8[8][8] = {
    { 0, 32,  8, 40,  2, 34, 10, 42},
    {48, 16, 56, 24, 50, 18, 58, 26},
    {12, 44,  4, 36, 14, 46,  6, 38},
    {60, 28, 52, 20, 62, 30, 54, 22},
    { 3, 35, 11, 43,  1, 33,  9, 41},
    {51, 19, 59, 27, 49, 17, 57, 25},
    {15, 47,  7, 39, 13, 45,  5, 37},
    {63, 31, 55, 23, 61, 29, 53, 21}
};

}  // namespace

float DiffusionKernel::total_weight() const {
    float sum = 0.0f;
    for (const auto& tap : taps) {
        sum += tap.weight;
    }
    return sum;
}

const DiffusionKernel& floyd_steinberg_kernel() {
    static const DiffusionKernel kKernel{
        "floyd_steinberg",
        {
            {0,  1, 7.0f / 16.0f},
            {1, -1, 3.0f / 16.0f},
            {1,  0, 5.0f / 16.0f},
            {1,  1, 1.0f / 16.0f},
        }
    };
    return kKernel;
}

const DiffusionKernel& atkinson_kernel() {
    static const DiffusionKernel kKernel{
        "atkinson",
        {
            {0,  1, 1.0f / 8.0f},
            {0,  2, 1.0f / 8.0f},
            {1, -1, 1.0f / 8.0f},
            {1,  0, 1.0f / 8.0f},
            {1,  1, 1.0f / 8.0f},
            {2,  0, 1.0f / 8.0f},
        }
    };
    return kKernel;
}

const DiffusionKernel& jarvis_judice_ninke_kernel() {
    static const DiffusionKernel kKernel{
        "jarvis_judice_ninke",
        {
            {0,  1, 7.0f / 48.0f},
            {0,  2, 5.0f / 48.0f},
            {1, -2, 3.0f / 48.0f},
            {1, -1, 5.0f / 48.0f},
            {1,  0, 7.0f / 48.0f},
            {1,  1, 5.0f / 48.0f},
            {1,  2, 3.0f / 48.0f},
            {2, -2, 1.0f / 48.0f},
            {2, -1, 3.0f / 48.0f},
            {2,  0, 5.0f / 48.0f},
            {2,  1, 3.0f / 48.0f},
            {2,  2, 1.0f / 48.0f},
        }
    };
    return kKernel;
}

ThresholdMatrix::ThresholdMatrix(int size) : size_(size) {
    if (!is_valid_size(size)) {
        throw std::invalid_argument("threshold matrix size must be 2, 4 or 8, got " + std::to_string(size));
    }

    const float scale = 1.0f / static_cast<float>(size * size);
    values_.resize(static_cast<size_t>(size) * size);
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            int rank = 0;
            if (size == 2) rank = kBayer2[y][x];
            else if (size == 4) rank = kBayer4[y][x];
            else rank = kBayer8[y][x];
            values_[static_cast<size_t>(y) * size + x] = static_cast<float>(rank) * scale;
        }
    }
}

}
