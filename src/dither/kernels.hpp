#pragma once

#include <cstddef>
#include <vector>

namespace halftone {

struct KernelTap {
    int dy;
    int dx;
    float weight;
};

// Error-diffusion weight table. Offsets are relative to the pixel being
// quantized; +dy is the row below. Taps are only ever forward in scan order.
struct DiffusionKernel {
    const char* name;
    std::vector<KernelTap> taps;

    float total_weight() const;
};

const DiffusionKernel& floyd_steinberg_kernel();

/// Six taps of 1/8. The remaining 2/8 of the error is discarded.
const DiffusionKernel& atkinson_kernel();

const DiffusionKernel& jarvis_judice_ninke_kernel();

// Bayer threshold matrix normalized to [0,1).
class ThresholdMatrix {
public:
    /// Throws std::invalid_argument unless size is 2, 4 or 8.
    explicit ThresholdMatrix(int size);

    int size() const { return size_; }

    float at(int x, int y) const {
        return values_[static_cast<size_t>(y % size_) * size_ + (x % size_)];
    }

    static bool is_valid_size(int size) {
        return size == 2 || size == 4 || size == 8;
    }

private:
    int size_;
    std::vector<float> values_;
};

}
