#pragma once

#include "core/types.hpp"
#include "dither/palette.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace halftone {

class RandomSource;

enum class Method {
    FloydSteinberg,
    Atkinson,
    JarvisJudiceNinke,
    Ordered,
    Random
};

std::optional<Method> parse_method(const std::string& name);
const char* method_name(Method method);
const std::vector<std::string>& method_names();
bool is_error_diffusion(Method method);

struct DiffusionKernel;

/// Kernel table of an error-diffusion method, nullptr for ordered and random.
const DiffusionKernel* diffusion_kernel(Method method);

struct DitherParams {
    float dither_strength = 1.0f;      // error-diffusion methods
    int matrix_size = 4;               // ordered
    float threshold_variance = 50.0f;  // random
    std::optional<Palette> palette;    // colour mode; default_palette() when unset
    std::optional<uint32_t> seed;      // random; nondeterministic when unset
};

/// Checks the parameters the chosen method consumes, plus the raster shape
/// against the mode (1 channel for grayscale, 3 for colour). A colour-mode
/// palette must be non-empty with every component in 0..255.
Result validate_params(const Raster& input, Method method, bool is_color, const DitherParams& params);

/// Quantizes `input` with the named method. On success `out` holds a raster
/// of the same shape whose pixels are all palette members ({0,255} in
/// grayscale). On failure `out` is left untouched.
///
/// `random` overrides the source built from params.seed for the random method.
Result apply_dithering(const Raster& input, Method method, bool is_color,
                       const DitherParams& params, Raster& out,
                       RandomSource* random = nullptr);

/// Fails with INVALID_ARGUMENT for unrecognized method names.
Result apply_dithering(const Raster& input, const std::string& method, bool is_color,
                       const DitherParams& params, Raster& out,
                       RandomSource* random = nullptr);

}
