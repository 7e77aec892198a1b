#include "dispatcher.hpp"
#include "dither/error_diffusion.hpp"
#include "dither/kernels.hpp"
#include "dither/ordered.hpp"
#include "dither/quantizer.hpp"
#include "dither/random_threshold.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

namespace halftone {

namespace {

Raster run(const Raster& input, Method method, bool is_color,
           const DitherParams& params, const Palette& palette, RandomSource* random) {
    switch (method) {
        case Method::FloydSteinberg:
        case Method::Atkinson:
        case Method::JarvisJudiceNinke: {
            ErrorDiffuser::Config cfg;
            cfg.strength = params.dither_strength;
            const DiffusionKernel* kernel = diffusion_kernel(method);
            if (!kernel) {
                throw std::invalid_argument(std::string("no diffusion kernel for ") + method_name(method));
            }
            ErrorDiffuser diffuser(*kernel, cfg);
            if (is_color) {
                return diffuser.process(input, PaletteQuantizer(palette));
            }
            return diffuser.process(input, ThresholdQuantizer());
        }
        case Method::Ordered: {
            OrderedDitherer::Config cfg;
            cfg.matrix_size = params.matrix_size;
            OrderedDitherer ordered(cfg);
            return is_color ? ordered.process_color(input, palette) : ordered.process_gray(input);
        }
        case Method::Random: {
            std::unique_ptr<RandomSource> owned;
            if (!random) {
                owned = make_random_source(params.seed);
                random = owned.get();
            }
            RandomDitherer::Config cfg;
            cfg.threshold_variance = params.threshold_variance;
            RandomDitherer ditherer(*random, cfg);
            return is_color ? ditherer.process_color(input, palette) : ditherer.process_gray(input);
        }
    }
    throw std::invalid_argument("unhandled dither method");
}

}  // namespace

std::optional<Method> parse_method(const std::string& name) {
    if (name == "floyd_steinberg") return Method::FloydSteinberg;
    if (name == "atkinson") return Method::Atkinson;
    if (name == "jarvis_judice_ninke") return Method::JarvisJudiceNinke;
    if (name == "ordered") return Method::Ordered;
    if (name == "random") return Method::Random;
    return std::nullopt;
}

const char* method_name(Method method) {
    switch (method) {
        case Method::FloydSteinberg: return "floyd_steinberg";
        case Method::Atkinson: return "atkinson";
        case Method::JarvisJudiceNinke: return "jarvis_judice_ninke";
        case Method::Ordered: return "ordered";
        case Method::Random: return "random";
    }
    return "unknown";
}

const std::vector<std::string>& method_names() {
    static const std::vector<std::string> kNames = {
        "floyd_steinberg", "atkinson", "jarvis_judice_ninke", "ordered", "random"
    };
    return kNames;
}

bool is_error_diffusion(Method method) {
    return method == Method::FloydSteinberg ||
           method == Method::Atkinson ||
           method == Method::JarvisJudiceNinke;
}

const DiffusionKernel* diffusion_kernel(Method method) {
    switch (method) {
        case Method::FloydSteinberg: return &floyd_steinberg_kernel();
        case Method::Atkinson: return &atkinson_kernel();
        case Method::JarvisJudiceNinke: return &jarvis_judice_ninke_kernel();
        case Method::Ordered:
        case Method::Random:
            return nullptr;
    }
    return nullptr;
}

Result validate_params(const Raster& input, Method method, bool is_color, const DitherParams& params) {
    if (input.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "input raster is empty");
    }
    const int expected_channels = is_color ? 3 : 1;
    if (input.channels() != expected_channels) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            std::string(is_color ? "colour" : "grayscale") + " mode requires a " +
                            std::to_string(expected_channels) + "-channel raster, got " +
                            std::to_string(input.channels()));
    }
    if (is_color && params.palette) {
        if (params.palette->empty()) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT, "palette must not be empty");
        }
        for (const auto& c : *params.palette) {
            if (c.r < 0 || c.r > 255 || c.g < 0 || c.g > 255 || c.b < 0 || c.b > 255) {
                return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                    "palette colour " + std::to_string(c.r) + "," + std::to_string(c.g) + "," +
                                    std::to_string(c.b) + " is outside 0..255");
            }
        }
    }

    switch (method) {
        case Method::FloydSteinberg:
        case Method::Atkinson:
        case Method::JarvisJudiceNinke:
            if (!(params.dither_strength >= 0.0f && params.dither_strength <= 1.0f)) {
                return Result::fail(ErrorCode::INVALID_ARGUMENT, "dither_strength must be between 0.0 and 1.0");
            }
            break;
        case Method::Ordered:
            if (!ThresholdMatrix::is_valid_size(params.matrix_size)) {
                return Result::fail(ErrorCode::INVALID_ARGUMENT, "matrix_size must be 2, 4 or 8");
            }
            break;
        case Method::Random:
            if (!(params.threshold_variance >= 0.0f) || std::isinf(params.threshold_variance)) {
                return Result::fail(ErrorCode::INVALID_ARGUMENT, "threshold_variance must be a finite non-negative number");
            }
            break;
    }
    return Result::ok();
}

Result apply_dithering(const Raster& input, Method method, bool is_color,
                       const DitherParams& params, Raster& out, RandomSource* random) {
    Result check = validate_params(input, method, is_color, params);
    if (check.failure()) {
        return check;
    }

    const Palette& palette = params.palette ? *params.palette : default_palette();
    try {
        out = run(input, method, is_color, params, palette, random);
    } catch (const std::invalid_argument& e) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, e.what());
    }
    return Result::ok();
}

Result apply_dithering(const Raster& input, const std::string& method, bool is_color,
                       const DitherParams& params, Raster& out, RandomSource* random) {
    auto parsed = parse_method(method);
    if (!parsed) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Unknown dithering method: " + method);
    }
    return apply_dithering(input, *parsed, is_color, params, out, random);
}

}
