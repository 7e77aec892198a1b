#include "core/types.hpp"
#include "core/config.hpp"
#include "core/frame_source.hpp"
#include "core/frame_prep.hpp"
#include "dither/dispatcher.hpp"
#include "dither/random_threshold.hpp"
#include "render/frame_sink.hpp"
#include "cli/args.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <memory>

namespace {

void print_summary(const halftone::Config& config, const halftone::FrameSource& source) {
    const auto& d = config.dither;
    std::cout << "Input:      " << config.input.source;
    halftone::Size src = source.frame_size();
    if (src.area() > 0) {
        std::cout << " (" << src.width << "x" << src.height;
        if (source.fps() > 0.0) std::cout << " @ " << source.fps() << " fps";
        std::cout << ")";
    }
    std::cout << "\n";
    std::cout << "Output:     " << config.output.target << "\n";
    std::cout << "Method:     " << d.method;
    if (d.method == "ordered") {
        std::cout << " (matrix " << d.matrix_size << "x" << d.matrix_size << ")";
    } else if (d.method == "random") {
        std::cout << " (variance " << d.threshold_variance << ")";
    } else {
        std::cout << " (strength " << d.strength << ")";
    }
    std::cout << "\n";
    std::cout << "Dimensions: " << config.frame.width << "x" << config.frame.height << "\n";
    std::cout << "Max frames: " << config.frame.max_frames << "\n";
    std::cout << "Colour:     " << (d.color ? "palette " + halftone::format_palette(
                                       d.palette.empty() ? halftone::default_palette() : d.palette)
                                             : std::string("black and white")) << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    halftone::Args args = halftone::parse_args(argc, argv);

    if (args.show_help) {
        halftone::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        return 1;
    }

    halftone::Config config = halftone::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = halftone::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = halftone::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = halftone::Config::load_default()) {
            config = halftone::merge_config(config, *loaded_default);
        }
    }
    config = halftone::apply_cli_overrides(config, args);

    if (config.input.source.empty()) {
        std::cerr << "Error: No input specified\n";
        halftone::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    auto method = halftone::parse_method(config.dither.method);
    if (!method) {
        std::cerr << "Error: Unknown dithering method: " << config.dither.method << "\n";
        return 1;
    }
    const halftone::DitherParams params = config.dither_params();

    auto source = halftone::create_source(config.input.source);
    halftone::Result opened = source->open(config.input.source);
    if (opened.failure()) {
        std::cerr << "Error: Failed to open input: " << opened.message << "\n";
        return 1;
    }

    auto sink = halftone::create_sink(config.output.target);
    halftone::FrameSink::Config sink_cfg;
    sink_cfg.fps = config.frame.fps;
    sink_cfg.prefix = config.output.prefix;
    halftone::Result sink_opened = sink->open(config.output.target, sink_cfg);
    if (sink_opened.failure()) {
        std::cerr << "Error: Failed to open output: " << sink_opened.message << "\n";
        return 1;
    }

    if (!config.quiet) {
        print_summary(config, *source);
    }

    halftone::FramePrep::Config prep_cfg;
    prep_cfg.target_width = config.frame.width;
    prep_cfg.target_height = config.frame.height;
    prep_cfg.color = config.dither.color;
    halftone::FramePrep prep(prep_cfg);

    // One generator for the whole run so frames do not repeat the same noise.
    std::unique_ptr<halftone::RandomSource> random;
    if (*method == halftone::Method::Random) {
        random = halftone::make_random_source(params.seed);
    }

    long total = config.frame.max_frames;
    if (source->frame_count() > 0) {
        total = std::min<long>(total, source->frame_count());
    }

    auto start = std::chrono::steady_clock::now();
    halftone::FrameBuffer frame;
    halftone::Raster dithered;
    int processed = 0;
    int exit_code = 0;

    while (processed < config.frame.max_frames && source->read(frame)) {
        halftone::Raster working = prep.process(frame);
        if (working.empty()) {
            std::cerr << "Warning: Skipping empty frame " << processed << "\n";
            continue;
        }

        halftone::Result r = halftone::apply_dithering(working, *method, config.dither.color,
                                                       params, dithered, random.get());
        if (r.failure()) {
            std::cerr << "\nError: Dithering failed at frame " << processed << ": " << r.message << "\n";
            exit_code = 1;
            break;
        }

        r = sink->write(dithered);
        if (r.failure()) {
            std::cerr << "\nError: Failed to write frame " << processed << ": " << r.message << "\n";
            exit_code = 1;
            break;
        }
        ++processed;

        if (!config.quiet) {
            std::cerr << "\rProcessing frames: " << processed << "/" << total << std::flush;
        }
    }
    if (!config.quiet && processed > 0) {
        std::cerr << "\n";
    }

    halftone::Result closed = sink->close();
    if (closed.failure()) {
        std::cerr << "Error: Failed to finalize output: " << closed.message << "\n";
        exit_code = 1;
    }

    if (processed == 0 && exit_code == 0) {
        std::cerr << "Warning: No frames were read from " << config.input.source << "\n";
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cout << "Exported " << sink->frames_written() << " frames to " << sink->destination();
    if (!config.quiet) {
        std::cout << " in " << std::fixed << std::setprecision(1) << elapsed << "s";
    }
    std::cout << "\n";

    if (!halftone::is_video_path(config.output.target) && sink->frames_written() > 0) {
        std::cout << "\nTo create a video from the frames, run:\n"
                  << "ffmpeg -r " << config.frame.fps << " -i " << config.output.target << "/"
                  << config.output.prefix << "%04d.png -c:v libx264 -pix_fmt yuv420p output_dithered_"
                  << config.dither.method << "_" << (config.dither.color ? "color" : "bw") << ".mp4\n";
    }

    return exit_code;
}
