#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/frame_prep.hpp"
#include "../src/cli/args.hpp"

using namespace halftone;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static std::string write_temp_config(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / ("halftone_test_" + name + ".toml");
    std::ofstream out(path);
    out << contents;
    return path.string();
}

static Args parse(std::vector<std::string> words) {
    words.insert(words.begin(), "halftone");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

// --- Config ---

TEST(config_defaults_are_valid) {
    Config cfg = Config::defaults();
    std::string error;
    assert(cfg.validate(error));
    assert(cfg.frame.width == 540);
    assert(cfg.frame.height == 960);
    assert(cfg.frame.max_frames == 720);
    assert(cfg.dither.method == "floyd_steinberg");
    assert(cfg.dither.strength == 1.0f);
    assert(cfg.dither.matrix_size == 4);
    assert(cfg.dither.threshold_variance == 50.0f);
    assert(!cfg.dither.color);
    assert(cfg.output.target == "frames");
}

TEST(config_default_path) {
    std::string path = Config::default_config_path();
    assert(path.size() > std::string("halftone/config.toml").size());
    assert(path.ends_with("halftone/config.toml") || path.ends_with("halftone\\config.toml"));
}

TEST(config_load_full_file) {
    std::string path = write_temp_config("full",
        "version = 1\n"
        "[input]\n"
        "source = \"clip.mp4\"\n"
        "[output]\n"
        "target = \"out_frames\"\n"
        "prefix = \"f_\"\n"
        "[frame]\n"
        "width = 320\n"
        "height = 240\n"
        "max_frames = 10\n"
        "fps = 24\n"
        "[dither]\n"
        "method = \"ordered\"\n"
        "color = true\n"
        "strength = 0.5\n"
        "matrix_size = 8\n"
        "threshold_variance = 12.5\n"
        "seed = 1234\n"
        "palette = [[0, 0, 0], [255, 255, 255], [255, 0, 0]]\n");

    std::string error;
    auto cfg = Config::load(path, &error);
    assert(cfg.has_value());
    assert(cfg->input.source == "clip.mp4");
    assert(cfg->output.target == "out_frames");
    assert(cfg->output.prefix == "f_");
    assert(cfg->frame.width == 320);
    assert(cfg->frame.height == 240);
    assert(cfg->frame.max_frames == 10);
    assert(cfg->frame.fps == 24);
    assert(cfg->dither.method == "ordered");
    assert(cfg->dither.color);
    assert(cfg->dither.strength == 0.5f);
    assert(cfg->dither.matrix_size == 8);
    assert(cfg->dither.threshold_variance == 12.5f);
    assert(cfg->dither.seed.has_value() && *cfg->dither.seed == 1234u);
    assert(cfg->dither.palette.size() == 3);
    assert(cfg->dither.palette[2] == (PaletteColor{255, 0, 0}));

    DitherParams params = cfg->dither_params();
    assert(params.palette.has_value() && params.palette->size() == 3);
    assert(params.matrix_size == 8);
    assert(params.seed == cfg->dither.seed);

    std::filesystem::remove(path);
}

TEST(config_load_partial_keeps_defaults) {
    std::string path = write_temp_config("partial", "[dither]\nmethod = \"atkinson\"\n");
    auto cfg = Config::load(path);
    assert(cfg.has_value());
    assert(cfg->dither.method == "atkinson");
    assert(cfg->frame.width == 540);
    assert(cfg->dither.palette.empty());
    assert(!cfg->dither_params().palette.has_value());
    std::filesystem::remove(path);
}

TEST(config_load_rejects_bad_values) {
    struct Case { const char* name; const char* body; };
    const Case cases[] = {
        {"bad_strength", "[dither]\nstrength = 1.5\n"},
        {"bad_matrix", "[dither]\nmatrix_size = 3\n"},
        {"bad_method", "[dither]\nmethod = \"sierra\"\n"},
        {"bad_variance", "[dither]\nthreshold_variance = -4.0\n"},
        {"bad_palette", "[dither]\npalette = [[0, 0]]\n"},
        {"bad_component", "[dither]\npalette = [[0, 0, 300]]\n"},
        {"dup_palette", "[dither]\npalette = [[1, 2, 3], [1, 2, 3]]\n"},
        {"bad_seed", "[dither]\nseed = -1\n"},
        {"bad_width", "[frame]\nwidth = 0\n"},
        {"bad_version", "version = 99\n"},
        {"syntax", "[dither\nmethod = \n"},
    };
    for (const Case& c : cases) {
        std::string path = write_temp_config(c.name, c.body);
        std::string error;
        auto cfg = Config::load(path, &error);
        assert(!cfg.has_value());
        assert(!error.empty());
        std::filesystem::remove(path);
    }
}

TEST(config_load_missing_file) {
    std::string error;
    auto cfg = Config::load("/nonexistent/halftone/config.toml", &error);
    assert(!cfg.has_value());
    assert(error.find("not found") != std::string::npos);
}

TEST(config_merge_and_cli_overrides) {
    Config base = Config::defaults();
    Config file = Config::defaults();
    file.dither.method = "random";
    file.frame.width = 100;
    Config merged = merge_config(base, file);
    assert(merged.dither.method == "random");
    assert(merged.frame.width == 100);
    assert(merged.frame.height == 960);

    Args args = parse({"-m", "ordered", "--height", "50", "in.mp4"});
    assert(args.error.empty());
    Config final_cfg = apply_cli_overrides(merged, args);
    assert(final_cfg.dither.method == "ordered");
    assert(final_cfg.frame.width == 100);
    assert(final_cfg.frame.height == 50);
    assert(final_cfg.input.source == "in.mp4");
}

// --- CLI ---

TEST(args_full_command_line) {
    Args args = parse({"clip.mp4", "-o", "out", "-m", "jarvis_judice_ninke", "-w", "200",
                       "--height", "100", "-f", "12", "-c", "-d", "0.25", "--matrix-size", "8",
                       "--threshold-variance", "30", "--palette", "0,0,0;255,255,255",
                       "--seed", "99", "--fps", "25", "-q"});
    assert(args.error.empty());
    assert(!args.show_help);
    assert(args.input == "clip.mp4");
    assert(args.output && *args.output == "out");
    assert(args.method && *args.method == "jarvis_judice_ninke");
    assert(args.width && *args.width == 200);
    assert(args.height && *args.height == 100);
    assert(args.max_frames && *args.max_frames == 12);
    assert(args.color);
    assert(args.dither_strength && *args.dither_strength == 0.25f);
    assert(args.matrix_size && *args.matrix_size == 8);
    assert(args.threshold_variance && *args.threshold_variance == 30.0f);
    assert(args.palette && args.palette->size() == 2);
    assert(args.seed && *args.seed == 99u);
    assert(args.fps && *args.fps == 25);
    assert(args.quiet);
}

TEST(args_unset_options_stay_empty) {
    Args args = parse({"clip.mp4"});
    assert(args.error.empty());
    assert(!args.output && !args.method && !args.width && !args.dither_strength && !args.seed);
    assert(!args.color && !args.quiet);
}

TEST(args_rejections) {
    assert(!parse({"in.mp4", "-d", "1.5"}).error.empty());
    assert(!parse({"in.mp4", "-d", "-0.5"}).error.empty());
    assert(!parse({"in.mp4", "-d", "abc"}).error.empty());
    assert(!parse({"in.mp4", "-m", "sierra"}).error.empty());
    assert(!parse({"in.mp4", "--matrix-size", "3"}).error.empty());
    assert(!parse({"in.mp4", "-w", "0"}).error.empty());
    assert(!parse({"in.mp4", "--palette", "1,2"}).error.empty());
    assert(!parse({"in.mp4", "--seed", "-3"}).error.empty());
    assert(!parse({"in.mp4", "--bogus"}).error.empty());
    assert(!parse({"in.mp4", "-o"}).error.empty());
    assert(!parse({"a.mp4", "b.mp4"}).error.empty());
}

TEST(args_help) {
    Args args = parse({"--help", "--bogus"});
    assert(args.show_help);
}

// --- Frame prep ---

TEST(frame_prep_luma) {
    assert(FramePrep::luma(0, 0, 0) == 0);
    assert(FramePrep::luma(255, 255, 255) == 255);
    assert(FramePrep::luma(255, 0, 0) == 76);
    assert(FramePrep::luma(0, 255, 0) == 150);
    assert(FramePrep::luma(0, 0, 255) == 29);
}

TEST(frame_prep_output_shape) {
    FrameBuffer frame(64, 48, Color(10, 200, 30, 255));

    FramePrep::Config cfg;
    cfg.target_width = 20;
    cfg.target_height = 30;
    cfg.color = false;
    FramePrep gray(cfg);
    Raster g = gray.process(frame);
    assert(g.width() == 20 && g.height() == 30 && g.channels() == 1);
    assert(g.at(7, 7) == FramePrep::luma(10, 200, 30));

    cfg.color = true;
    FramePrep colour(cfg);
    Raster c = colour.process(frame);
    assert(c.width() == 20 && c.height() == 30 && c.channels() == 3);
    assert(c.at(3, 4, 0) == 10 && c.at(3, 4, 1) == 200 && c.at(3, 4, 2) == 30);

    assert(gray.process(FrameBuffer()).empty());
}

TEST(frame_prep_bilinear_upscale) {
    FrameBuffer frame(2, 1);
    frame.set_pixel(0, 0, Color(0, 0, 0, 255));
    frame.set_pixel(1, 0, Color(255, 255, 255, 255));

    FrameBuffer wide = FramePrep::resize(frame, 4, 1);
    assert(wide.width() == 4 && wide.height() == 1);
    assert(wide.get_pixel(0, 0).r == 0);
    assert(wide.get_pixel(1, 0).r == 64);
    assert(wide.get_pixel(2, 0).r == 191);
    assert(wide.get_pixel(3, 0).r == 255);
}

int main() {
    std::cout << "=== Config / CLI / Frame Prep Tests ===\n\n";

    std::cout << "--- Config Tests ---\n";
    RUN_TEST(config_defaults_are_valid);
    RUN_TEST(config_default_path);
    RUN_TEST(config_load_full_file);
    RUN_TEST(config_load_partial_keeps_defaults);
    RUN_TEST(config_load_rejects_bad_values);
    RUN_TEST(config_load_missing_file);
    RUN_TEST(config_merge_and_cli_overrides);

    std::cout << "\n--- CLI Tests ---\n";
    RUN_TEST(args_full_command_line);
    RUN_TEST(args_unset_options_stay_empty);
    RUN_TEST(args_rejections);
    RUN_TEST(args_help);

    std::cout << "\n--- Frame Prep Tests ---\n";
    RUN_TEST(frame_prep_luma);
    RUN_TEST(frame_prep_output_shape);
    RUN_TEST(frame_prep_bilinear_upscale);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } else {
        std::cout << "\n✗ Some tests failed!\n";
        return 1;
    }
}
