#include <iostream>
#include <cassert>
#include <filesystem>
#include <string>

#include "../src/core/types.hpp"
#include "../src/core/frame_prep.hpp"
#include "../src/core/frame_source.hpp"
#include "../src/dither/dispatcher.hpp"
#include "../src/dither/random_threshold.hpp"
#include "../src/render/frame_sink.hpp"

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

static std::filesystem::path fresh_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("halftone_it_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

static FrameBuffer test_frame(int w, int h, int phase) {
    FrameBuffer frame(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            uint8_t r = static_cast<uint8_t>((x * 255) / (w - 1));
            uint8_t g = static_cast<uint8_t>((y * 255) / (h - 1));
            uint8_t b = static_cast<uint8_t>((x + y + phase * 16) % 256);
            frame.set_pixel(x, y, Color(r, g, b, 255));
        }
    }
    return frame;
}

TEST(frame_filename_padding) {
    assert(frame_filename("frame_", 0) == "frame_0000.png");
    assert(frame_filename("frame_", 42) == "frame_0042.png");
    assert(frame_filename("f", 12345) == "f12345.png");
}

TEST(sink_and_source_selection) {
    assert(is_video_path("out.mp4"));
    assert(is_video_path("OUT.GIF"));
    assert(!is_video_path("frames"));
    assert(dynamic_cast<VideoFileSink*>(create_sink("clip.mkv").get()) != nullptr);
    assert(dynamic_cast<PngSequenceSink*>(create_sink("out_dir").get()) != nullptr);

    assert(is_image_path("a.PNG"));
    assert(!is_image_path("a.mp4"));
    assert(dynamic_cast<PipeSource*>(create_source("pipe:4x4").get()) != nullptr);
    assert(dynamic_cast<ImageSequenceSource*>(create_source("dir/img_*.png").get()) != nullptr);
    assert(dynamic_cast<ImageSource*>(create_source("still.jpg").get()) != nullptr);
    assert(dynamic_cast<VideoFileSource*>(create_source("clip.mp4").get()) != nullptr);
}

TEST(pipe_spec_parsing) {
    PipeSource pipe;
    assert(pipe.open("pipe:64x32:rgba:12").success());
    assert(pipe.frame_size() == (Size{64, 32}));
    assert(pipe.fps() == 12.0);

    PipeSource bad;
    assert(bad.open("pipe:64").failure());
    assert(bad.open("pipe:64x32:yuv").failure());
    assert(bad.open("pipe:0x32").failure());
    assert(!bad.is_open());
}

TEST(grayscale_pipeline_to_png_sequence) {
    auto dir = fresh_dir("gray");

    FramePrep::Config prep_cfg;
    prep_cfg.target_width = 48;
    prep_cfg.target_height = 64;
    FramePrep prep(prep_cfg);

    auto sink = create_sink(dir.string());
    FrameSink::Config sink_cfg;
    assert(sink->open(dir.string(), sink_cfg).success());

    for (int i = 0; i < 3; ++i) {
        Raster working = prep.process(test_frame(96, 80, i));
        assert(working.width() == 48 && working.height() == 64 && working.channels() == 1);

        Raster out;
        Result r = apply_dithering(working, Method::FloydSteinberg, false, DitherParams{}, out);
        assert(r.success());
        assert(sink->write(out).success());
    }
    assert(sink->close().success());
    assert(sink->frames_written() == 3);

    for (int i = 0; i < 3; ++i) {
        assert(std::filesystem::exists(dir / frame_filename("frame_", i)));
    }
    assert(!std::filesystem::exists(dir / frame_filename("frame_", 3)));

    // Read the frames back and check they are still black and white.
    ImageSequenceSource source;
    assert(source.open((dir / "frame_*.png").string()).success());
    assert(source.frame_count() == 3);
    FrameBuffer decoded;
    int read = 0;
    while (source.read(decoded)) {
        assert(decoded.width() == 48 && decoded.height() == 64);
        for (int y = 0; y < decoded.height(); ++y) {
            for (int x = 0; x < decoded.width(); ++x) {
                Color c = decoded.get_pixel(x, y);
                assert(c.r == 0 || c.r == 255);
                assert(c.r == c.g && c.g == c.b);
            }
        }
        ++read;
    }
    assert(read == 3);

    std::filesystem::remove_all(dir);
}

TEST(colour_pipeline_custom_prefix) {
    auto dir = fresh_dir("colour");

    FramePrep::Config prep_cfg;
    prep_cfg.target_width = 30;
    prep_cfg.target_height = 20;
    prep_cfg.color = true;
    FramePrep prep(prep_cfg);

    PngSequenceSink sink;
    FrameSink::Config sink_cfg;
    sink_cfg.prefix = "shot_";
    assert(sink.open(dir.string(), sink_cfg).success());

    MersenneRandomSource random(11);
    for (int i = 0; i < 2; ++i) {
        Raster working = prep.process(test_frame(60, 40, i));
        Raster out;
        assert(apply_dithering(working, Method::Random, true, DitherParams{}, out, &random).success());
        assert(sink.write(out).success());
    }
    assert(sink.close().success());
    assert(sink.destination() == dir.string());
    assert(std::filesystem::exists(dir / "shot_0000.png"));
    assert(std::filesystem::exists(dir / "shot_0001.png"));

    ImageSource still;
    assert(still.open((dir / "shot_0001.png").string()).success());
    FrameBuffer decoded;
    assert(still.read(decoded));
    assert(!still.read(decoded));
    for (int y = 0; y < decoded.height(); ++y) {
        for (int x = 0; x < decoded.width(); ++x) {
            Color c = decoded.get_pixel(x, y);
            assert(palette_contains(default_palette(), c.r, c.g, c.b));
        }
    }

    std::filesystem::remove_all(dir);
}

TEST(sink_rejects_write_before_open) {
    PngSequenceSink sink;
    Raster frame(4, 4, 1);
    assert(sink.write(frame).failure());
    assert(sink.frames_written() == 0);
}

TEST(missing_inputs_fail_to_open) {
    ImageSource image;
    assert(image.open("/nonexistent/halftone.png").failure());
    ImageSequenceSource seq;
    assert(seq.open("/nonexistent/dir/frame_*.png").failure());
    auto dir = fresh_dir("empty_seq");
    std::filesystem::create_directories(dir);
    assert(seq.open((dir / "frame_*.png").string()).failure());
    std::filesystem::remove_all(dir);
}

int main() {
    std::cout << "=== Integration Tests ===\n\n";

    RUN_TEST(frame_filename_padding);
    RUN_TEST(sink_and_source_selection);
    RUN_TEST(pipe_spec_parsing);
    RUN_TEST(grayscale_pipeline_to_png_sequence);
    RUN_TEST(colour_pipeline_custom_prefix);
    RUN_TEST(sink_rejects_write_before_open);
    RUN_TEST(missing_inputs_fail_to_open);

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
