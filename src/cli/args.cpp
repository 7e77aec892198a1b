#include "args.hpp"
#include "dither/dispatcher.hpp"
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <string>

namespace halftone {

static bool parse_int(const char* text, long min_val, long max_val, long& out) {
    if (!text || *text == '\0') return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (v < min_val || v > max_val) return false;
    out = v;
    return true;
}

static bool parse_float(const char* text, float& out) {
    if (!text || *text == '\0') return false;
    errno = 0;
    char* end = nullptr;
    float v = std::strtof(text, &end);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto fail = [&args](const std::string& msg) {
        if (args.error.empty()) args.error = msg;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        auto next = [&]() -> const char* {
            if (i + 1 < argc) return argv[++i];
            fail(std::string("missing value for ") + arg);
            return nullptr;
        };

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (const char* v = next()) {
                if (validate_path(v)) args.output = v;
                else fail("invalid output path");
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (const char* v = next()) {
                if (validate_path(v)) args.config_path = v;
                else fail("invalid config path");
            }
        }
        else if (strcmp(arg, "-m") == 0 || strcmp(arg, "--method") == 0) {
            if (const char* v = next()) {
                if (parse_method(v)) args.method = v;
                else fail(std::string("Unknown dithering method: ") + v);
            }
        }
        else if (strcmp(arg, "-w") == 0 || strcmp(arg, "--width") == 0) {
            if (const char* v = next()) {
                long n = 0;
                if (parse_int(v, 1, 16384, n)) args.width = static_cast<int>(n);
                else fail("width must be an integer between 1 and 16384");
            }
        }
        else if (strcmp(arg, "--height") == 0) {
            if (const char* v = next()) {
                long n = 0;
                if (parse_int(v, 1, 16384, n)) args.height = static_cast<int>(n);
                else fail("height must be an integer between 1 and 16384");
            }
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--frames") == 0) {
            if (const char* v = next()) {
                long n = 0;
                if (parse_int(v, 1, 100000000, n)) args.max_frames = static_cast<int>(n);
                else fail("frames must be a positive integer");
            }
        }
        else if (strcmp(arg, "--fps") == 0) {
            if (const char* v = next()) {
                long n = 0;
                if (parse_int(v, 1, 240, n)) args.fps = static_cast<int>(n);
                else fail("fps must be an integer between 1 and 240");
            }
        }
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--color") == 0) {
            args.color = true;
        }
        else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--dither-strength") == 0) {
            if (const char* v = next()) {
                float f = 0.0f;
                if (parse_float(v, f) && f >= 0.0f && f <= 1.0f) args.dither_strength = f;
                else fail("Dither strength must be between 0.0 and 1.0");
            }
        }
        else if (strcmp(arg, "--matrix-size") == 0) {
            if (const char* v = next()) {
                long n = 0;
                if (parse_int(v, 2, 8, n) && (n == 2 || n == 4 || n == 8)) args.matrix_size = static_cast<int>(n);
                else fail("matrix size must be 2, 4 or 8");
            }
        }
        else if (strcmp(arg, "--threshold-variance") == 0) {
            if (const char* v = next()) {
                float f = 0.0f;
                if (parse_float(v, f) && f >= 0.0f) args.threshold_variance = f;
                else fail("threshold variance must be a non-negative number");
            }
        }
        else if (strcmp(arg, "--palette") == 0) {
            if (const char* v = next()) {
                if (auto p = parse_palette(v)) args.palette = *p;
                else fail("palette must look like r,g,b;r,g,b with components 0-255");
            }
        }
        else if (strcmp(arg, "--seed") == 0) {
            if (const char* v = next()) {
                long long n = 0;
                char* end = nullptr;
                errno = 0;
                n = std::strtoll(v, &end, 10);
                if (*v != '\0' && errno == 0 && *end == '\0' && n >= 0 && n <= 4294967295LL) {
                    args.seed = static_cast<uint32_t>(n);
                } else {
                    fail("seed must be an integer between 0 and 4294967295");
                }
            }
        }
        else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            fail(std::string("unknown option ") + arg);
        }
        else {
            if (!args.input.empty()) {
                fail("more than one input given");
            } else if (validate_path(arg)) {
                args.input = arg;
            }
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT>\n\n", prog);
    printf("INPUT:\n");
    printf("  Video file, image, image pattern (\"shots/img_*.png\"),\n");
    printf("  or \"pipe:WxH[:rgb|rgba[:FPS]]\" for raw frames on stdin\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --output <PATH>          PNG directory or video file (default: frames)\n");
    printf("  -m, --method <NAME>          floyd_steinberg, atkinson, jarvis_judice_ninke,\n");
    printf("                               ordered, random (default: floyd_steinberg)\n");
    printf("  -w, --width <N>              Output width (default: 540)\n");
    printf("      --height <N>             Output height (default: 960)\n");
    printf("  -f, --frames <N>             Maximum frames to process (default: 720)\n");
    printf("  -c, --color                  Dither against a colour palette\n");
    printf("  -d, --dither-strength <N>    Error diffusion strength (0.0-1.0, default: 1.0)\n");
    printf("      --matrix-size <N>        Bayer matrix size for ordered: 2, 4, 8 (default: 4)\n");
    printf("      --threshold-variance <N> Noise amplitude for random (default: 50)\n");
    printf("      --palette <LIST>         Colour palette as r,g,b;r,g,b;...\n");
    printf("      --seed <N>               Seed for the random method\n");
    printf("      --fps <N>                Frame rate for video output (default: 30)\n");
    printf("      --config <FILE>          Config file path (default: platform-specific)\n");
    printf("  -q, --quiet                  No progress output\n");
    printf("  -h, --help                   Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/halftone/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/halftone/config.toml\n");
    printf("    Windows: %%APPDATA%%\\halftone\\config.toml\n");
}

}
