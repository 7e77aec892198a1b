#pragma once

#include "dither/palette.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace halftone {

// Command-line values. Options left unset do not override the config file.
struct Args {
    std::string input;
    std::string config_path;

    std::optional<std::string> output;
    std::optional<std::string> method;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> max_frames;
    std::optional<int> fps;
    std::optional<float> dither_strength;
    std::optional<int> matrix_size;
    std::optional<float> threshold_variance;
    std::optional<uint32_t> seed;
    std::optional<Palette> palette;
    bool color = false;
    bool quiet = false;

    bool show_help = false;
    // First parse problem; non-empty means the command line was rejected.
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
