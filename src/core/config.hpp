#pragma once

#include "core/types.hpp"
#include "dither/dispatcher.hpp"
#include "dither/palette.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace halftone {

struct Args;

constexpr int CONFIG_VERSION = 1;

struct ConfigInput {
    std::string source;
};

struct ConfigOutput {
    std::string target = "frames";
    std::string prefix = "frame_";
};

struct ConfigFrame {
    int width = 540;
    int height = 960;
    int max_frames = 720;
    int fps = 30;
};

struct ConfigDither {
    std::string method = "floyd_steinberg";
    bool color = false;
    float strength = 1.0f;
    int matrix_size = 4;
    float threshold_variance = 50.0f;
    std::optional<uint32_t> seed;
    // Empty means the built-in 8-colour palette.
    Palette palette;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigInput input;
    ConfigOutput output;
    ConfigFrame frame;
    ConfigDither dither;
    bool quiet = false;

    std::string config_path;

    bool validate(std::string& error) const;
    DitherParams dither_params() const;

    static Config defaults();
    /// Missing keys keep their defaults. Returns std::nullopt on a parse
    /// error, a version mismatch or a value that fails validate().
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const Args& args);

}
