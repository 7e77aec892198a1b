#include "core/config.hpp"
#include "cli/args.hpp"
#include "dither/kernels.hpp"
#include <toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace halftone {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

bool parse_palette_array(const toml::array& arr, Palette& out, std::string& error) {
    Palette palette;
    for (const auto& node : arr) {
        const toml::array* rgb = node.as_array();
        if (!rgb || rgb->size() != 3) {
            error = "dither.palette entries must be [r, g, b] arrays";
            return false;
        }
        int c[3];
        for (size_t i = 0; i < 3; ++i) {
            auto v = (*rgb)[i].value<int>();
            if (!v || *v < 0 || *v > 255) {
                error = "dither.palette components must be integers between 0 and 255";
                return false;
            }
            c[i] = *v;
        }
        palette.push_back({c[0], c[1], c[2]});
    }
    out = std::move(palette);
    return true;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/halftone";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (frame.width < 1 || frame.width > 16384) {
        error = "frame.width must be between 1 and 16384";
        return false;
    }
    if (frame.height < 1 || frame.height > 16384) {
        error = "frame.height must be between 1 and 16384";
        return false;
    }
    if (frame.max_frames < 1) {
        error = "frame.max_frames must be at least 1";
        return false;
    }
    if (frame.fps < 1 || frame.fps > 240) {
        error = "frame.fps must be between 1 and 240";
        return false;
    }
    if (!parse_method(dither.method)) {
        error = "dither.method must be one of floyd_steinberg, atkinson, jarvis_judice_ninke, ordered, random";
        return false;
    }
    if (!(dither.strength >= 0.0f && dither.strength <= 1.0f)) {
        error = "dither.strength must be between 0.0 and 1.0";
        return false;
    }
    if (!ThresholdMatrix::is_valid_size(dither.matrix_size)) {
        error = "dither.matrix_size must be 2, 4 or 8";
        return false;
    }
    if (!(dither.threshold_variance >= 0.0f) || std::isinf(dither.threshold_variance)) {
        error = "dither.threshold_variance must be a non-negative number";
        return false;
    }
    for (size_t i = 0; i < dither.palette.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (dither.palette[i] == dither.palette[j]) {
                error = "dither.palette must not contain duplicate colours";
                return false;
            }
        }
    }
    if (output.target.empty()) {
        error = "output.target must not be empty";
        return false;
    }
    return true;
}

DitherParams Config::dither_params() const {
    DitherParams params;
    params.dither_strength = dither.strength;
    params.matrix_size = dither.matrix_size;
    params.threshold_variance = dither.threshold_variance;
    params.seed = dither.seed;
    if (!dither.palette.empty()) {
        params.palette = dither.palette;
    }
    return params;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    auto fail = [error](const std::string& msg) -> std::optional<Config> {
        if (error) *error = msg;
        return std::nullopt;
    };

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return fail("config file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                return fail("unsupported config version " + std::to_string(*v));
            }
        }

        if (auto input = tbl["input"]) {
            if (auto v = input["source"].value<std::string>()) cfg.input.source = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["target"].value<std::string>()) cfg.output.target = *v;
            if (auto v = output["prefix"].value<std::string>()) cfg.output.prefix = *v;
        }

        if (auto frame = tbl["frame"]) {
            if (auto v = frame["width"].value<int>()) cfg.frame.width = *v;
            if (auto v = frame["height"].value<int>()) cfg.frame.height = *v;
            if (auto v = frame["max_frames"].value<int>()) cfg.frame.max_frames = *v;
            if (auto v = frame["fps"].value<int>()) cfg.frame.fps = *v;
        }

        if (auto dither = tbl["dither"]) {
            if (auto v = dither["method"].value<std::string>()) cfg.dither.method = *v;
            if (auto v = dither["color"].value<bool>()) cfg.dither.color = *v;
            if (auto v = dither["strength"].value<double>()) cfg.dither.strength = static_cast<float>(*v);
            if (auto v = dither["matrix_size"].value<int>()) cfg.dither.matrix_size = *v;
            if (auto v = dither["threshold_variance"].value<double>()) cfg.dither.threshold_variance = static_cast<float>(*v);
            if (auto v = dither["seed"].value<int64_t>()) {
                if (*v < 0 || *v > static_cast<int64_t>(UINT32_MAX)) {
                    return fail("dither.seed must be between 0 and 4294967295");
                }
                cfg.dither.seed = static_cast<uint32_t>(*v);
            }
            if (const toml::array* arr = dither["palette"].as_array()) {
                std::string palette_error;
                if (!parse_palette_array(*arr, cfg.dither.palette, palette_error)) {
                    return fail(palette_error);
                }
                if (cfg.dither.palette.empty()) {
                    return fail("dither.palette must not be empty");
                }
            }
        }

        if (auto v = tbl["quiet"].value<bool>()) cfg.quiet = *v;

        std::string validation_error;
        if (!cfg.validate(validation_error)) {
            return fail(validation_error);
        }
        return cfg;
    } catch (const toml::parse_error& e) {
        return fail(std::string("parse error in ") + path + ": " + std::string(e.description()));
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    const Config defaults = Config::defaults();
    Config result = base;

    if (!override.input.source.empty()) result.input.source = override.input.source;
    if (override.output.target != defaults.output.target) result.output.target = override.output.target;
    if (override.output.prefix != defaults.output.prefix) result.output.prefix = override.output.prefix;

    if (override.frame.width != defaults.frame.width) result.frame.width = override.frame.width;
    if (override.frame.height != defaults.frame.height) result.frame.height = override.frame.height;
    if (override.frame.max_frames != defaults.frame.max_frames) result.frame.max_frames = override.frame.max_frames;
    if (override.frame.fps != defaults.frame.fps) result.frame.fps = override.frame.fps;

    if (override.dither.method != defaults.dither.method) result.dither.method = override.dither.method;
    if (override.dither.color) result.dither.color = true;
    if (override.dither.strength != defaults.dither.strength) result.dither.strength = override.dither.strength;
    if (override.dither.matrix_size != defaults.dither.matrix_size) result.dither.matrix_size = override.dither.matrix_size;
    if (override.dither.threshold_variance != defaults.dither.threshold_variance)
        result.dither.threshold_variance = override.dither.threshold_variance;
    if (override.dither.seed) result.dither.seed = override.dither.seed;
    if (!override.dither.palette.empty()) result.dither.palette = override.dither.palette;

    if (override.quiet) result.quiet = true;
    if (!override.config_path.empty()) result.config_path = override.config_path;
    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.input.empty()) config.input.source = args.input;
    if (args.output) config.output.target = *args.output;
    if (args.method) config.dither.method = *args.method;
    if (args.width) config.frame.width = *args.width;
    if (args.height) config.frame.height = *args.height;
    if (args.max_frames) config.frame.max_frames = *args.max_frames;
    if (args.fps) config.frame.fps = *args.fps;
    if (args.dither_strength) config.dither.strength = *args.dither_strength;
    if (args.matrix_size) config.dither.matrix_size = *args.matrix_size;
    if (args.threshold_variance) config.dither.threshold_variance = *args.threshold_variance;
    if (args.seed) config.dither.seed = *args.seed;
    if (args.palette) config.dither.palette = *args.palette;
    if (args.color) config.dither.color = true;
    if (args.quiet) config.quiet = true;
    return config;
}

}
