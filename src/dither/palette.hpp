#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <optional>
#include <vector>

namespace halftone {

struct PaletteColor {
    int r = 0, g = 0, b = 0;

    bool operator==(const PaletteColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const PaletteColor& other) const { return !(*this == other); }
};

using Palette = std::vector<PaletteColor>;

/// Black, white, red, green, blue, yellow, magenta, cyan.
const Palette& default_palette();

struct PaletteMatch {
    int index = 0;
    PaletteColor color;
};

/// Nearest entry by Euclidean distance in RGB space. Ties resolve to the
/// earliest entry. The input does not need to be clamped to 0..255.
/// Throws std::invalid_argument on an empty palette.
PaletteMatch nearest_color(float r, float g, float b, const Palette& palette);

bool palette_contains(const Palette& palette, uint8_t r, uint8_t g, uint8_t b);

/// Parses "r,g,b;r,g,b;..." (whitespace tolerated). Returns std::nullopt on
/// malformed input, components outside 0..255, repeated colours or an
/// empty list.
std::optional<Palette> parse_palette(const std::string& text);

std::string format_palette(const Palette& palette);

}
