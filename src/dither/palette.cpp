#include "palette.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace halftone {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

bool parse_component(const std::string& text, int& out) {
    std::string t = trim(text);
    if (t.empty() || t.size() > 3) return false;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoi(t);
    return out <= 255;
}

}  // namespace

const Palette& default_palette() {
    static const Palette kDefault = {
        {0, 0, 0},
        {255, 255, 255},
        {255, 0, 0},
        {0, 255, 0},
        {0, 0, 255},
        {255, 255, 0},
        {255, 0, 255},
        {0, 255, 255},
    };
    return kDefault;
}

PaletteMatch nearest_color(float r, float g, float b, const Palette& palette) {
    if (palette.empty()) {
        throw std::invalid_argument("nearest_color: palette is empty");
    }

    PaletteMatch best;
    float best_dist = std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < palette.size(); ++i) {
        const PaletteColor& p = palette[i];
        float dr = r - static_cast<float>(p.r);
        float dg = g - static_cast<float>(p.g);
        float db = b - static_cast<float>(p.b);
        float dist = dr * dr + dg * dg + db * db;
        if (dist < best_dist) {
            best_dist = dist;
            best.index = static_cast<int>(i);
            best.color = p;
        }
    }
    return best;
}

bool palette_contains(const Palette& palette, uint8_t r, uint8_t g, uint8_t b) {
    for (const auto& p : palette) {
        if (p.r == r && p.g == g && p.b == b) return true;
    }
    return false;
}

std::optional<Palette> parse_palette(const std::string& text) {
    Palette palette;
    for (const auto& entry : split(text, ';')) {
        if (trim(entry).empty()) continue;
        auto parts = split(entry, ',');
        if (parts.size() != 3) return std::nullopt;

        PaletteColor c;
        if (!parse_component(parts[0], c.r) ||
            !parse_component(parts[1], c.g) ||
            !parse_component(parts[2], c.b)) {
            return std::nullopt;
        }
        for (const auto& existing : palette) {
            if (existing == c) return std::nullopt;
        }
        palette.push_back(c);
    }
    if (palette.empty()) return std::nullopt;
    return palette;
}

std::string format_palette(const Palette& palette) {
    std::ostringstream out;
    for (size_t i = 0; i < palette.size(); ++i) {
        if (i > 0) out << ';';
        out << palette[i].r << ',' << palette[i].g << ',' << palette[i].b;
    }
    return out.str();
}

}
