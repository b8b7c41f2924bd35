#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "sim/canvas.h"
#include "sim/vec2.h"

namespace rivulet {
namespace render {

enum class ToneMapMode {
    Lab, // components read as CIELAB L*, a*, b*
    Rgb, // components read directly as sRGB channels
};

struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels; // row-major, 3 bytes per pixel

    std::array<std::uint8_t, 3> at(int x, int y) const;
};

// Maps any real number into (0, 1); 0 maps to 0.5.
double soft_unit(double value);

std::array<std::uint8_t, 3> lab_to_srgb8(double l, double a, double b);

// Scales `color` down to Euclidean length `color_cap` if longer, then maps it to a display color.
std::array<std::uint8_t, 3> map_color(const sim::ColorOffset& color, double color_cap, ToneMapMode mode);

RgbImage tone_map(const sim::Grid& grid, double color_cap, ToneMapMode mode);

std::optional<ToneMapMode> parse_tone_map_mode(std::string_view name);
const char* to_string(ToneMapMode mode);

} // namespace render
} // namespace rivulet
