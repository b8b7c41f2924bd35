#include "render/tone_map.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace rivulet {
namespace render {
namespace {

// D65 reference white.
constexpr double kWhiteX = 0.95047;
constexpr double kWhiteY = 1.0;
constexpr double kWhiteZ = 1.08883;
constexpr double kLabEpsilon = 6.0 / 29.0;

double lab_f_inverse(double t) {
    if (t > kLabEpsilon) {
        return t * t * t;
    }
    return 3.0 * kLabEpsilon * kLabEpsilon * (t - 4.0 / 29.0);
}

double srgb_gamma(double linear) {
    if (linear <= 0.0031308) {
        return 12.92 * linear;
    }
    return 1.055 * std::pow(linear, 1.0 / 2.4) - 0.055;
}

std::uint8_t to_byte(double unit) {
    const double clamped = std::clamp(unit, 0.0, 1.0);
    return static_cast<std::uint8_t>(std::lround(clamped * 255.0));
}

} // namespace

std::array<std::uint8_t, 3> RgbImage::at(int x, int y) const {
    const std::size_t offset =
        (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 3u;
    return {pixels[offset], pixels[offset + 1], pixels[offset + 2]};
}

double soft_unit(double value) {
    return 0.5 * value / (1.0 + std::abs(value)) + 0.5;
}

std::array<std::uint8_t, 3> lab_to_srgb8(double l, double a, double b) {
    const double fy = (l + 16.0) / 116.0;
    const double fx = fy + a / 500.0;
    const double fz = fy - b / 200.0;

    const double x = kWhiteX * lab_f_inverse(fx);
    const double y = kWhiteY * lab_f_inverse(fy);
    const double z = kWhiteZ * lab_f_inverse(fz);

    const double r_linear = 3.2404542 * x - 1.5371385 * y - 0.4985314 * z;
    const double g_linear = -0.9692660 * x + 1.8760108 * y + 0.0415560 * z;
    const double b_linear = 0.0556434 * x - 0.2040259 * y + 1.0572252 * z;

    return {to_byte(srgb_gamma(r_linear)), to_byte(srgb_gamma(g_linear)), to_byte(srgb_gamma(b_linear))};
}

std::array<std::uint8_t, 3> map_color(const sim::ColorOffset& color, double color_cap, ToneMapMode mode) {
    const double length = color.length();
    const double ratio = length > color_cap ? color_cap / length : 1.0;

    const double u = soft_unit(color.r * ratio);
    const double v = soft_unit(color.g * ratio);
    const double w = soft_unit(color.b * ratio);

    if (mode == ToneMapMode::Rgb) {
        return {to_byte(u), to_byte(v), to_byte(w)};
    }
    return lab_to_srgb8(u * 100.0, v * 255.0 - 128.0, w * 255.0 - 128.0);
}

RgbImage tone_map(const sim::Grid& grid, double color_cap, ToneMapMode mode) {
    RgbImage image;
    image.width = grid.size;
    image.height = grid.size;
    image.pixels.resize(grid.cells.size() * 3u);

    for (std::size_t i = 0; i < grid.cells.size(); ++i) {
        const auto rgb = map_color(grid.cells[i], color_cap, mode);
        image.pixels[i * 3u] = rgb[0];
        image.pixels[i * 3u + 1] = rgb[1];
        image.pixels[i * 3u + 2] = rgb[2];
    }
    return image;
}

std::optional<ToneMapMode> parse_tone_map_mode(std::string_view name) {
    if (name == "lab") {
        return ToneMapMode::Lab;
    }
    if (name == "rgb") {
        return ToneMapMode::Rgb;
    }
    return std::nullopt;
}

const char* to_string(ToneMapMode mode) {
    switch (mode) {
    case ToneMapMode::Lab:
        return "lab";
    case ToneMapMode::Rgb:
        return "rgb";
    }
    return "unknown";
}

} // namespace render
} // namespace rivulet
