#pragma once

#include <algorithm>
#include <cmath>

namespace rivulet {
namespace sim {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2& operator+=(const Vec2& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    double length() const { return std::sqrt(x * x + y * y); }
};

inline Vec2 operator+(Vec2 lhs, const Vec2& rhs) {
    lhs += rhs;
    return lhs;
}

inline Vec2 operator-(const Vec2& lhs, const Vec2& rhs) {
    return Vec2{lhs.x - rhs.x, lhs.y - rhs.y};
}

inline Vec2 operator*(const Vec2& v, double scale) {
    return Vec2{v.x * scale, v.y * scale};
}

// Signed color components, not yet mapped to a display range.
struct ColorOffset {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    ColorOffset& operator+=(const ColorOffset& other) {
        r += other.r;
        g += other.g;
        b += other.b;
        return *this;
    }

    double length() const { return std::sqrt(r * r + g * g + b * b); }
    double max_abs() const { return std::max({std::abs(r), std::abs(g), std::abs(b)}); }
    bool is_zero() const { return r == 0.0 && g == 0.0 && b == 0.0; }
};

inline ColorOffset operator*(const ColorOffset& c, double scale) {
    return ColorOffset{c.r * scale, c.g * scale, c.b * scale};
}

inline ColorOffset operator+(ColorOffset lhs, const ColorOffset& rhs) {
    lhs += rhs;
    return lhs;
}

inline Vec2 clamp_components(const Vec2& v, double cap) {
    return Vec2{std::clamp(v.x, -cap, cap), std::clamp(v.y, -cap, cap)};
}

inline ColorOffset clamp_components(const ColorOffset& c, double cap) {
    return ColorOffset{std::clamp(c.r, -cap, cap),
                       std::clamp(c.g, -cap, cap),
                       std::clamp(c.b, -cap, cap)};
}

} // namespace sim
} // namespace rivulet
