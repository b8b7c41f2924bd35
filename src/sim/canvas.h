#pragma once

#include <cstddef>
#include <vector>

#include "sim/vec2.h"

namespace rivulet {
namespace sim {

// Row-major per-pixel color sums.
struct Grid {
    int size = 0;
    std::vector<ColorOffset> cells;

    const ColorOffset& at(int x, int y) const {
        return cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(size) +
                     static_cast<std::size_t>(x)];
    }
};

class Canvas {
public:
    explicit Canvas(int size);

    // Out-of-range pixels are ignored.
    void add(int x, int y, const ColorOffset& color);
    void add_point(const Vec2& position, const ColorOffset& color);

    // Cell-by-cell sum; throws std::invalid_argument if the sizes differ.
    void merge(const Canvas& other);

    const ColorOffset& at(int x, int y) const;
    bool contains(int x, int y) const;
    int size() const { return size_; }

    Grid finalize() &&;
    Grid snapshot() const;

private:
    std::size_t index(int x, int y) const {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(size_) + static_cast<std::size_t>(x);
    }

    int size_ = 0;
    std::vector<ColorOffset> cells_;
};

} // namespace sim
} // namespace rivulet
