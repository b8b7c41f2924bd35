#include "sim/canvas.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace rivulet {
namespace sim {

Canvas::Canvas(int size)
    : size_(std::max(0, size))
    , cells_(static_cast<std::size_t>(size_) * static_cast<std::size_t>(size_)) {}

void Canvas::add(int x, int y, const ColorOffset& color) {
    if (!contains(x, y)) {
        return;
    }
    cells_[index(x, y)] += color;
}

void Canvas::add_point(const Vec2& position, const ColorOffset& color) {
    if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
        return;
    }
    const double px = std::floor(position.x);
    const double py = std::floor(position.y);
    if (px < 0.0 || py < 0.0 || px >= static_cast<double>(size_) || py >= static_cast<double>(size_)) {
        return;
    }
    add(static_cast<int>(px), static_cast<int>(py), color);
}

void Canvas::merge(const Canvas& other) {
    if (other.size_ != size_) {
        throw std::invalid_argument("Cannot merge a " + std::to_string(other.size_) + "px canvas into a " +
                                    std::to_string(size_) + "px canvas");
    }
    for (std::size_t i = 0; i < cells_.size(); ++i) {
        cells_[i] += other.cells_[i];
    }
}

const ColorOffset& Canvas::at(int x, int y) const {
    if (!contains(x, y)) {
        throw std::out_of_range("Canvas pixel out of range");
    }
    return cells_[index(x, y)];
}

bool Canvas::contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < size_ && y < size_;
}

Grid Canvas::finalize() && {
    Grid grid;
    grid.size = size_;
    grid.cells = std::move(cells_);
    size_ = 0;
    cells_.clear();
    return grid;
}

Grid Canvas::snapshot() const {
    Grid grid;
    grid.size = size_;
    grid.cells = cells_;
    return grid;
}

} // namespace sim
} // namespace rivulet
