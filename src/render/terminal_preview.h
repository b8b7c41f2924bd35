#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "render/tone_map.h"

namespace rivulet {
namespace render {

// Box-filtered copy of `image` at `side` x `side`. Each output pixel averages the source pixels it covers.
RgbImage downsample(const RgbImage& image, int side);

// Largest square that fits a terminal of `rows` x `cols` cells drawn with upper half blocks,
// keeping the last row for the status line. Always even, at least 2.
int preview_side(unsigned rows, unsigned cols);

// Draws the image into the terminal with notcurses and waits for a key. Returns false if the
// terminal could not be driven; the caller keeps going.
bool show_preview(const RgbImage& image, const char* caption);

} // namespace render
} // namespace rivulet
