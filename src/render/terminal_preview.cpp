#include "render/terminal_preview.h"

#include <algorithm>
#include <cstddef>
#include <iostream>

#include <notcurses/notcurses.h>

namespace rivulet {
namespace render {
namespace {

constexpr std::uint32_t kUpperHalfBlock = 0x2580u;

} // namespace

RgbImage downsample(const RgbImage& image, int side) {
    RgbImage out;
    if (side <= 0 || image.width <= 0 || image.height <= 0) {
        return out;
    }
    out.width = side;
    out.height = side;
    out.pixels.assign(static_cast<std::size_t>(side) * static_cast<std::size_t>(side) * 3u, 0u);

    for (int oy = 0; oy < side; ++oy) {
        const int y0 = oy * image.height / side;
        const int y1 = std::max(y0 + 1, (oy + 1) * image.height / side);
        for (int ox = 0; ox < side; ++ox) {
            const int x0 = ox * image.width / side;
            const int x1 = std::max(x0 + 1, (ox + 1) * image.width / side);

            std::array<std::uint64_t, 3> sum{0, 0, 0};
            std::uint64_t count = 0;
            for (int y = y0; y < y1 && y < image.height; ++y) {
                for (int x = x0; x < x1 && x < image.width; ++x) {
                    const auto rgb = image.at(x, y);
                    sum[0] += rgb[0];
                    sum[1] += rgb[1];
                    sum[2] += rgb[2];
                    ++count;
                }
            }
            if (count == 0) {
                continue;
            }
            const std::size_t offset =
                (static_cast<std::size_t>(oy) * static_cast<std::size_t>(side) + static_cast<std::size_t>(ox)) * 3u;
            for (std::size_t c = 0; c < 3; ++c) {
                out.pixels[offset + c] = static_cast<std::uint8_t>((sum[c] + count / 2) / count);
            }
        }
    }
    return out;
}

int preview_side(unsigned rows, unsigned cols) {
    const int usable_rows = rows > 1 ? static_cast<int>(rows) - 1 : 1;
    int side = std::min(static_cast<int>(cols), usable_rows * 2);
    side -= side % 2;
    return std::max(2, side);
}

bool show_preview(const RgbImage& image, const char* caption) {
    notcurses_options opts{};
    opts.flags = NCOPTION_SUPPRESS_BANNERS;
    notcurses* nc = notcurses_init(&opts, nullptr);
    if (!nc) {
        std::cerr << "[preview] failed to initialize notcurses" << std::endl;
        return false;
    }

    ncplane* stdplane = notcurses_stdplane(nc);
    unsigned rows = 0;
    unsigned cols = 0;
    ncplane_dim_yx(stdplane, &rows, &cols);

    const RgbImage small = downsample(image, preview_side(rows, cols));
    for (int row = 0; row * 2 < small.height; ++row) {
        for (int col = 0; col < small.width; ++col) {
            nccell cell = NCCELL_TRIVIAL_INITIALIZER;
            if (nccell_load_ucs32(stdplane, &cell, kUpperHalfBlock) <= 0) {
                continue;
            }
            const auto top = small.at(col, row * 2);
            const auto bottom = row * 2 + 1 < small.height ? small.at(col, row * 2 + 1) : top;
            nccell_set_fg_rgb8(&cell, top[0], top[1], top[2]);
            nccell_set_bg_rgb8(&cell, bottom[0], bottom[1], bottom[2]);
            ncplane_putc_yx(stdplane, row, col, &cell);
            nccell_release(stdplane, &cell);
        }
    }

    if (rows > 0) {
        ncplane_set_fg_default(stdplane);
        ncplane_set_bg_default(stdplane);
        ncplane_printf_yx(stdplane, static_cast<int>(rows) - 1, 0, "%s  (press any key)", caption ? caption : "");
    }

    bool ok = true;
    if (notcurses_render(nc) != 0) {
        std::cerr << "[preview] failed to render frame" << std::endl;
        ok = false;
    } else {
        ncinput input{};
        const std::uint32_t key = notcurses_get(nc, nullptr, &input);
        if (key == static_cast<std::uint32_t>(-1)) {
            std::cerr << "[preview] input error" << std::endl;
        }
    }

    if (notcurses_stop(nc) != 0) {
        std::cerr << "[preview] failed to stop notcurses cleanly" << std::endl;
        return false;
    }
    return ok;
}

} // namespace render
} // namespace rivulet
