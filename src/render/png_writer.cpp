#include "render/png_writer.h"

#include <iostream>
#include <system_error>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace rivulet {
namespace render {

bool write_png(const RgbImage& image, const std::filesystem::path& path) {
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() != static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height) * 3u) {
        std::cerr << "[output] refusing to write malformed " << image.width << "x" << image.height << " image"
                  << std::endl;
        return false;
    }

    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[output] failed to create directory '" << parent.string() << "': " << ec.message()
                      << std::endl;
            return false;
        }
    }

    const int stride = image.width * 3;
    if (stbi_write_png(path.string().c_str(), image.width, image.height, 3, image.pixels.data(), stride) == 0) {
        std::cerr << "[output] failed to write PNG to '" << path.string() << "'" << std::endl;
        return false;
    }
    return true;
}

std::filesystem::path default_output_path(const std::filesystem::path& directory, int size) {
    std::size_t entries = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        ++entries;
    }
    if (ec) {
        std::cerr << "[output] could not list '" << directory.string() << "': " << ec.message() << std::endl;
    }
    return (directory / ("img-" + std::to_string(entries) + "-" + std::to_string(size) + ".png")).lexically_normal();
}

} // namespace render
} // namespace rivulet
