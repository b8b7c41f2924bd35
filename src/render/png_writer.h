#pragma once

#include <filesystem>
#include <string>

#include "render/tone_map.h"

namespace rivulet {
namespace render {

// Creates missing parent directories. Logs to std::cerr and returns false on failure.
bool write_png(const RgbImage& image, const std::filesystem::path& path);

// img-<entries in directory>-<size>.png, so repeated runs do not overwrite each other.
std::filesystem::path default_output_path(const std::filesystem::path& directory, int size);

} // namespace render
} // namespace rivulet
