#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "render/tone_map.h"
#include "sim/simulation_config.h"

namespace rivulet {

struct OutputConfig {
    std::string path{};  // empty: img-<entries>-<size>.png in the working directory
    render::ToneMapMode tone_map = render::ToneMapMode::Lab;
    bool preview = false;
};

struct AppConfig {
    sim::SimulationConfig simulation{};
    OutputConfig output{};
};

struct ConfigLoadResult {
    AppConfig config{};
    std::vector<std::string> warnings{};
    bool loaded_file = false;
};

// Reads a TOML file. Missing files and bad values fall back to defaults with a warning; nothing here throws.
ConfigLoadResult load_app_config(const std::string& path);

ConfigLoadResult load_app_config_from_string(std::string_view document);

} // namespace rivulet
