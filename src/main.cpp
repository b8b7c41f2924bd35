#include <algorithm>
#include <chrono>
#include <clocale>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <cxxopts.hpp>

#include "config.h"
#include "render/png_writer.h"
#include "render/terminal_preview.h"
#include "render/tone_map.h"
#include "sim/simulation.h"

int main(int argc, char** argv) {
    std::setlocale(LC_ALL, "");

    cxxopts::Options options("rivulet", "Particle-stream image generator");
    options.add_options()
        ("c,config", "Path to configuration file", cxxopts::value<std::string>()->default_value("rivulet.toml"))
        ("s,seed", "Random seed", cxxopts::value<std::uint64_t>())
        ("size", "Canvas edge in pixels", cxxopts::value<int>())
        ("n,streams", "Number of streams", cxxopts::value<int>())
        ("j,threads", "Worker threads (0 = all cores)", cxxopts::value<int>())
        ("o,output", "Output PNG path", cxxopts::value<std::string>())
        ("tone-map", "Color mapping: lab or rgb", cxxopts::value<std::string>())
        ("preview", "Show the result in the terminal")
        ("h,help", "Print usage");

    std::string config_path;
    std::optional<std::uint64_t> seed_override;
    std::optional<int> size_override;
    std::optional<int> streams_override;
    std::optional<int> threads_override;
    std::string output_override;
    std::string tone_map_override;
    bool preview_override = false;

    try {
        const auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        config_path = result["config"].as<std::string>();

        if (result.count("seed")) {
            seed_override = result["seed"].as<std::uint64_t>();
        }
        if (result.count("size")) {
            size_override = result["size"].as<int>();
        }
        if (result.count("streams")) {
            streams_override = result["streams"].as<int>();
        }
        if (result.count("threads")) {
            threads_override = result["threads"].as<int>();
        }
        if (result.count("output")) {
            output_override = result["output"].as<std::string>();
        }
        if (result.count("tone-map")) {
            tone_map_override = result["tone-map"].as<std::string>();
        }
        preview_override = result.count("preview") > 0;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    }

    rivulet::ConfigLoadResult config_result = rivulet::load_app_config(config_path);
    rivulet::AppConfig& config = config_result.config;
    if (!config_result.loaded_file) {
        std::clog << "[config] using built-in defaults (missing '" << config_path << "')" << std::endl;
    } else {
        std::clog << "[config] loaded '" << config_path << "'" << std::endl;
    }
    for (const std::string& warning : config_result.warnings) {
        std::cerr << "[config] " << warning << std::endl;
    }

    if (seed_override) {
        config.simulation.seed = *seed_override;
    }
    if (size_override) {
        config.simulation.size = *size_override;
    }
    if (streams_override) {
        config.simulation.num_streams = *streams_override;
    }
    if (threads_override) {
        config.simulation.threads = *threads_override == 0
                                        ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
                                        : *threads_override;
    }
    if (!output_override.empty()) {
        config.output.path = output_override;
    }
    if (!tone_map_override.empty()) {
        const auto mode = rivulet::render::parse_tone_map_mode(tone_map_override);
        if (!mode) {
            std::cerr << "Unknown tone map '" << tone_map_override << "'; expected lab or rgb" << std::endl;
            return 1;
        }
        config.output.tone_map = *mode;
    }
    if (preview_override) {
        config.output.preview = true;
    }

    std::clog << "[config] " << rivulet::sim::describe(config.simulation) << std::endl;

    rivulet::sim::Grid grid;
    try {
        rivulet::sim::Simulation simulation(config.simulation);
        std::clog << "[sim] " << simulation.force_field().size() << " forces, " << simulation.faucets().size()
                  << " faucets, " << config.simulation.num_streams << " streams on "
                  << config.simulation.threads << " thread(s)" << std::endl;

        const auto start = std::chrono::steady_clock::now();
        grid = simulation.run();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        const rivulet::sim::SimulationStats& stats = simulation.stats();
        std::clog << "[sim] done in " << elapsed.count() << " ms: " << stats.decayed << " decayed, "
                  << stats.out_of_bounds << " out of bounds, " << stats.total_steps << " steps, longest "
                  << stats.longest_stream << std::endl;
    } catch (const rivulet::ConfigurationError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    const rivulet::render::RgbImage image =
        rivulet::render::tone_map(grid, config.simulation.color_cap, config.output.tone_map);

    const std::filesystem::path output_path =
        config.output.path.empty()
            ? rivulet::render::default_output_path(std::filesystem::path("."), config.simulation.size)
            : std::filesystem::path(config.output.path);

    if (!rivulet::render::write_png(image, output_path)) {
        return 1;
    }
    std::clog << "[output] wrote " << image.width << "x" << image.height << " ("
              << rivulet::render::to_string(config.output.tone_map) << ")" << std::endl;
    std::cout << output_path.string() << std::endl;

    if (config.output.preview) {
        if (!rivulet::render::show_preview(image, output_path.string().c_str())) {
            std::cerr << "[preview] skipped" << std::endl;
        }
    }

    return 0;
}
