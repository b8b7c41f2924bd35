#include "config.h"

#include <algorithm>
#include <thread>

#include "config/config_reader.h"
#include "config/raw_config.h"

namespace rivulet {
namespace {

using config::detail::ConfigReader;
using config::detail::RawConfig;

void read_canvas(ConfigReader& reader, sim::SimulationConfig& sim) {
    reader.read_int("canvas.size", sim.size);
    reader.read_uint64("canvas.seed", sim.seed);

    int threads = sim.threads;
    if (reader.read_int("canvas.threads", threads)) {
        if (threads == 0) {
            const unsigned hardware = std::thread::hardware_concurrency();
            threads = static_cast<int>(std::max(1u, hardware));
        }
        sim.threads = threads;
    }
}

void read_forces(ConfigReader& reader, sim::SimulationConfig& sim) {
    reader.read_int("forces.count", sim.num_forces);
    reader.read_distribution("forces.strength", sim.force_strength_dist);
    reader.read_distribution("forces.spread", sim.force_spread_dist);
    reader.read_double("forces.inward_weight", sim.force_kind_weights.inward);
    reader.read_double("forces.outward_weight", sim.force_kind_weights.outward);
    reader.read_double("forces.linear_weight", sim.force_kind_weights.linear);
}

void read_faucets(ConfigReader& reader, sim::SimulationConfig& sim, std::vector<std::string>& warnings) {
    reader.read_int("faucets.count", sim.num_faucets);

    std::string placement;
    if (reader.read_string("faucets.placement", placement)) {
        if (placement == "centered") {
            sim.faucet_placement = sim::FaucetPlacement::Centered;
        } else if (placement == "uniform") {
            sim.faucet_placement = sim::FaucetPlacement::Uniform;
        } else {
            warnings.push_back("Unknown faucet placement '" + placement + "'; expected centered or uniform");
        }
    }

    reader.read_distribution("faucets.color_center", sim.faucet_color_center_dist);
    reader.read_distribution("faucets.color_spread", sim.faucet_color_spread_dist);
    reader.read_distribution("faucets.position_spread", sim.faucet_position_spread_dist);
    reader.read_distribution("faucets.velocity_spread", sim.faucet_velocity_spread_dist);
}

void read_streams(ConfigReader& reader, sim::SimulationConfig& sim) {
    reader.read_int("streams.count", sim.num_streams);
    reader.read_distribution("streams.decay", sim.decay_dist);
    reader.read_double("streams.max_decay_factor", sim.max_decay_factor);
    reader.read_double("streams.velocity_cap", sim.velocity_cap);
    reader.read_double("streams.color_cap", sim.color_cap);
    reader.read_double("streams.position_jitter", sim.stream_position_jitter);
    reader.read_double("streams.velocity_jitter", sim.stream_velocity_jitter);
    reader.read_double("streams.color_jitter", sim.stream_color_jitter);
    reader.read_bool("streams.connect_segments", sim.connect_segments);
    reader.read_double("streams.lifetime_e_foldings", sim.lifetime_e_foldings);
    reader.read_double("streams.visibility_threshold", sim.visibility_threshold);
    reader.read_double("streams.bounds_margin", sim.bounds_margin);
}

void read_output(ConfigReader& reader, OutputConfig& output, std::vector<std::string>& warnings) {
    reader.read_string("output.path", output.path);

    std::string tone_map;
    if (reader.read_string("output.tone_map", tone_map)) {
        if (const auto mode = render::parse_tone_map_mode(tone_map)) {
            output.tone_map = *mode;
        } else {
            warnings.push_back("Unknown tone map '" + tone_map + "'; expected lab or rgb");
        }
    }

    reader.read_bool("output.preview", output.preview);
}

AppConfig apply_raw_config(const RawConfig& raw, std::vector<std::string>& warnings) {
    AppConfig config;
    ConfigReader reader(raw, warnings);

    read_canvas(reader, config.simulation);
    read_forces(reader, config.simulation);
    read_faucets(reader, config.simulation, warnings);
    read_streams(reader, config.simulation);
    read_output(reader, config.output, warnings);

    reader.report_unknown_keys();
    return config;
}

} // namespace

ConfigLoadResult load_app_config(const std::string& path) {
    ConfigLoadResult result;
    const RawConfig raw = config::detail::parse_raw_config(path, result.warnings, result.loaded_file);
    result.config = apply_raw_config(raw, result.warnings);
    return result;
}

ConfigLoadResult load_app_config_from_string(std::string_view document) {
    ConfigLoadResult result;
    const RawConfig raw = config::detail::parse_raw_config_string(document, result.warnings);
    result.config = apply_raw_config(raw, result.warnings);
    result.loaded_file = true;
    return result;
}

} // namespace rivulet
