#include "sim/simulation_config.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string_view>

namespace rivulet {
namespace sim {
namespace {

void require(bool condition, std::string_view field, std::string_view message) {
    if (!condition) {
        std::string text{field};
        text += ": ";
        text += message;
        throw ConfigurationError(text);
    }
}

void require_count(int value, std::string_view field) {
    require(value >= 0, field, "must be a non-negative count");
}

void require_distribution(const Distribution& dist, std::string_view field) {
    require(is_valid(dist), field, "parameters must be finite with a strictly positive scale");
}

void require_non_negative(double value, std::string_view field) {
    require(std::isfinite(value) && value >= 0.0, field, "must be finite and non-negative");
}

} // namespace

void validate(const SimulationConfig& config) {
    require(config.size >= 1, "size", "canvas must be at least one pixel wide");
    require_count(config.num_forces, "num_forces");
    require_count(config.num_faucets, "num_faucets");
    require_count(config.num_streams, "num_streams");
    require(config.num_streams == 0 || config.num_faucets > 0,
            "num_faucets",
            "at least one faucet is needed to emit streams");

    require_distribution(config.force_strength_dist, "force_strength_dist");
    require_distribution(config.force_spread_dist, "force_spread_dist");
    require(has_positive_support(config.force_spread_dist),
            "force_spread_dist",
            "spread must be drawn from a strictly positive distribution (lognormal or exp)");
    require_distribution(config.faucet_color_center_dist, "faucet_color_center_dist");
    require_distribution(config.faucet_color_spread_dist, "faucet_color_spread_dist");
    require_distribution(config.faucet_position_spread_dist, "faucet_position_spread_dist");
    require_distribution(config.faucet_velocity_spread_dist, "faucet_velocity_spread_dist");
    require_distribution(config.decay_dist, "decay_dist");

    const ForceKindWeights& weights = config.force_kind_weights;
    require_non_negative(weights.inward, "force_kind_weights.inward");
    require_non_negative(weights.outward, "force_kind_weights.outward");
    require_non_negative(weights.linear, "force_kind_weights.linear");
    require(config.num_forces == 0 || weights.inward + weights.outward + weights.linear > 0.0,
            "force_kind_weights",
            "at least one force kind needs a positive weight");

    require_non_negative(config.max_decay_factor, "max_decay_factor");
    require_non_negative(config.velocity_cap, "velocity_cap");
    require_non_negative(config.color_cap, "color_cap");
    require_non_negative(config.stream_position_jitter, "stream_position_jitter");
    require_non_negative(config.stream_velocity_jitter, "stream_velocity_jitter");
    require_non_negative(config.stream_color_jitter, "stream_color_jitter");
    require_non_negative(config.lifetime_e_foldings, "lifetime_e_foldings");
    require_non_negative(config.visibility_threshold, "visibility_threshold");
    require_non_negative(config.bounds_margin, "bounds_margin");
    require(config.threads >= 1, "threads", "must be at least 1");
}

std::uint64_t lifetime_budget(double e_foldings, double decay_factor) {
    const double budget = std::ceil(e_foldings * decay_factor);
    if (!(budget > 0.0)) {
        return 0;
    }
    if (!(budget < static_cast<double>(std::numeric_limits<std::uint64_t>::max()))) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return static_cast<std::uint64_t>(budget);
}

std::uint64_t max_steps_bound(const SimulationConfig& config) {
    // Every step ages a stream by at least one pixel.
    return std::max<std::uint64_t>(1, lifetime_budget(config.lifetime_e_foldings, config.max_decay_factor));
}

const char* to_string(FaucetPlacement placement) {
    switch (placement) {
    case FaucetPlacement::Centered:
        return "centered";
    case FaucetPlacement::Uniform:
        return "uniform";
    }
    return "unknown";
}

std::string describe(const SimulationConfig& config) {
    std::ostringstream oss;
    oss << "SimulationConfig {\n"
        << "    size: " << config.size << ",\n"
        << "    seed: " << config.seed << ",\n"
        << "    num_forces: " << config.num_forces << ",\n"
        << "    force_strength_dist: " << config.force_strength_dist << ",\n"
        << "    force_spread_dist: " << config.force_spread_dist << ",\n"
        << "    force_kind_weights: { inward: " << config.force_kind_weights.inward
        << ", outward: " << config.force_kind_weights.outward
        << ", linear: " << config.force_kind_weights.linear << " },\n"
        << "    num_faucets: " << config.num_faucets << ",\n"
        << "    faucet_placement: " << to_string(config.faucet_placement) << ",\n"
        << "    faucet_color_center_dist: " << config.faucet_color_center_dist << ",\n"
        << "    faucet_color_spread_dist: " << config.faucet_color_spread_dist << ",\n"
        << "    faucet_position_spread_dist: " << config.faucet_position_spread_dist << ",\n"
        << "    faucet_velocity_spread_dist: " << config.faucet_velocity_spread_dist << ",\n"
        << "    num_streams: " << config.num_streams << ",\n"
        << "    decay_dist: " << config.decay_dist << ",\n"
        << "    max_decay_factor: " << config.max_decay_factor << ",\n"
        << "    velocity_cap: " << config.velocity_cap << ",\n"
        << "    color_cap: " << config.color_cap << ",\n"
        << "    stream_jitter: { position: " << config.stream_position_jitter
        << ", velocity: " << config.stream_velocity_jitter
        << ", color: " << config.stream_color_jitter << " },\n"
        << "    connect_segments: " << (config.connect_segments ? "true" : "false") << ",\n"
        << "    lifetime_e_foldings: " << config.lifetime_e_foldings << ",\n"
        << "    visibility_threshold: " << config.visibility_threshold << ",\n"
        << "    bounds_margin: " << config.bounds_margin << ",\n"
        << "    threads: " << config.threads << ",\n"
        << "}";
    return oss.str();
}

} // namespace sim
} // namespace rivulet
