#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "sim/distribution.h"

namespace rivulet {

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace sim {

enum class FaucetPlacement {
    Centered, // around the canvas center
    Uniform,  // around a uniformly drawn canvas point
};

struct ForceKindWeights {
    double inward = 1.0;
    double outward = 0.0;
    double linear = 0.0;
};

struct SimulationConfig {
    int size = 1000;
    std::uint64_t seed = 0;

    int num_forces = 200;
    Distribution force_strength_dist = log_dist(10.0, 2.0);
    Distribution force_spread_dist = log_dist(200.0, 2.0);
    ForceKindWeights force_kind_weights{};

    int num_faucets = 40;
    FaucetPlacement faucet_placement = FaucetPlacement::Centered;
    Distribution faucet_color_center_dist = NormalDist{0.0, 0.03};
    Distribution faucet_color_spread_dist = ExpDist{0.03};
    Distribution faucet_position_spread_dist = ExpDist{80.0};
    Distribution faucet_velocity_spread_dist = ExpDist{1.0};

    int num_streams = 100000;
    Distribution decay_dist = ExpDist{1000.0};
    double max_decay_factor = 10000.0;
    double velocity_cap = 40.0;
    double color_cap = 2.0;

    double stream_position_jitter = 1.0;
    double stream_velocity_jitter = 1.0;
    double stream_color_jitter = 0.0;
    bool connect_segments = true;
    double lifetime_e_foldings = 10.0;
    double visibility_threshold = 1e-6;
    double bounds_margin = 0.0;

    int threads = 1;
};

// Throws ConfigurationError naming the first offending field.
void validate(const SimulationConfig& config);

// Pixels a stream may travel before it counts as decayed: ceil(e_foldings * decay_factor), saturating.
std::uint64_t lifetime_budget(double e_foldings, double decay_factor);

// Upper bound on the number of steps any stream can take under this configuration.
std::uint64_t max_steps_bound(const SimulationConfig& config);

std::string describe(const SimulationConfig& config);

const char* to_string(FaucetPlacement placement);

} // namespace sim
} // namespace rivulet
