#include "sim/faucet_set.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace rivulet {
namespace sim {

FaucetSet::FaucetSet(std::vector<Faucet> faucets) : faucets_(std::move(faucets)) {}

FaucetSet FaucetSet::generate(const SimulationConfig& config, Rng& rng) {
    validate(config);

    const double extent = static_cast<double>(config.size);
    const Vec2 canvas_center{extent / 2.0, extent / 2.0};

    // One color center shared by every faucet; faucets deviate from it per channel.
    ColorOffset color_center;
    color_center.r = sample(config.faucet_color_center_dist, rng);
    color_center.g = sample(config.faucet_color_center_dist, rng);
    color_center.b = sample(config.faucet_color_center_dist, rng);

    std::vector<Faucet> faucets;
    faucets.reserve(static_cast<std::size_t>(config.num_faucets));

    for (int i = 0; i < config.num_faucets; ++i) {
        Faucet faucet;

        Vec2 origin = canvas_center;
        if (config.faucet_placement == FaucetPlacement::Uniform) {
            origin = Vec2{uniform01(rng) * extent, uniform01(rng) * extent};
        }
        const double radius = std::abs(sample(config.faucet_position_spread_dist, rng));
        faucet.position = origin + sample_direction(rng) * radius;

        const double speed = std::abs(sample(config.faucet_velocity_spread_dist, rng));
        faucet.velocity = sample_direction(rng) * speed;

        faucet.color.r = color_center.r + sample_signed(config.faucet_color_spread_dist, rng);
        faucet.color.g = color_center.g + sample_signed(config.faucet_color_spread_dist, rng);
        faucet.color.b = color_center.b + sample_signed(config.faucet_color_spread_dist, rng);

        faucet.position_spread.x = std::abs(sample(config.faucet_position_spread_dist, rng));
        faucet.position_spread.y = std::abs(sample(config.faucet_position_spread_dist, rng));
        faucet.velocity_spread.x = std::abs(sample(config.faucet_velocity_spread_dist, rng));
        faucet.velocity_spread.y = std::abs(sample(config.faucet_velocity_spread_dist, rng));
        faucet.color_spread.r = std::abs(sample(config.faucet_color_spread_dist, rng));
        faucet.color_spread.g = std::abs(sample(config.faucet_color_spread_dist, rng));
        faucet.color_spread.b = std::abs(sample(config.faucet_color_spread_dist, rng));

        faucets.push_back(faucet);
    }

    return FaucetSet(std::move(faucets));
}

const Faucet& FaucetSet::faucet_for_stream(std::size_t stream_index) const {
    return faucets_.at(faucet_index_for_stream(stream_index));
}

std::size_t FaucetSet::faucet_index_for_stream(std::size_t stream_index) const {
    if (faucets_.empty()) {
        throw std::logic_error("FaucetSet has no faucets to emit streams");
    }
    return stream_index % faucets_.size();
}

std::size_t FaucetSet::streams_for_faucet(std::size_t faucet_index, std::size_t num_streams) const {
    if (faucet_index >= faucets_.size()) {
        return 0;
    }
    const std::size_t base = num_streams / faucets_.size();
    const std::size_t remainder = num_streams % faucets_.size();
    return faucet_index < remainder ? base + 1 : base;
}

} // namespace sim
} // namespace rivulet
