#pragma once

#include <cstddef>
#include <vector>

#include "sim/distribution.h"
#include "sim/simulation_config.h"
#include "sim/vec2.h"

namespace rivulet {
namespace sim {

struct Faucet {
    Vec2 position{};
    Vec2 velocity{};
    ColorOffset color{};

    // Per-faucet scales of the normal jitter applied to each emitted stream.
    Vec2 position_spread{};
    Vec2 velocity_spread{};
    ColorOffset color_spread{};
};

class FaucetSet {
public:
    FaucetSet() = default;
    explicit FaucetSet(std::vector<Faucet> faucets);

    // Draws config.num_faucets faucets from rng. Throws ConfigurationError on an invalid config.
    static FaucetSet generate(const SimulationConfig& config, Rng& rng);

    // Stream i is emitted by faucet i mod size().
    const Faucet& faucet_for_stream(std::size_t stream_index) const;
    std::size_t faucet_index_for_stream(std::size_t stream_index) const;

    // Either floor or ceil of num_streams / size().
    std::size_t streams_for_faucet(std::size_t faucet_index, std::size_t num_streams) const;

    const std::vector<Faucet>& faucets() const { return faucets_; }
    std::size_t size() const { return faucets_.size(); }
    bool empty() const { return faucets_.empty(); }

private:
    std::vector<Faucet> faucets_;
};

} // namespace sim
} // namespace rivulet
