#pragma once

#include <cstdint>

#include "sim/canvas.h"
#include "sim/distribution.h"
#include "sim/faucet_set.h"
#include "sim/force_field.h"
#include "sim/simulation_config.h"
#include "sim/vec2.h"

namespace rivulet {
namespace sim {

enum class StreamStatus {
    Active,
    OutOfBounds,
    Decayed,
};

struct StreamState {
    Vec2 position{};
    Vec2 velocity{};
    ColorOffset color{};
    double decay_factor = 0.0;      // e-folding length of the color, in pixels travelled
    std::uint64_t age = 0;          // pixels travelled
    std::uint64_t age_budget = 0;   // age at which the stream counts as decayed
    std::uint64_t steps_taken = 0;
    StreamStatus status = StreamStatus::Active;

    bool active() const { return status == StreamStatus::Active; }
};

struct StreamOutcome {
    StreamStatus status = StreamStatus::Active;
    std::uint64_t steps_taken = 0;
};

// exp(-distance / decay_factor); 1 for distance <= 0 and 0 for decay_factor <= 0.
double decay_multiplier(double distance, double decay_factor);

class StreamIntegrator {
public:
    // Both references must outlive the integrator.
    StreamIntegrator(const SimulationConfig& config, const ForceField& field);

    StreamState spawn(const Faucet& faucet, Rng& rng) const;

    // One Active -> Active | Terminated transition. No-op on a terminated stream.
    void advance(StreamState& state, Canvas& canvas) const;

    // Advances until the stream terminates.
    StreamOutcome integrate(StreamState& state, Canvas& canvas) const;

    bool in_bounds(const Vec2& position) const;

private:
    void contribute(const StreamState& state, std::uint64_t pixels, Canvas& canvas) const;

    const SimulationConfig& config_;
    const ForceField& field_;
    double lower_bound_ = 0.0;
    double upper_bound_ = 0.0;
};

const char* to_string(StreamStatus status);

} // namespace sim
} // namespace rivulet
