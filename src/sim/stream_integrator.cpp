#include "sim/stream_integrator.h"

#include <algorithm>
#include <cmath>

namespace rivulet {
namespace sim {
namespace {

// Whole pixels covered by one step along the dominant axis.
std::uint64_t pixels_covered(const Vec2& velocity) {
    const double chebyshev = std::max(std::abs(velocity.x), std::abs(velocity.y));
    if (!(chebyshev >= 1.0)) {
        return 0;
    }
    return static_cast<std::uint64_t>(chebyshev);
}

} // namespace

double decay_multiplier(double distance, double decay_factor) {
    if (distance <= 0.0) {
        return 1.0;
    }
    if (decay_factor <= 0.0) {
        return 0.0;
    }
    return std::exp(-distance / decay_factor);
}

StreamIntegrator::StreamIntegrator(const SimulationConfig& config, const ForceField& field)
    : config_(config)
    , field_(field) {
    const double extent = static_cast<double>(config_.size);
    lower_bound_ = -config_.bounds_margin * extent;
    upper_bound_ = extent + config_.bounds_margin * extent;
}

StreamState StreamIntegrator::spawn(const Faucet& faucet, Rng& rng) const {
    StreamState state;

    state.position.x = faucet.position.x +
                       config_.stream_position_jitter * faucet.position_spread.x * standard_normal(rng);
    state.position.y = faucet.position.y +
                       config_.stream_position_jitter * faucet.position_spread.y * standard_normal(rng);

    Vec2 velocity;
    velocity.x = faucet.velocity.x +
                 config_.stream_velocity_jitter * faucet.velocity_spread.x * standard_normal(rng);
    velocity.y = faucet.velocity.y +
                 config_.stream_velocity_jitter * faucet.velocity_spread.y * standard_normal(rng);
    state.velocity = clamp_components(velocity, config_.velocity_cap);

    ColorOffset color;
    color.r = faucet.color.r + config_.stream_color_jitter * faucet.color_spread.r * standard_normal(rng);
    color.g = faucet.color.g + config_.stream_color_jitter * faucet.color_spread.g * standard_normal(rng);
    color.b = faucet.color.b + config_.stream_color_jitter * faucet.color_spread.b * standard_normal(rng);
    state.color = clamp_components(color, config_.color_cap);

    state.decay_factor = std::clamp(sample(config_.decay_dist, rng), 0.0, config_.max_decay_factor);
    state.age_budget = lifetime_budget(config_.lifetime_e_foldings, state.decay_factor);

    if (!in_bounds(state.position)) {
        state.status = StreamStatus::OutOfBounds;
    }
    return state;
}

void StreamIntegrator::advance(StreamState& state, Canvas& canvas) const {
    if (!state.active()) {
        return;
    }

    const Vec2 force = field_.field_at(state.position);
    state.velocity = clamp_components(state.velocity + force, config_.velocity_cap);

    const std::uint64_t pixels = pixels_covered(state.velocity);
    contribute(state, pixels, canvas);

    state.position += state.velocity;

    const std::uint64_t travelled = std::max<std::uint64_t>(1, pixels);
    state.color = clamp_components(state.color * decay_multiplier(static_cast<double>(travelled), state.decay_factor),
                                   config_.color_cap);
    state.age += travelled;
    ++state.steps_taken;

    if (state.age >= state.age_budget || state.color.max_abs() < config_.visibility_threshold) {
        state.status = StreamStatus::Decayed;
    } else if (!in_bounds(state.position)) {
        state.status = StreamStatus::OutOfBounds;
    }
}

StreamOutcome StreamIntegrator::integrate(StreamState& state, Canvas& canvas) const {
    while (state.active()) {
        advance(state, canvas);
    }
    return StreamOutcome{state.status, state.steps_taken};
}

bool StreamIntegrator::in_bounds(const Vec2& position) const {
    return position.x >= lower_bound_ && position.x < upper_bound_ &&
           position.y >= lower_bound_ && position.y < upper_bound_;
}

void StreamIntegrator::contribute(const StreamState& state, std::uint64_t pixels, Canvas& canvas) const {
    if (state.age >= state.age_budget) {
        return;
    }

    if (!config_.connect_segments || pixels <= 1) {
        if (!state.color.is_zero()) {
            canvas.add_point(state.position, state.color);
        }
        return;
    }

    // One sample per pixel along the dominant axis, from the current position up to (not including) the next one.
    const Vec2 stride = state.velocity * (1.0 / static_cast<double>(pixels));
    const std::uint64_t samples = std::min(pixels, state.age_budget - state.age);
    for (std::uint64_t k = 0; k < samples; ++k) {
        const double offset = static_cast<double>(k);
        const ColorOffset color = state.color * decay_multiplier(offset, state.decay_factor);
        if (color.is_zero()) {
            break;
        }
        canvas.add_point(state.position + stride * offset, color);
    }
}

const char* to_string(StreamStatus status) {
    switch (status) {
    case StreamStatus::Active:
        return "active";
    case StreamStatus::OutOfBounds:
        return "out_of_bounds";
    case StreamStatus::Decayed:
        return "decayed";
    }
    return "unknown";
}

} // namespace sim
} // namespace rivulet
