#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <cstdint>

#include "sim/canvas.h"
#include "sim/faucet_set.h"
#include "sim/force_field.h"
#include "sim/simulation_config.h"
#include "sim/stream_integrator.h"

using rivulet::sim::Canvas;
using rivulet::sim::ColorOffset;
using rivulet::sim::Faucet;
using rivulet::sim::FaucetSet;
using rivulet::sim::ForceField;
using rivulet::sim::Grid;
using rivulet::sim::NormalDist;
using rivulet::sim::Rng;
using rivulet::sim::SimulationConfig;
using rivulet::sim::StreamIntegrator;
using rivulet::sim::StreamOutcome;
using rivulet::sim::StreamState;
using rivulet::sim::StreamStatus;
using rivulet::sim::Vec2;

namespace {

// Decay factor pinned to `decay` pixels.
SimulationConfig quiet_config(double decay) {
    SimulationConfig config;
    config.size = 1000;
    config.num_forces = 0;
    config.decay_dist = NormalDist{decay, 1e-300};
    return config;
}

Faucet still_faucet(Vec2 position, Vec2 velocity, ColorOffset color) {
    Faucet faucet;
    faucet.position = position;
    faucet.velocity = velocity;
    faucet.color = color;
    return faucet;
}

std::size_t lit_pixels(const Grid& grid) {
    std::size_t count = 0;
    for (const ColorOffset& cell : grid.cells) {
        if (!cell.is_zero()) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST(StreamIntegratorTest, DecayMultiplier) {
    EXPECT_EQ(rivulet::sim::decay_multiplier(0.0, 10.0), 1.0);
    EXPECT_EQ(rivulet::sim::decay_multiplier(-3.0, 0.0), 1.0);
    EXPECT_EQ(rivulet::sim::decay_multiplier(1.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(rivulet::sim::decay_multiplier(5.0, 10.0), std::exp(-0.5));
}

TEST(StreamIntegratorTest, ZeroJitterSpawnsOnTheFaucet) {
    SimulationConfig config = quiet_config(50.0);
    config.stream_position_jitter = 0.0;
    config.stream_velocity_jitter = 0.0;
    config.stream_color_jitter = 0.0;
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(5);

    Faucet faucet = still_faucet({300.25, 400.75}, {1.5, -2.5}, {0.25, -0.5, 0.125});
    faucet.position_spread = {30.0, 40.0};
    faucet.velocity_spread = {2.0, 3.0};
    faucet.color_spread = {0.1, 0.2, 0.3};

    for (int i = 0; i < 10; ++i) {
        const StreamState state = integrator.spawn(faucet, rng);
        EXPECT_EQ(state.position.x, 300.25);
        EXPECT_EQ(state.position.y, 400.75);
        EXPECT_EQ(state.velocity.x, 1.5);
        EXPECT_EQ(state.velocity.y, -2.5);
        EXPECT_EQ(state.color.r, 0.25);
        EXPECT_EQ(state.color.g, -0.5);
        EXPECT_EQ(state.color.b, 0.125);
    }
}

TEST(StreamIntegratorTest, PositionJitterScattersStreams) {
    SimulationConfig config = quiet_config(50.0);
    config.stream_velocity_jitter = 0.0;
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(5);

    Faucet faucet = still_faucet({500.0, 500.0}, {1.0, 0.0}, {0.1, 0.0, 0.0});
    faucet.position_spread = {30.0, 30.0};

    double min_x = 500.0;
    double max_x = 500.0;
    for (int i = 0; i < 50; ++i) {
        const StreamState state = integrator.spawn(faucet, rng);
        EXPECT_FALSE(state.position.x == 500.0 && state.position.y == 500.0);
        EXPECT_EQ(state.velocity.x, 1.0);
        EXPECT_EQ(state.velocity.y, 0.0);
        min_x = std::min(min_x, state.position.x);
        max_x = std::max(max_x, state.position.x);
    }
    EXPECT_LT(min_x, 490.0);
    EXPECT_GT(max_x, 510.0);
}

TEST(StreamIntegratorTest, FadedStreamsStopBeforeTheirBudget) {
    SimulationConfig config = quiet_config(10.0);
    config.visibility_threshold = 0.1;
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({10.5, 10.5}, {1.0, 0.0}, {0.5, 0.0, 0.0}), rng);
    EXPECT_EQ(state.age_budget, 100u);

    Canvas canvas(config.size);
    const StreamOutcome outcome = integrator.integrate(state, canvas);
    EXPECT_EQ(outcome.status, StreamStatus::Decayed);
    EXPECT_EQ(outcome.steps_taken, 17u);
    EXPECT_LT(state.age, state.age_budget);
    EXPECT_LT(state.color.max_abs(), 0.1);
    EXPECT_EQ(lit_pixels(canvas.snapshot()), 17u);
}

TEST(StreamIntegratorTest, NoForcesDrawsStraightLine) {
    const SimulationConfig config = quiet_config(50.0);
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({10.5, 10.5}, {1.0, 0.0}, {0.5, 0.0, 0.0}), rng);
    EXPECT_DOUBLE_EQ(state.decay_factor, 50.0);
    EXPECT_EQ(state.age_budget, 500u);

    Canvas canvas(config.size);
    const StreamOutcome outcome = integrator.integrate(state, canvas);
    EXPECT_EQ(outcome.status, StreamStatus::Decayed);
    EXPECT_EQ(outcome.steps_taken, 500u);
    EXPECT_DOUBLE_EQ(state.position.y, 10.5);

    const Grid grid = std::move(canvas).finalize();
    EXPECT_EQ(lit_pixels(grid), 500u);
    EXPECT_DOUBLE_EQ(grid.at(10, 10).r, 0.5);
    EXPECT_NEAR(grid.at(11, 10).r, 0.5 * std::exp(-1.0 / 50.0), 1e-12);
    EXPECT_GT(grid.at(509, 10).r, 0.0);
    EXPECT_TRUE(grid.at(510, 10).is_zero());
    EXPECT_TRUE(grid.at(10, 9).is_zero());
    EXPECT_TRUE(grid.at(10, 11).is_zero());
}

TEST(StreamIntegratorTest, FastStreamsDrawConnectedSegments) {
    const SimulationConfig config = quiet_config(100.0);
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({0.5, 20.5}, {3.0, 0.0}, {0.0, 1.0, 0.0}), rng);
    Canvas canvas(config.size);
    for (int i = 0; i < 10; ++i) {
        integrator.advance(state, canvas);
    }
    EXPECT_EQ(state.age, 30u);
    for (int x = 0; x < 30; ++x) {
        EXPECT_GT(canvas.at(x, 20).g, 0.0) << "gap at x=" << x;
    }
    EXPECT_TRUE(canvas.at(30, 20).is_zero());
}

TEST(StreamIntegratorTest, CapsHoldAfterEveryStep) {
    SimulationConfig config;
    config.size = 200;
    config.num_forces = 30;
    config.force_strength_dist = rivulet::sim::log_dist(5000.0, 2.0);
    config.force_spread_dist = rivulet::sim::log_dist(20.0, 2.0);
    config.force_kind_weights = {1.0, 1.0, 1.0};
    config.velocity_cap = 3.0;
    config.color_cap = 0.2;
    config.max_decay_factor = 50.0;
    config.bounds_margin = 1.0;

    Rng rng(17);
    const ForceField field = ForceField::generate(config, rng);
    const StreamIntegrator integrator(config, field);
    const std::uint64_t bound = rivulet::sim::max_steps_bound(config);

    for (int s = 0; s < 50; ++s) {
        StreamState state = integrator.spawn(
            still_faucet({100.0, 100.0}, {10.0, -10.0}, {1.0, -1.0, 0.5}), rng);
        EXPECT_LE(state.color.max_abs(), config.color_cap);
        EXPECT_LE(std::abs(state.velocity.x), config.velocity_cap);

        Canvas canvas(config.size);
        while (state.active()) {
            integrator.advance(state, canvas);
            ASSERT_LE(std::abs(state.velocity.x), config.velocity_cap);
            ASSERT_LE(std::abs(state.velocity.y), config.velocity_cap);
            ASSERT_LE(state.color.max_abs(), config.color_cap);
            ASSERT_LE(state.steps_taken, bound);
        }
    }
}

TEST(StreamIntegratorTest, StepCountIsBounded) {
    SimulationConfig config;
    config.size = 300;
    config.num_forces = 20;
    config.max_decay_factor = 40.0;
    config.bounds_margin = 10.0;

    Rng rng(3);
    const ForceField field = ForceField::generate(config, rng);
    const FaucetSet faucets = FaucetSet::generate(config, rng);
    const StreamIntegrator integrator(config, field);
    const std::uint64_t bound = rivulet::sim::max_steps_bound(config);
    EXPECT_EQ(bound, 400u);

    Canvas canvas(config.size);
    for (std::size_t i = 0; i < 500; ++i) {
        StreamState state = integrator.spawn(faucets.faucet_for_stream(i), rng);
        const StreamOutcome outcome = integrator.integrate(state, canvas);
        EXPECT_NE(outcome.status, StreamStatus::Active);
        EXPECT_LE(outcome.steps_taken, bound);
    }
}

TEST(StreamIntegratorTest, ZeroDecayStopsAfterOneStep) {
    SimulationConfig config = quiet_config(50.0);
    config.max_decay_factor = 0.0;
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({10.0, 10.0}, {5.0, 5.0}, {1.0, 1.0, 1.0}), rng);
    EXPECT_EQ(state.decay_factor, 0.0);

    Canvas canvas(config.size);
    const StreamOutcome outcome = integrator.integrate(state, canvas);
    EXPECT_EQ(outcome.status, StreamStatus::Decayed);
    EXPECT_EQ(outcome.steps_taken, 1u);
    EXPECT_LE(lit_pixels(canvas.snapshot()), 1u);
}

TEST(StreamIntegratorTest, LeavingTheCanvasTerminates) {
    const SimulationConfig config = quiet_config(1000.0);
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({998.5, 500.5}, {1.0, 0.0}, {0.1, 0.1, 0.1}), rng);
    Canvas canvas(config.size);
    const StreamOutcome outcome = integrator.integrate(state, canvas);
    EXPECT_EQ(outcome.status, StreamStatus::OutOfBounds);
    EXPECT_EQ(outcome.steps_taken, 2u);
    EXPECT_GT(canvas.at(998, 500).r, 0.0);
    EXPECT_GT(canvas.at(999, 500).r, 0.0);
}

TEST(StreamIntegratorTest, SpawnOutsideBoundsNeverSteps) {
    const SimulationConfig config = quiet_config(1000.0);
    const ForceField field;
    const StreamIntegrator integrator(config, field);
    Rng rng(0);

    StreamState state = integrator.spawn(still_faucet({-5.0, -5.0}, {1.0, 1.0}, {0.1, 0.1, 0.1}), rng);
    EXPECT_EQ(state.status, StreamStatus::OutOfBounds);

    Canvas canvas(config.size);
    const StreamOutcome outcome = integrator.integrate(state, canvas);
    EXPECT_EQ(outcome.status, StreamStatus::OutOfBounds);
    EXPECT_EQ(outcome.steps_taken, 0u);
    EXPECT_EQ(lit_pixels(canvas.snapshot()), 0u);
}

TEST(StreamIntegratorTest, MarginKeepsStreamsAliveOffCanvas) {
    SimulationConfig config = quiet_config(1000.0);
    config.size = 100;
    config.bounds_margin = 1.0;
    const ForceField field;
    const StreamIntegrator integrator(config, field);

    EXPECT_TRUE(integrator.in_bounds(Vec2{-99.0, 150.0}));
    EXPECT_FALSE(integrator.in_bounds(Vec2{-101.0, 50.0}));
    EXPECT_FALSE(integrator.in_bounds(Vec2{50.0, 200.0}));
}
