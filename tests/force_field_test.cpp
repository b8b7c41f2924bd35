#include <gtest/gtest.h>

#include <cmath>

#include "sim/force_field.h"
#include "sim/simulation_config.h"

using rivulet::sim::Force;
using rivulet::sim::ForceField;
using rivulet::sim::ForceKind;
using rivulet::sim::Rng;
using rivulet::sim::SimulationConfig;
using rivulet::sim::Vec2;

namespace {

Force make_force(ForceKind kind, double strength, double spread) {
    Force force;
    force.position = Vec2{100.0, 100.0};
    force.strength = strength;
    force.spread = spread;
    force.kind = kind;
    force.direction = Vec2{1.0, 0.0};
    return force;
}

} // namespace

TEST(ForceFieldTest, ZeroStrengthGivesZeroVector) {
    const ForceField field({make_force(ForceKind::Inward, 0.0, 50.0),
                            make_force(ForceKind::Outward, 0.0, 20.0),
                            make_force(ForceKind::Linear, 0.0, 10.0)});
    for (double x = 0.0; x < 200.0; x += 13.0) {
        const Vec2 f = field.field_at(Vec2{x, 37.0});
        EXPECT_EQ(f.x, 0.0);
        EXPECT_EQ(f.y, 0.0);
    }
}

TEST(ForceFieldTest, EmptyFieldIsZero) {
    const ForceField field;
    const Vec2 f = field.field_at(Vec2{1.0, 2.0});
    EXPECT_EQ(f.x, 0.0);
    EXPECT_EQ(f.y, 0.0);
}

TEST(ForceFieldTest, InwardPullsTowardCenter) {
    const Force force = make_force(ForceKind::Inward, 10.0, 50.0);
    const Vec2 right = force.apply(Vec2{130.0, 100.0});
    EXPECT_LT(right.x, 0.0);
    EXPECT_NEAR(right.y, 0.0, 1e-15);

    const Vec2 below = force.apply(Vec2{100.0, 60.0});
    EXPECT_GT(below.y, 0.0);
}

TEST(ForceFieldTest, OutwardPushesAway) {
    const Force force = make_force(ForceKind::Outward, 10.0, 50.0);
    const Vec2 right = force.apply(Vec2{130.0, 100.0});
    EXPECT_GT(right.x, 0.0);
}

TEST(ForceFieldTest, RadialForceIsZeroAtItsCenter) {
    const Force force = make_force(ForceKind::Inward, 10.0, 50.0);
    const Vec2 f = force.apply(force.position);
    EXPECT_EQ(f.x, 0.0);
    EXPECT_EQ(f.y, 0.0);
}

TEST(ForceFieldTest, LinearFollowsDirection) {
    const Force force = make_force(ForceKind::Linear, 10.0, 50.0);
    const Vec2 f = force.apply(Vec2{90.0, 120.0});
    EXPECT_GT(f.x, 0.0);
    EXPECT_EQ(f.y, 0.0);
}

TEST(ForceFieldTest, MagnitudeIsMonotoneAndBounded) {
    const Force force = make_force(ForceKind::Inward, 10.0, 200.0);
    const double bound = force.strength / force.spread;
    double previous = force.magnitude_at(0.0);
    EXPECT_DOUBLE_EQ(previous, bound);
    for (double d = 1.0; d < 2000.0; d += 7.0) {
        const double current = force.magnitude_at(d);
        EXPECT_LE(current, previous);
        EXPECT_LE(current, bound);
        EXPECT_GE(current, 0.0);
        previous = current;
    }
    EXPECT_LT(force.magnitude_at(2000.0), 1e-12);
}

TEST(ForceFieldTest, GenerateDrawsConfiguredForces) {
    SimulationConfig config;
    config.size = 300;
    config.num_forces = 50;
    Rng rng(1);
    const ForceField field = ForceField::generate(config, rng);

    ASSERT_EQ(field.size(), 50u);
    for (const Force& force : field.forces()) {
        EXPECT_GE(force.position.x, 0.0);
        EXPECT_LT(force.position.x, 300.0);
        EXPECT_GE(force.position.y, 0.0);
        EXPECT_LT(force.position.y, 300.0);
        EXPECT_GT(force.spread, 0.0);
        EXPECT_GT(force.strength, 0.0);
        EXPECT_EQ(force.kind, ForceKind::Inward);
    }
}

TEST(ForceFieldTest, KindWeightsSelectKinds) {
    SimulationConfig config;
    config.num_forces = 20;
    config.force_kind_weights = {0.0, 0.0, 1.0};
    Rng rng(2);
    const ForceField field = ForceField::generate(config, rng);
    for (const Force& force : field.forces()) {
        EXPECT_EQ(force.kind, ForceKind::Linear);
        EXPECT_NEAR(force.direction.length(), 1.0, 1e-12);
    }
}

TEST(ForceFieldTest, GenerateRejectsSignedSpread) {
    SimulationConfig config;
    config.force_spread_dist = rivulet::sim::NormalDist{200.0, 10.0};
    Rng rng(0);
    EXPECT_THROW(ForceField::generate(config, rng), rivulet::ConfigurationError);
}
