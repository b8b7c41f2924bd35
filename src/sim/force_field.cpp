#include "sim/force_field.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace rivulet {
namespace sim {
namespace {
ForceKind sample_kind(const ForceKindWeights& weights, Rng& rng) {
    const std::array<double, 3> table{weights.inward, weights.outward, weights.linear};
    int positive = 0;
    std::size_t last_positive = 0;
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (table[i] > 0.0) {
            ++positive;
            last_positive = i;
        }
    }
    if (positive <= 1) {
        return static_cast<ForceKind>(last_positive);
    }

    std::discrete_distribution<int> pick(table.begin(), table.end());
    return static_cast<ForceKind>(pick(rng));
}
} // namespace

double Force::magnitude_at(double distance) const {
    const double num_devs = distance / spread;
    return strength / spread * std::exp(-num_devs * num_devs / 2.0);
}

Vec2 Force::apply(const Vec2& target) const {
    const Vec2 offset = target - position;
    const double distance = offset.length();
    const double push = magnitude_at(distance);

    switch (kind) {
    case ForceKind::Inward:
        if (distance <= 0.0) {
            return Vec2{};
        }
        return offset * (-push / distance);
    case ForceKind::Outward:
        if (distance <= 0.0) {
            return Vec2{};
        }
        return offset * (push / distance);
    case ForceKind::Linear:
        return direction * push;
    }
    return Vec2{};
}

ForceField::ForceField(std::vector<Force> forces) : forces_(std::move(forces)) {}

ForceField ForceField::generate(const SimulationConfig& config, Rng& rng) {
    validate(config);

    const double extent = static_cast<double>(config.size);
    std::vector<Force> forces;
    forces.reserve(static_cast<std::size_t>(config.num_forces));

    for (int i = 0; i < config.num_forces; ++i) {
        Force force;
        force.position = Vec2{uniform01(rng) * extent, uniform01(rng) * extent};
        force.kind = sample_kind(config.force_kind_weights, rng);
        if (force.kind == ForceKind::Linear) {
            force.direction = sample_direction(rng);
        }
        force.strength = sample(config.force_strength_dist, rng);
        force.spread = std::max(sample(config.force_spread_dist, rng), std::numeric_limits<double>::min());
        forces.push_back(force);
    }

    return ForceField(std::move(forces));
}

Vec2 ForceField::field_at(const Vec2& position) const {
    Vec2 net{};
    for (const Force& force : forces_) {
        net += force.apply(position);
    }
    return net;
}

const char* to_string(ForceKind kind) {
    switch (kind) {
    case ForceKind::Inward:
        return "inward";
    case ForceKind::Outward:
        return "outward";
    case ForceKind::Linear:
        return "linear";
    }
    return "unknown";
}

} // namespace sim
} // namespace rivulet
