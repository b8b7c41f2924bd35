#pragma once

#include <cstddef>
#include <vector>

#include "sim/distribution.h"
#include "sim/simulation_config.h"
#include "sim/vec2.h"

namespace rivulet {
namespace sim {

enum class ForceKind {
    Inward,  // pulls toward the force center
    Outward, // pushes away from the force center
    Linear,  // pushes along a fixed direction
};

struct Force {
    Vec2 position{};
    double strength = 0.0;
    double spread = 1.0;
    ForceKind kind = ForceKind::Inward;
    Vec2 direction{}; // unit vector, only used by Linear forces

    // Gaussian falloff in distance, bounded by |strength| / spread.
    double magnitude_at(double distance) const;
    Vec2 apply(const Vec2& target) const;
};

class ForceField {
public:
    ForceField() = default;
    explicit ForceField(std::vector<Force> forces);

    // Draws config.num_forces forces from rng. Throws ConfigurationError on an invalid config.
    static ForceField generate(const SimulationConfig& config, Rng& rng);

    Vec2 field_at(const Vec2& position) const;

    const std::vector<Force>& forces() const { return forces_; }
    std::size_t size() const { return forces_.size(); }

private:
    std::vector<Force> forces_;
};

const char* to_string(ForceKind kind);

} // namespace sim
} // namespace rivulet
