#pragma once

#include <iosfwd>
#include <random>
#include <string>
#include <variant>

#include "sim/vec2.h"

namespace rivulet {
namespace sim {

using Rng = std::mt19937_64;

struct NormalDist {
    double mean = 0.0;
    double std_dev = 1.0;
};

// exp() of a draw from the underlying normal.
struct LogNormalDist {
    NormalDist norm{};
};

// Mean is lambda_inverse, so the rate is 1 / lambda_inverse.
struct ExpDist {
    double lambda_inverse = 1.0;
};

using Distribution = std::variant<NormalDist, LogNormalDist, ExpDist>;

// LogNormal whose median is `median` and whose one-sigma multiplicative spread is `factor`.
LogNormalDist log_dist(double median, double factor);

double sample(const Distribution& dist, Rng& rng);

// Absolute value of a draw with a random sign applied; sign and magnitude are independent.
double sample_signed(const Distribution& dist, Rng& rng);

double standard_normal(Rng& rng);
double uniform01(Rng& rng);
Vec2 sample_direction(Rng& rng);

bool is_valid(const Distribution& dist);
bool has_positive_support(const Distribution& dist);

std::string describe(const Distribution& dist);
std::ostream& operator<<(std::ostream& os, const Distribution& dist);

} // namespace sim
} // namespace rivulet
