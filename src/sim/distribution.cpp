#include "sim/distribution.h"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>

namespace rivulet {
namespace sim {
namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

constexpr double kTwoPi = 6.28318530717958647692;

bool finite_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

LogNormalDist log_dist(double median, double factor) {
    return LogNormalDist{NormalDist{std::log(median), std::log(factor)}};
}

double sample(const Distribution& dist, Rng& rng) {
    return std::visit(overloaded{
                          [&](const NormalDist& d) {
                              std::normal_distribution<double> normal(d.mean, d.std_dev);
                              return normal(rng);
                          },
                          [&](const LogNormalDist& d) {
                              std::lognormal_distribution<double> lognormal(d.norm.mean, d.norm.std_dev);
                              return lognormal(rng);
                          },
                          [&](const ExpDist& d) {
                              std::exponential_distribution<double> exponential(1.0 / d.lambda_inverse);
                              return exponential(rng);
                          },
                      },
                      dist);
}

double sample_signed(const Distribution& dist, Rng& rng) {
    const double magnitude = std::abs(sample(dist, rng));
    return uniform01(rng) < 0.5 ? -magnitude : magnitude;
}

double standard_normal(Rng& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);
    return normal(rng);
}

double uniform01(Rng& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    // generate_canonical may round up to 1.0 on some standard libraries.
    return std::min(unit(rng), std::nextafter(1.0, 0.0));
}

Vec2 sample_direction(Rng& rng) {
    const double angle = uniform01(rng) * kTwoPi;
    return Vec2{std::cos(angle), std::sin(angle)};
}

bool is_valid(const Distribution& dist) {
    return std::visit(overloaded{
                          [](const NormalDist& d) {
                              return std::isfinite(d.mean) && finite_positive(d.std_dev);
                          },
                          [](const LogNormalDist& d) {
                              return std::isfinite(d.norm.mean) && finite_positive(d.norm.std_dev);
                          },
                          [](const ExpDist& d) { return finite_positive(d.lambda_inverse); },
                      },
                      dist);
}

bool has_positive_support(const Distribution& dist) {
    return !std::holds_alternative<NormalDist>(dist);
}

std::string describe(const Distribution& dist) {
    std::ostringstream oss;
    std::visit(overloaded{
                   [&](const NormalDist& d) {
                       oss << "Normal { mean: " << d.mean << ", std_dev: " << d.std_dev << " }";
                   },
                   [&](const LogNormalDist& d) {
                       oss << "LogNormal { norm: Normal { mean: " << d.norm.mean
                           << ", std_dev: " << d.norm.std_dev << " } }";
                   },
                   [&](const ExpDist& d) {
                       oss << "Exp { lambda_inverse: " << d.lambda_inverse << " }";
                   },
               },
               dist);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Distribution& dist) {
    return os << describe(dist);
}

} // namespace sim
} // namespace rivulet
