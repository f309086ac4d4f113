#include "mcpcall/transport/backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace mcpcall {

namespace {

double jitter_scale(double jitter) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> spread(1.0 - jitter, 1.0 + jitter);
    return spread(rng);
}

}  // namespace

ExponentialBackoff::ExponentialBackoff()
    : ExponentialBackoff(std::chrono::milliseconds{500}, 2.0, std::chrono::milliseconds{5'000}, 0.25)
{}

ExponentialBackoff::ExponentialBackoff(
    std::chrono::milliseconds base,
    double multiplier,
    std::chrono::milliseconds max,
    double jitter
)
    : base_(base)
    , multiplier_(std::max(1.0, multiplier))
    , max_(std::max(base, max))
    , jitter_(std::clamp(jitter, 0.0, 1.0))
{}

std::chrono::milliseconds ExponentialBackoff::next_delay(std::size_t failures) {
    const double grown = static_cast<double>(base_.count()) * std::pow(multiplier_, static_cast<double>(failures));
    double delay = std::min(grown, static_cast<double>(max_.count()));
    if (jitter_ > 0.0) {
        delay *= jitter_scale(jitter_);
    }
    return std::chrono::milliseconds{std::llround(std::max(0.0, delay))};
}

}  // namespace mcpcall
