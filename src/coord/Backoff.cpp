#include "coord/Backoff.hpp"

#include <algorithm>
#include <cmath>

using namespace wtc::coord;

Backoff::Backoff(const config::BackoffConfig& cfg)
    : cfg_(cfg), rng_(std::random_device{}()) {}

std::chrono::milliseconds Backoff::nominal(const unsigned int attempt) const {
    const double raw = static_cast<double>(cfg_.base.count()) * std::pow(cfg_.factor, attempt);
    const double capped = std::min(raw, static_cast<double>(cfg_.cap.count()));
    return std::chrono::milliseconds(static_cast<long>(capped));
}

std::chrono::milliseconds Backoff::next() {
    const auto d = nominal(attempt_++).count();
    if (d <= 1) return std::chrono::milliseconds(d);
    std::uniform_int_distribution<long> dist(d / 2, d);
    return std::chrono::milliseconds(dist(rng_));
}
