#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <random>

namespace wtc::coord {

// Exponential backoff with equal jitter: attempt k sleeps in [d/2, d] with d = min(cap, base * factor^k).
class Backoff {
public:
    explicit Backoff(const config::BackoffConfig& cfg);

    std::chrono::milliseconds next();

    [[nodiscard]] std::chrono::milliseconds nominal(unsigned int attempt) const;

    [[nodiscard]] unsigned int attempts() const noexcept { return attempt_; }

    void reset() noexcept { attempt_ = 0; }

private:
    config::BackoffConfig cfg_;
    unsigned int attempt_ = 0;
    std::mt19937 rng_;
};

}
