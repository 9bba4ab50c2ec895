#ifndef MCPHUB_RESILIENCE_BACKOFF_POLICY_HPP
#define MCPHUB_RESILIENCE_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long RetryExecutor sleeps before retry number `attempt` (0 = the wait
// after the first failed attempt). RetryExecutor calls reset() once per run.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay(n) = min(initial * multiplier^n, max), optionally scaled by a random
// factor in [1 - jitter, 1 + jitter].
//
// With the retry defaults (1000ms, x2, cap 10s):
//   1000, 2000, 4000, 8000, 10000, 10000, ...

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{1000}, 2.0,
                             std::chrono::milliseconds{10'000}, 0.0) {}

    ExponentialBackoff(std::chrono::milliseconds initial,
                       double multiplier,
                       std::chrono::milliseconds max,
                       double jitter_factor)
        : initial_ms_(static_cast<double>(initial.count()))
        , multiplier_(multiplier)
        , max_ms_(static_cast<double>(max.count()))
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        double delay_ms = initial_ms_ * std::pow(multiplier_, static_cast<double>(attempt));
        delay_ms = std::min(delay_ms, max_ms_);

        if (jitter_factor_ > 0.0) {
            std::uniform_real_distribution<double> spread(1.0 - jitter_factor_, 1.0 + jitter_factor_);
            delay_ms *= spread(rng_);
        }
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, delay_ms))};
    }

    void reset() override {}

private:
    double initial_ms_;
    double multiplier_;
    double max_ms_;
    double jitter_factor_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff
// ─────────────────────────────────────────────────────────────────────────────
// Retries immediately. Used by tests to keep retry loops fast.

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t) override { return std::chrono::milliseconds{0}; }
    void reset() override {}
};

}  // namespace mcphub

#endif  // MCPHUB_RESILIENCE_BACKOFF_POLICY_HPP
