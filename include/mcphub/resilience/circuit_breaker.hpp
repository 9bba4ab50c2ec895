#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Per-connection failure counter that short-circuits requests once a server
// is judged unhealthy.
//
// State Machine:
//
//   ┌─────────┐  failure_threshold    ┌────────┐
//   │ CLOSED  │ ─────────────────────▶│  OPEN  │◀──────────────┐
//   └────▲────┘   recorded failures   └────┬───┘               │
//        │                                 │ reset_timeout     │
//        │                                 │ elapsed, next     │ failures reach
//        │                                 │ allow_request()   │ threshold
//        │                                 ▼                   │
//        │         success           ┌──────────┐              │
//        └───────────────────────────│HALF_OPEN │──────────────┘
//                                    └──────────┘
//
// Half-open admits every request. A success there resets the failure count
// and closes the circuit; a success in any other state changes nothing.
// Failures always increment the count and stamp the failure time.
//
// Usage:
//   CircuitBreaker breaker(CircuitBreakerConfig{
//       .failure_threshold = 5,
//       .reset_timeout = std::chrono::seconds(60)
//   });
//
//   if (!breaker.allow_request()) {
//       return tl::unexpected(ClientError::circuit_open(...));
//   }
//   auto result = co_await send(...);
//   result ? breaker.record_success() : breaker.record_failure();

#include "mcphub/client/config_error.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker State
// ─────────────────────────────────────────────────────────────────────────────

enum class CircuitState {
    Closed,    ///< Normal operation, requests pass through
    Open,      ///< Circuit tripped, requests rejected immediately
    HalfOpen   ///< Cool-down elapsed, requests probe the server
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerConfig {
    /// Number of recorded failures before opening the circuit
    std::size_t failure_threshold{5};

    /// Time after the last failure before an open circuit lets a request through
    std::chrono::milliseconds reset_timeout{60000};

    /// Name used in log lines, usually the server name
    std::string name{"default"};

    static ConfigResult<CircuitBreakerConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Statistics
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitBreakerStats {
    std::size_t total_requests{0};
    std::size_t successful_requests{0};
    std::size_t failed_requests{0};
    std::size_t rejected_requests{0};  ///< Requests rejected due to open circuit
    std::size_t state_transitions{0};
    std::size_t failure_count{0};      ///< Failures counted toward the threshold
    CircuitState current_state{CircuitState::Closed};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() = default;
    explicit CircuitBreaker(CircuitBreakerConfig config);

    // Non-copyable, non-movable (due to mutex)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Core Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Returns false while open and the reset timeout has not elapsed.
    /// An open circuit whose timeout has elapsed moves to half-open and admits.
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    // ─────────────────────────────────────────────────────────────────────────
    // State Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] bool is_open() const;
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t failure_count() const;
    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Manual Control
    // ─────────────────────────────────────────────────────────────────────────

    void force_open();
    void force_close();

    /// Reset state and statistics
    void reset();

    // ─────────────────────────────────────────────────────────────────────────
    // Callbacks
    // ─────────────────────────────────────────────────────────────────────────

    void on_state_change(StateChangeCallback callback);

private:
    // A state change decided under the lock and announced after it.
    struct Transition {
        CircuitState from;
        CircuitState to;
        std::vector<StateChangeCallback> callbacks;
    };

    // Caller must hold mutex_. Returns nothing when already in `to`.
    std::optional<Transition> move_to_locked(CircuitState to);
    void announce(const std::optional<Transition>& transition) const;
    bool cool_down_elapsed_locked() const;

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::size_t failure_count_{0};
    std::optional<std::chrono::steady_clock::time_point> last_failure_time_;

    // Statistics
    std::atomic<std::size_t> total_requests_{0};
    std::atomic<std::size_t> successful_requests_{0};
    std::atomic<std::size_t> failed_requests_{0};
    std::atomic<std::size_t> rejected_requests_{0};
    std::atomic<std::size_t> state_transitions_{0};

    std::vector<StateChangeCallback> state_change_callbacks_;
};

}  // namespace mcphub
