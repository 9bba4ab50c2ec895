#include "mcphub/resilience/circuit_breaker.hpp"

#include "mcphub/log/logger.hpp"

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<CircuitBreakerConfig> CircuitBreakerConfig::from_json(const nlohmann::json& j) {
    CircuitBreakerConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        return tl::unexpected(ConfigError{"circuit breaker settings must be an object"});
    }

    auto threshold = config_field::count(j, "threshold", static_cast<std::int64_t>(config.failure_threshold));
    if (!threshold) {
        return tl::unexpected(threshold.error());
    }
    if (*threshold == 0) {
        return tl::unexpected(ConfigError{"'threshold' must be at least 1"});
    }
    auto reset_timeout = config_field::millis(j, "resetTimeout", config.reset_timeout);
    if (!reset_timeout) {
        return tl::unexpected(reset_timeout.error());
    }

    config.failure_threshold = static_cast<std::size_t>(*threshold);
    config.reset_timeout = *reset_timeout;
    return config;
}

nlohmann::json CircuitBreakerConfig::to_json() const {
    return {
        {"threshold", failure_threshold},
        {"resetTimeout", reset_timeout.count()}
    };
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Request Accounting
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitBreaker::allow_request() {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CircuitState::Open) {
            if (!cool_down_elapsed_locked()) {
                rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            transition = move_to_locked(CircuitState::HalfOpen);
        }
    }
    announce(transition);
    return true;
}

void CircuitBreaker::record_success() {
    successful_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != CircuitState::HalfOpen) {
            return;
        }
        failure_count_ = 0;
        transition = move_to_locked(CircuitState::Closed);
    }
    announce(transition);
}

void CircuitBreaker::record_failure() {
    failed_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failure_count_;
        last_failure_time_ = std::chrono::steady_clock::now();
        if (failure_count_ >= config_.failure_threshold) {
            transition = move_to_locked(CircuitState::Open);
        }
    }
    announce(transition);
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::is_open() const {
    return state() == CircuitState::Open;
}

bool CircuitBreaker::is_closed() const {
    return state() == CircuitState::Closed;
}

std::size_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    CircuitBreakerStats snapshot;
    snapshot.total_requests = total_requests_.load(std::memory_order_relaxed);
    snapshot.successful_requests = successful_requests_.load(std::memory_order_relaxed);
    snapshot.failed_requests = failed_requests_.load(std::memory_order_relaxed);
    snapshot.rejected_requests = rejected_requests_.load(std::memory_order_relaxed);
    snapshot.state_transitions = state_transitions_.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.failure_count = failure_count_;
    snapshot.current_state = state_;
    return snapshot;
}

// ─────────────────────────────────────────────────────────────────────────────
// Manual Control
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::force_open() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Stamping the time restarts the cool-down.
        last_failure_time_ = std::chrono::steady_clock::now();
        transition = move_to_locked(CircuitState::Open);
    }
    announce(transition);
}

void CircuitBreaker::force_close() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_count_ = 0;
        transition = move_to_locked(CircuitState::Closed);
    }
    announce(transition);
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failure_count_ = 0;
    last_failure_time_.reset();

    for (auto* counter : {&total_requests_, &successful_requests_, &failed_requests_,
                          &rejected_requests_, &state_transitions_}) {
        counter->store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────────────────────────────────────

std::optional<CircuitBreaker::Transition> CircuitBreaker::move_to_locked(CircuitState to) {
    if (state_ == to) {
        return std::nullopt;
    }
    Transition transition{state_, to, state_change_callbacks_};
    state_ = to;
    state_transitions_.fetch_add(1, std::memory_order_relaxed);
    return transition;
}

void CircuitBreaker::announce(const std::optional<Transition>& transition) const {
    if (!transition) {
        return;
    }
    MCPHUB_LOG_WARN("circuit breaker '{}': {} -> {}",
                    config_.name, to_string(transition->from), to_string(transition->to));
    for (const auto& callback : transition->callbacks) {
        callback(transition->from, transition->to);
    }
}

bool CircuitBreaker::cool_down_elapsed_locked() const {
    if (!last_failure_time_) {
        return true;
    }
    return std::chrono::steady_clock::now() - *last_failure_time_ > config_.reset_timeout;
}

}  // namespace mcphub
