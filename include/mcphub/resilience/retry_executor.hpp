#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Retry Executor
// ═══════════════════════════════════════════════════════════════════════════
// Runs a coroutine operation up to max_retries + 1 times, waiting on an asio
// timer between attempts.
//
// Usage:
//   RetryExecutor retry(executor, server_config.retry_policy);
//   auto result = co_await retry.run<Json>([&]() -> asio::awaitable<ClientResult<Json>> {
//       co_return co_await send_once(method, params);
//   });
//
// Failures that is_retryable() rejects (breaker open, transport failures,
// cancellation) are returned immediately without waiting.

#include "mcphub/client/client_error.hpp"
#include "mcphub/client/config_error.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/resilience/backoff_policy.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────

struct RetryPolicy {
    /// Retries after the initial attempt
    std::size_t max_retries{3};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier{2.0};

    [[nodiscard]] std::shared_ptr<IBackoffPolicy> make_backoff() const {
        return std::make_shared<ExponentialBackoff>(
            initial_delay, backoff_multiplier, max_delay, 0.0);
    }

    static ConfigResult<RetryPolicy> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(ConfigError{"'retryPolicy' must be an object"});
        }

        RetryPolicy policy;
        auto max_retries = config_field::count(j, "maxRetries", static_cast<std::int64_t>(policy.max_retries));
        if (!max_retries) {
            return tl::unexpected(max_retries.error());
        }
        auto initial_delay = config_field::millis(j, "initialDelay", policy.initial_delay);
        if (!initial_delay) {
            return tl::unexpected(initial_delay.error());
        }
        auto max_delay = config_field::millis(j, "maxDelay", policy.max_delay);
        if (!max_delay) {
            return tl::unexpected(max_delay.error());
        }
        auto multiplier = config_field::number(j, "backoffMultiplier", policy.backoff_multiplier);
        if (!multiplier) {
            return tl::unexpected(multiplier.error());
        }

        policy.max_retries = static_cast<std::size_t>(*max_retries);
        policy.initial_delay = *initial_delay;
        policy.max_delay = *max_delay;
        policy.backoff_multiplier = *multiplier;
        return policy;
    }

    [[nodiscard]] nlohmann::json to_json() const {
        return {
            {"maxRetries", max_retries},
            {"initialDelay", initial_delay.count()},
            {"maxDelay", max_delay.count()},
            {"backoffMultiplier", backoff_multiplier}
        };
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryExecutor
// ─────────────────────────────────────────────────────────────────────────────

class RetryExecutor {
public:
    using RetryPredicate = std::function<bool(const ClientError&)>;
    using RetryCallback = std::function<void(
        std::size_t attempt, std::chrono::milliseconds delay, const ClientError& error)>;

    RetryExecutor(asio::any_io_executor executor,
                  RetryPolicy policy,
                  std::shared_ptr<IBackoffPolicy> backoff = nullptr)
        : executor_(std::move(executor))
        , policy_(policy)
        , backoff_(backoff ? std::move(backoff) : policy.make_backoff())
    {}

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

    /// Observe each retry: attempt is the 1-based number of the failed attempt.
    void on_retry(RetryCallback callback) { on_retry_ = std::move(callback); }

    template <typename T>
    asio::awaitable<ClientResult<T>> run(
        std::function<asio::awaitable<ClientResult<T>>()> operation,
        RetryPredicate should_retry = is_retryable
    ) {
        backoff_->reset();
        const std::size_t max_attempts = policy_.max_retries + 1;

        for (std::size_t attempt = 0;; ++attempt) {
            auto result = co_await operation();
            if (result.has_value()) {
                co_return result;
            }

            const bool last_attempt = (attempt + 1 >= max_attempts);
            if (last_attempt || !should_retry(result.error())) {
                co_return result;
            }

            const auto delay = backoff_->next_delay(attempt);
            MCPHUB_LOG_WARN("attempt {}/{} failed ({}: {}), retrying in {} ms",
                            attempt + 1, max_attempts,
                            to_string(result.error().code), result.error().message,
                            delay.count());
            if (on_retry_) {
                on_retry_(attempt + 1, delay, result.error());
            }

            if (delay.count() > 0) {
                asio::steady_timer timer(executor_, delay);
                auto [ec] = co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
                if (ec) {
                    co_return tl::unexpected(ClientError::cancelled("retry wait cancelled"));
                }
            }
        }
    }

private:
    asio::any_io_executor executor_;
    RetryPolicy policy_;
    std::shared_ptr<IBackoffPolicy> backoff_;
    RetryCallback on_retry_;
};

}  // namespace mcphub
