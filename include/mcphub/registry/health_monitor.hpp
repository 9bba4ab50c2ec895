#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Health Monitor
// ═══════════════════════════════════════════════════════════════════════════
// Periodically logs the registry's health report and reconnects servers whose
// connection ended in the error state (when they are configured for
// auto-connect).
//
// The monitor must be owned by a std::shared_ptr; its loop keeps it alive
// until stop() is called. A check reads the registry only before its first
// suspension and holds the clients it reconnects by shared_ptr, so the owner
// may call stop() and destroy the registry while a reconnect is in flight.
// Once stopped, no further reconnect is started and one that completes is
// disconnected again.

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace mcphub {

class ServerRegistry;
struct HealthReport;

class HealthMonitor : public std::enable_shared_from_this<HealthMonitor> {
public:
    using CheckCallback = std::function<void(const HealthReport&)>;

    HealthMonitor(asio::any_io_executor executor,
                  ServerRegistry& registry,
                  std::chrono::milliseconds interval);

    /// No-op once stop() has been called; create a new monitor instead.
    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] bool is_stopped() const noexcept { return stopped_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] std::size_t checks_completed() const noexcept { return checks_.load(); }

    /// Observe each completed check, after reconnect attempts.
    void on_check(CheckCallback callback) { on_check_ = std::move(callback); }

    /// Run one check now: log the report and reconnect failed servers.
    asio::awaitable<void> check_once();

private:
    asio::awaitable<void> run_loop();

    ServerRegistry& registry_;
    std::chrono::milliseconds interval_;
    asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> checks_{0};
    CheckCallback on_check_;
};

}  // namespace mcphub
