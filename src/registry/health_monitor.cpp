#include "mcphub/registry/health_monitor.hpp"

#include "mcphub/log/logger.hpp"
#include "mcphub/registry/server_registry.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <vector>

namespace mcphub {

HealthMonitor::HealthMonitor(asio::any_io_executor executor,
                             ServerRegistry& registry,
                             std::chrono::milliseconds interval)
    : registry_(registry)
    , interval_(interval)
    , timer_(std::move(executor))
{}

void HealthMonitor::start() {
    if (stopped_.load() || running_.exchange(true)) {
        return;
    }
    MCPHUB_LOG_DEBUG("health monitor started ({} ms interval)", interval_.count());
    asio::co_spawn(
        timer_.get_executor(),
        [self = shared_from_this()]() { return self->run_loop(); },
        asio::detached);
}

void HealthMonitor::stop() {
    stopped_.store(true);
    if (!running_.exchange(false)) {
        return;
    }
    timer_.cancel();
    MCPHUB_LOG_DEBUG("health monitor stopped");
}

asio::awaitable<void> HealthMonitor::run_loop() {
    while (running_.load()) {
        timer_.expires_after(interval_);
        auto [ec] = co_await timer_.async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec || !running_.load()) {
            co_return;
        }
        co_await check_once();
    }
}

asio::awaitable<void> HealthMonitor::check_once() {
    if (stopped_.load()) {
        co_return;
    }
    // Keeps this monitor alive across the reconnects below.
    auto self = shared_from_this();

    const auto report = registry_.health();

    std::size_t connected = 0;
    for (const auto& server : report.servers) {
        if (server.state == ConnectionState::Connected) {
            ++connected;
        }
    }
    if (report.healthy) {
        MCPHUB_LOG_INFO("health check: {}/{} servers connected", connected, report.servers.size());
    } else {
        MCPHUB_LOG_WARN("health check: {}/{} servers connected", connected, report.servers.size());
    }

    std::vector<std::shared_ptr<ServerClient>> failed;
    for (const auto& server : report.servers) {
        if (server.state != ConnectionState::Error) {
            continue;
        }
        auto client = registry_.get_client(server.name);
        if (client && registry_.should_auto_connect(client->config())) {
            failed.push_back(std::move(client));
        }
    }

    // registry_ is not touched past this point.
    for (const auto& client : failed) {
        if (stopped_.load()) {
            co_return;
        }

        MCPHUB_LOG_INFO("health check: reconnecting server '{}'", client->name());
        auto result = co_await client->connect();
        if (stopped_.load()) {
            if (result) {
                MCPHUB_LOG_DEBUG("health check: monitor stopped, disconnecting server '{}' again",
                                 client->name());
                co_await client->disconnect();
            }
            co_return;
        }
        if (!result) {
            MCPHUB_LOG_WARN("health check: reconnecting server '{}' failed: {}",
                            client->name(), result.error().message);
        }
    }

    checks_.fetch_add(1);
    if (on_check_) {
        on_check_(report);
    }
}

}  // namespace mcphub
