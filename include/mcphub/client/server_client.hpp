#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Client
// ═══════════════════════════════════════════════════════════════════════════
// One logical connection to one named capability server.
//
// Usage:
//   asio::io_context io;
//   auto client = std::make_shared<ServerClient>(io.get_executor(), config);
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto caps = co_await client->connect();
//       auto result = co_await client->request("tools/call",
//           CallToolParams{"echo", {{"text", "hi"}}}.to_json());
//       co_await client->disconnect();
//   }, asio::detached);
//
//   io.run();
//
// State machine:
//
//   disconnected ──connect()──▶ connecting ──handshake ok──▶ connected
//        ▲                          │                           │
//        │                          │ handshake or              │ process exit
//        │                          │ transport failure         │ or disconnect()
//        │                          ▼                           │
//        │                        error ◀──transport failure────┤
//        └──────────────────────────────────────────────────────┘
//
// - Every request gets a fresh integer id; its pending entry exists before
//   the message is written.
// - Responses are matched by id, so out-of-order replies resolve correctly.
// - Each attempt consults the circuit breaker first. Timeouts, error replies
//   and send failures count as breaker failures; breaker rejections do not.
// - disconnect() fails every pending request with Cancelled.
//
// Instances must be owned by a std::shared_ptr: the message dispatcher keeps
// the client alive while its transport is open.

#include "mcphub/client/client_error.hpp"
#include "mcphub/client/server_config.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mcphub/resilience/circuit_breaker.hpp"
#include "mcphub/transport/async_transport.hpp"

#include <tl/expected.hpp>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Client Options
// ─────────────────────────────────────────────────────────────────────────────

struct ClientOptions {
    /// Request timeout when the server config has none
    std::chrono::milliseconds default_timeout{30000};

    /// Identity sent in the initialize request
    Implementation client_info{"mcphub", "0.1.0"};

    CircuitBreakerConfig circuit_breaker;

    /// Overrides the delays derived from the retry policy (tests use NoBackoff)
    std::shared_ptr<IBackoffPolicy> backoff;
};

/// Builds the transport for one connection attempt.
using TransportFactory = std::function<std::shared_ptr<IAsyncTransport>(
    asio::any_io_executor executor, const ServerConfig& config)>;

// ═══════════════════════════════════════════════════════════════════════════
// Server Client
// ═══════════════════════════════════════════════════════════════════════════

class ServerClient : public std::enable_shared_from_this<ServerClient> {
public:
    using ConnectedCallback = std::function<void(const Capabilities&)>;
    using DisconnectedCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const ClientError&)>;
    using NotificationCallback = std::function<void(const std::string& method, const Json& params)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// An empty factory spawns the configured command with ProcessTransport.
    ServerClient(
        asio::any_io_executor executor,
        ServerConfig config,
        ClientOptions options = {},
        TransportFactory transport_factory = {}
    );

    ~ServerClient();

    // Non-copyable, non-movable
    ServerClient(const ServerClient&) = delete;
    ServerClient& operator=(const ServerClient&) = delete;
    ServerClient(ServerClient&&) = delete;
    ServerClient& operator=(ServerClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the server and negotiate capabilities. Returns the current
    /// capabilities without doing anything when already connected.
    [[nodiscard]] asio::awaitable<ClientResult<Capabilities>> connect();

    /// Stop the server, fail pending requests, and move to disconnected.
    [[nodiscard]] asio::awaitable<void> disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Send a request through the circuit breaker and retry policy.
    /// Fails with NotConnected unless the client is connected.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> request(
        std::string method,
        Json params = Json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_connected() const noexcept { return state() == ConnectionState::Connected; }

    /// Set only while connected
    [[nodiscard]] std::optional<Capabilities> capabilities() const;

    [[nodiscard]] std::optional<std::string> last_error() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_connected() const;

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::size_t pending_count() const;

    /// Transport of the current connection, if any
    [[nodiscard]] std::shared_ptr<IAsyncTransport> transport() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Circuit Breaker
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState circuit_state() const { return circuit_breaker_.state(); }
    [[nodiscard]] CircuitBreakerStats circuit_stats() const { return circuit_breaker_.stats(); }
    [[nodiscard]] CircuitBreaker& circuit_breaker() noexcept { return circuit_breaker_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    void on_connected(ConnectedCallback callback);
    void on_disconnected(DisconnectedCallback callback);
    void on_error(ErrorCallback callback);
    void on_notification(NotificationCallback callback);

private:
    struct PendingRequest {
        using ResponseChannel = asio::experimental::channel<
            void(asio::error_code, ClientResult<Json>)
        >;
        // Shared so the waiting request keeps the channel alive after the
        // entry is erased by a response, a timeout or a disconnect.
        std::shared_ptr<ResponseChannel> channel;
        std::unique_ptr<asio::steady_timer> timeout_timer;
        std::string method;
        std::chrono::milliseconds timeout;

        PendingRequest(asio::any_io_executor exec, std::string m, std::chrono::milliseconds t)
            : channel(std::make_shared<ResponseChannel>(exec, 1))
            , timeout_timer(std::make_unique<asio::steady_timer>(exec))
            , method(std::move(m))
            , timeout(t)
        {}
    };

    // Internal coroutines
    asio::awaitable<ClientResult<Json>> request_with_retry(
        std::string method, Json params, std::optional<std::chrono::milliseconds> timeout);
    asio::awaitable<ClientResult<Json>> send_request_once(
        std::shared_ptr<IAsyncTransport> transport,
        const std::string& method, const Json& params, std::chrono::milliseconds timeout);
    asio::awaitable<void> message_dispatcher(
        std::shared_ptr<IAsyncTransport> transport, std::uint64_t generation);
    asio::awaitable<void> handle_transport_failure(
        std::shared_ptr<IAsyncTransport> transport, std::uint64_t generation,
        const TransportError& error);
    asio::awaitable<void> dispatch_server_request(
        std::shared_ptr<IAsyncTransport> transport, const Json& request);
    asio::awaitable<void> send_error_response(
        std::shared_ptr<IAsyncTransport> transport, const Json& request_id,
        int error_code, const std::string& message);
    asio::awaitable<ClientError> abort_connect(
        std::shared_ptr<IAsyncTransport> transport, ClientError error);
    asio::awaitable<void> discover_capabilities(Capabilities& caps);

    template <typename Item>
    asio::awaitable<std::vector<Item>> fetch_all_pages(const char* method, const char* key);

    // Pending-request bookkeeping
    void dispatch_response(std::uint64_t id, const Json& response);
    void handle_timeout(std::uint64_t id);
    std::unique_ptr<PendingRequest> take_pending(std::uint64_t id);
    void fail_all_pending(const ClientError& error);

    // State and events
    void set_state(ConnectionState state);
    void set_last_error(std::optional<std::string> message);
    void emit_connected(const Capabilities& caps);
    void emit_disconnected();
    void emit_error(const ClientError& error);
    void dispatch_notification(const std::string& method, const Json& params);

    [[nodiscard]] std::chrono::milliseconds effective_timeout(
        std::optional<std::chrono::milliseconds> timeout) const;

    // Configuration
    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;
    ServerConfig config_;
    ClientOptions options_;
    TransportFactory transport_factory_;

    CircuitBreaker circuit_breaker_;

    // State
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::uint64_t> request_id_{0};
    std::atomic<std::uint64_t> generation_{0};  // bumped on every connect/teardown

    mutable std::mutex state_mutex_;
    std::shared_ptr<IAsyncTransport> transport_;
    std::optional<Capabilities> capabilities_;
    std::optional<std::string> last_error_;
    std::optional<std::chrono::system_clock::time_point> last_connected_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::uint64_t, std::unique_ptr<PendingRequest>> pending_requests_;

    // Event callbacks (protected by callback_mutex_)
    mutable std::mutex callback_mutex_;
    std::vector<ConnectedCallback> connected_callbacks_;
    std::vector<DisconnectedCallback> disconnected_callbacks_;
    std::vector<ErrorCallback> error_callbacks_;
    std::vector<NotificationCallback> notification_callbacks_;
};

}  // namespace mcphub
