#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Registry
// ═══════════════════════════════════════════════════════════════════════════
// Owns one ServerClient per named server, routes calls to them and keeps a
// Connection projection of each client's lifecycle.
//
// Usage:
//   ServerRegistry registry(io.get_executor());
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       co_await registry.initialize(*load_registry_config("mcphub.json"));
//
//       for (const auto& entry : *registry.list_tools()) {
//           std::cout << entry.server << ": " << entry.tool.name << "\n";
//       }
//
//       auto result = co_await registry.call_tool("fs", "read_file", {{"path", "/tmp/x"}});
//       co_await registry.shutdown();
//   }, asio::detached);
//
// Lookups of unknown servers and calls on disconnected servers fail before
// any message is sent. Call shutdown() before destroying the registry.

#include "mcphub/client/client_error.hpp"
#include "mcphub/client/server_client.hpp"
#include "mcphub/client/server_config.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mcphub/registry/registry_config.hpp"
#include "mcphub/resilience/circuit_breaker.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

class HealthMonitor;

// ─────────────────────────────────────────────────────────────────────────────
// Projections
// ─────────────────────────────────────────────────────────────────────────────

/// Registry-side view of one server's connection, rebuilt from client events.
struct Connection {
    std::string id;      ///< conn_<epoch millis>, minted on each successful connection
    std::string server;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::chrono::system_clock::time_point> last_connected;
    std::optional<std::string> error;
    std::optional<Capabilities> capabilities;
    CircuitState circuit_state{CircuitState::Closed};

    [[nodiscard]] Json to_json() const;
};

struct ServerHealth {
    std::string name;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::chrono::system_clock::time_point> last_connected;
    std::optional<std::string> error;
    CircuitState circuit_state{CircuitState::Closed};
};

struct HealthReport {
    /// True iff every projection is connected
    bool healthy{true};
    std::chrono::system_clock::time_point checked_at;
    std::vector<ServerHealth> servers;

    [[nodiscard]] Json to_json() const;
};

// Capability entries tagged with the server that provides them.

struct ServerTool {
    std::string server;
    Tool tool;

    [[nodiscard]] Json to_json() const;
};

struct ServerResource {
    std::string server;
    Resource resource;

    [[nodiscard]] Json to_json() const;
};

struct ServerPrompt {
    std::string server;
    Prompt prompt;

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Options
// ─────────────────────────────────────────────────────────────────────────────

struct RegistryOptions {
    std::chrono::milliseconds default_timeout{30000};

    /// false suppresses auto-connect for every server
    bool enable_auto_connect{true};

    Implementation client_info{"mcphub", "0.1.0"};
    CircuitBreakerConfig circuit_breaker;

    /// Passed to each client; tests inject NoBackoff and mock transports here
    std::shared_ptr<IBackoffPolicy> backoff;
    TransportFactory transport_factory;
};

struct CallOptions {
    std::optional<std::chrono::milliseconds> timeout;
};

// ═══════════════════════════════════════════════════════════════════════════
// ServerRegistry
// ═══════════════════════════════════════════════════════════════════════════

class ServerRegistry {
public:
    using ServerConnectedCallback = std::function<void(const std::string& server, const Capabilities&)>;
    using ServerDisconnectedCallback = std::function<void(const std::string& server)>;
    using ServerErrorCallback = std::function<void(const std::string& server, const std::string& message)>;
    using NotificationCallback = std::function<void(
        const std::string& server, const std::string& method, const Json& params)>;

    explicit ServerRegistry(asio::any_io_executor executor, RegistryOptions options = {});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    /// Apply the global settings, add every configured server, and start the
    /// health monitor when enabled. A server that fails to register is logged
    /// and skipped. Returns the number of servers registered.
    asio::awaitable<std::size_t> initialize(RegistryConfig config);

    /// Register a server and, unless auto-connect is disabled, connect it.
    /// An auto-connect failure is recorded in the projection; the server
    /// stays registered and the call still succeeds.
    asio::awaitable<ClientResult<void>> add_server(ServerConfig config);

    asio::awaitable<ClientResult<void>> remove_server(const std::string& name);

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Control
    // ─────────────────────────────────────────────────────────────────────────

    asio::awaitable<ClientResult<Capabilities>> connect_server(const std::string& name);
    asio::awaitable<ClientResult<void>> disconnect_server(const std::string& name);

    // ─────────────────────────────────────────────────────────────────────────
    // Capability Invocation
    // ─────────────────────────────────────────────────────────────────────────

    asio::awaitable<ClientResult<Json>> call_tool(
        const std::string& server,
        const std::string& tool,
        Json arguments = Json::object(),
        CallOptions options = {}
    );

    asio::awaitable<ClientResult<Json>> get_resource(
        const std::string& server,
        const std::string& uri,
        CallOptions options = {}
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Capability Listing
    // ─────────────────────────────────────────────────────────────────────────
    // With a server name: that server's cached list (empty when it has no
    // capabilities yet). Without: every connected server's entries.

    [[nodiscard]] ClientResult<std::vector<ServerTool>> list_tools(
        const std::optional<std::string>& server = std::nullopt) const;
    [[nodiscard]] ClientResult<std::vector<ServerResource>> list_resources(
        const std::optional<std::string>& server = std::nullopt) const;
    [[nodiscard]] ClientResult<std::vector<ServerPrompt>> list_prompts(
        const std::optional<std::string>& server = std::nullopt) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Status
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<Connection> get_connections() const;
    [[nodiscard]] std::optional<Connection> get_connection(const std::string& name) const;
    [[nodiscard]] HealthReport health() const;

    [[nodiscard]] std::shared_ptr<ServerClient> get_client(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> server_names() const;
    [[nodiscard]] const RegistryOptions& options() const noexcept { return options_; }

    /// Whether the health monitor reconnects this server after an error.
    [[nodiscard]] bool should_auto_connect(const ServerConfig& config) const noexcept {
        return options_.enable_auto_connect && config.auto_connect;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start periodic health checks. Replaces a running monitor.
    void start_health_monitor(std::chrono::milliseconds interval);
    void stop_health_monitor();

    /// Disconnect every server concurrently and forget them all.
    asio::awaitable<void> shutdown();

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    void on_server_connected(ServerConnectedCallback callback);
    void on_server_disconnected(ServerDisconnectedCallback callback);
    void on_server_error(ServerErrorCallback callback);
    void on_notification(NotificationCallback callback);

private:
    // Projections and subscribers outlive the registry while a client still
    // holds a callback into them.
    struct EventHub;

    [[nodiscard]] ClientResult<std::shared_ptr<ServerClient>> find_client(const std::string& name) const;
    [[nodiscard]] ClientResult<std::shared_ptr<ServerClient>> find_connected_client(const std::string& name) const;
    void subscribe(ServerClient& client, std::uint64_t ticket);

    asio::any_io_executor executor_;
    RegistryOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ServerClient>> clients_;

    std::shared_ptr<EventHub> hub_;
    std::shared_ptr<HealthMonitor> health_monitor_;
};

}  // namespace mcphub
