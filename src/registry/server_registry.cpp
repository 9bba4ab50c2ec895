#include "mcphub/registry/server_registry.hpp"

#include "mcphub/log/logger.hpp"
#include "mcphub/registry/health_monitor.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>

#include <format>

namespace mcphub {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::milliseconds>(tp));
}

std::string make_connection_id() {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("conn_{}", millis);
}

template <typename Callback, typename... Args>
void notify_all(const char* event, const std::vector<Callback>& callbacks, const Args&... args) {
    for (const auto& callback : callbacks) {
        try {
            callback(args...);
        } catch (const std::exception& e) {
            MCPHUB_LOG_ERROR("registry {} handler threw: {}", event, e.what());
        }
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Wire Views
// ─────────────────────────────────────────────────────────────────────────────

Json Connection::to_json() const {
    Json j = {
        {"id", id},
        {"server", server},
        {"state", std::string(to_string(state))},
        {"circuitState", std::string(to_string(circuit_state))}
    };
    if (last_connected) {
        j["lastConnected"] = format_timestamp(*last_connected);
    }
    if (error) {
        j["error"] = *error;
    }
    if (capabilities) {
        j["capabilities"] = capabilities->to_json();
    }
    return j;
}

Json HealthReport::to_json() const {
    Json servers_json = Json::array();
    for (const auto& server : servers) {
        Json entry = {
            {"name", server.name},
            {"state", std::string(to_string(server.state))},
            {"circuitState", std::string(to_string(server.circuit_state))}
        };
        if (server.last_connected) {
            entry["lastConnected"] = format_timestamp(*server.last_connected);
        }
        if (server.error) {
            entry["error"] = *server.error;
        }
        servers_json.push_back(std::move(entry));
    }
    return {
        {"healthy", healthy},
        {"checkedAt", format_timestamp(checked_at)},
        {"servers", servers_json}
    };
}

Json ServerTool::to_json() const {
    Json j = tool.to_json();
    j["server"] = server;
    return j;
}

Json ServerResource::to_json() const {
    Json j = resource.to_json();
    j["server"] = server;
    return j;
}

Json ServerPrompt::to_json() const {
    Json j = prompt.to_json();
    j["server"] = server;
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// Event Hub
// ─────────────────────────────────────────────────────────────────────────────

struct ServerRegistry::EventHub {
    mutable std::mutex mutex;
    std::map<std::string, Connection> connections;

    // Current ticket per registered server. Events carrying an older ticket
    // come from a client that was removed or shut down and are dropped.
    std::map<std::string, std::uint64_t> members;
    std::uint64_t next_ticket{0};

    std::vector<ServerConnectedCallback> connected_callbacks;
    std::vector<ServerDisconnectedCallback> disconnected_callbacks;
    std::vector<ServerErrorCallback> error_callbacks;
    std::vector<NotificationCallback> notification_callbacks;

    std::uint64_t enroll(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex);
        return members[server] = ++next_ticket;
    }

    [[nodiscard]] std::optional<std::uint64_t> ticket(const std::string& server) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = members.find(server);
        if (it == members.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void withdraw(const std::string& server, std::uint64_t ticket) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = members.find(server);
        if (it != members.end() && it->second == ticket) {
            members.erase(it);
            connections.erase(server);
        }
    }

    void withdraw_all() {
        std::lock_guard<std::mutex> lock(mutex);
        members.clear();
        connections.clear();
    }

    // Caller must hold mutex.
    bool is_member(const std::string& server, std::uint64_t ticket) const {
        auto it = members.find(server);
        return it != members.end() && it->second == ticket;
    }

    // Caller must hold mutex. The projection is created on the first event.
    Connection& projection(const std::string& server) {
        auto& connection = connections[server];
        if (connection.server.empty()) {
            connection.server = server;
            connection.id = make_connection_id();
        }
        return connection;
    }

    void handle_connected(const std::string& server, std::uint64_t ticket, const Capabilities& caps) {
        std::vector<ServerConnectedCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_member(server, ticket)) {
                MCPHUB_LOG_DEBUG("ignoring connect of unregistered server '{}'", server);
                return;
            }
            auto& connection = projection(server);
            connection.id = make_connection_id();
            connection.state = ConnectionState::Connected;
            connection.capabilities = caps;
            connection.last_connected = std::chrono::system_clock::now();
            connection.error.reset();
            callbacks = connected_callbacks;
        }
        MCPHUB_LOG_INFO("connected to server '{}'", server);
        notify_all("server_connected", callbacks, server, caps);
    }

    void handle_disconnected(const std::string& server, std::uint64_t ticket) {
        std::vector<ServerDisconnectedCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_member(server, ticket)) {
                return;
            }
            auto& connection = projection(server);
            connection.state = ConnectionState::Disconnected;
            connection.capabilities.reset();
            callbacks = disconnected_callbacks;
        }
        MCPHUB_LOG_INFO("disconnected from server '{}'", server);
        notify_all("server_disconnected", callbacks, server);
    }

    void handle_error(const std::string& server, std::uint64_t ticket, const ClientError& error) {
        std::vector<ServerErrorCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_member(server, ticket)) {
                return;
            }
            auto& connection = projection(server);
            connection.state = ConnectionState::Error;
            connection.error = error.message;
            connection.capabilities.reset();
            callbacks = error_callbacks;
        }
        MCPHUB_LOG_ERROR("server '{}' error: {}", server, error.message);
        notify_all("server_error", callbacks, server, error.message);
    }

    void handle_notification(const std::string& server, std::uint64_t ticket,
                             const std::string& method, const Json& params) {
        std::vector<NotificationCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!is_member(server, ticket)) {
                return;
            }
            callbacks = notification_callbacks;
        }
        notify_all("notification", callbacks, server, method, params);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ServerRegistry::ServerRegistry(asio::any_io_executor executor, RegistryOptions options)
    : executor_(std::move(executor))
    , options_(std::move(options))
    , hub_(std::make_shared<EventHub>())
{}

ServerRegistry::~ServerRegistry() {
    stop_health_monitor();
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<std::size_t> ServerRegistry::initialize(RegistryConfig config) {
    options_.default_timeout = config.default_timeout;
    options_.enable_auto_connect = config.enable_auto_connect;
    options_.client_info = config.client_info;
    options_.circuit_breaker = config.circuit_breaker;

    MCPHUB_LOG_INFO("initializing registry with {} configured servers", config.servers.size());

    std::size_t added = 0;
    for (auto& server : config.servers) {
        const auto name = server.name;
        auto result = co_await add_server(std::move(server));
        if (!result) {
            MCPHUB_LOG_ERROR("failed to add server '{}': {}", name, result.error().message);
            continue;
        }
        ++added;
    }

    if (config.enable_health_check) {
        start_health_monitor(config.health_check_interval);
    }

    MCPHUB_LOG_INFO("registry initialized with {} servers", added);
    co_return added;
}

asio::awaitable<ClientResult<void>> ServerRegistry::add_server(ServerConfig config) {
    if (auto valid = config.validate(); !valid) {
        co_return tl::unexpected(ClientError::invalid_config(valid.error().message));
    }

    const std::string name = config.name;
    const bool auto_connect = should_auto_connect(config);

    ClientOptions client_options;
    client_options.default_timeout = options_.default_timeout;
    client_options.client_info = options_.client_info;
    client_options.circuit_breaker = options_.circuit_breaker;
    client_options.backoff = options_.backoff;

    std::shared_ptr<ServerClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (clients_.find(name) == clients_.end()) {
            client = std::make_shared<ServerClient>(
                executor_, std::move(config), client_options, options_.transport_factory);
            subscribe(*client, hub_->enroll(name));
            clients_.emplace(name, client);
        }
    }
    if (!client) {
        co_return tl::unexpected(ClientError::duplicate_server(name));
    }

    MCPHUB_LOG_INFO("added server '{}'", name);

    if (auto_connect) {
        auto connected = co_await client->connect();
        if (!connected) {
            MCPHUB_LOG_WARN("auto-connect of server '{}' failed: {}", name, connected.error().message);
        }
    }
    co_return ClientResult<void>{};
}

asio::awaitable<ClientResult<void>> ServerRegistry::remove_server(const std::string& name) {
    std::shared_ptr<ServerClient> client;
    std::optional<std::uint64_t> ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(name);
        if (it != clients_.end()) {
            client = std::move(it->second);
            clients_.erase(it);
            ticket = hub_->ticket(name);
        }
    }
    if (!client) {
        co_return tl::unexpected(ClientError::unknown_server(name));
    }

    co_await client->disconnect();
    if (ticket) {
        hub_->withdraw(name, *ticket);
    }

    MCPHUB_LOG_INFO("removed server '{}'", name);
    co_return ClientResult<void>{};
}

void ServerRegistry::subscribe(ServerClient& client, std::uint64_t ticket) {
    std::weak_ptr<EventHub> hub = hub_;
    const std::string name = client.name();

    client.on_connected([hub, name, ticket](const Capabilities& caps) {
        if (auto h = hub.lock()) h->handle_connected(name, ticket, caps);
    });
    client.on_disconnected([hub, name, ticket]() {
        if (auto h = hub.lock()) h->handle_disconnected(name, ticket);
    });
    client.on_error([hub, name, ticket](const ClientError& error) {
        if (auto h = hub.lock()) h->handle_error(name, ticket, error);
    });
    client.on_notification([hub, name, ticket](const std::string& method, const Json& params) {
        if (auto h = hub.lock()) h->handle_notification(name, ticket, method, params);
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Control
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ClientResult<Capabilities>> ServerRegistry::connect_server(const std::string& name) {
    auto client = find_client(name);
    if (!client) {
        co_return tl::unexpected(client.error());
    }
    co_return co_await (*client)->connect();
}

asio::awaitable<ClientResult<void>> ServerRegistry::disconnect_server(const std::string& name) {
    auto client = find_client(name);
    if (!client) {
        co_return tl::unexpected(client.error());
    }
    co_await (*client)->disconnect();
    co_return ClientResult<void>{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Capability Invocation
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ClientResult<Json>> ServerRegistry::call_tool(
    const std::string& server,
    const std::string& tool,
    Json arguments,
    CallOptions options
) {
    auto client = find_connected_client(server);
    if (!client) {
        co_return tl::unexpected(client.error());
    }
    co_return co_await (*client)->request(
        Method::ToolsCall, CallToolParams{tool, std::move(arguments)}.to_json(), options.timeout);
}

asio::awaitable<ClientResult<Json>> ServerRegistry::get_resource(
    const std::string& server,
    const std::string& uri,
    CallOptions options
) {
    auto client = find_connected_client(server);
    if (!client) {
        co_return tl::unexpected(client.error());
    }
    co_return co_await (*client)->request(
        Method::ResourcesRead, ReadResourceParams{uri}.to_json(), options.timeout);
}

// ─────────────────────────────────────────────────────────────────────────────
// Capability Listing
// ─────────────────────────────────────────────────────────────────────────────

namespace {

// Collect one capability slice from the selected clients, tagging each entry.
template <typename Entry, typename Slice>
std::vector<Entry> collect(const std::vector<std::shared_ptr<ServerClient>>& clients, Slice slice) {
    std::vector<Entry> entries;
    for (const auto& client : clients) {
        auto caps = client->capabilities();
        if (!caps) {
            continue;
        }
        for (auto& item : slice(*caps)) {
            entries.push_back(Entry{client->name(), std::move(item)});
        }
    }
    return entries;
}

}  // namespace

ClientResult<std::vector<ServerTool>> ServerRegistry::list_tools(
    const std::optional<std::string>& server) const {
    std::vector<std::shared_ptr<ServerClient>> selected;
    if (server) {
        auto client = find_client(*server);
        if (!client) {
            return tl::unexpected(client.error());
        }
        selected.push_back(*client);
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_) {
            if (client->is_connected()) selected.push_back(client);
        }
    }
    return collect<ServerTool>(selected, [](Capabilities& caps) -> std::vector<Tool>& { return caps.tools; });
}

ClientResult<std::vector<ServerResource>> ServerRegistry::list_resources(
    const std::optional<std::string>& server) const {
    std::vector<std::shared_ptr<ServerClient>> selected;
    if (server) {
        auto client = find_client(*server);
        if (!client) {
            return tl::unexpected(client.error());
        }
        selected.push_back(*client);
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_) {
            if (client->is_connected()) selected.push_back(client);
        }
    }
    return collect<ServerResource>(selected, [](Capabilities& caps) -> std::vector<Resource>& { return caps.resources; });
}

ClientResult<std::vector<ServerPrompt>> ServerRegistry::list_prompts(
    const std::optional<std::string>& server) const {
    std::vector<std::shared_ptr<ServerClient>> selected;
    if (server) {
        auto client = find_client(*server);
        if (!client) {
            return tl::unexpected(client.error());
        }
        selected.push_back(*client);
    } else {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_) {
            if (client->is_connected()) selected.push_back(client);
        }
    }
    return collect<ServerPrompt>(selected, [](Capabilities& caps) -> std::vector<Prompt>& { return caps.prompts; });
}

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Connection> ServerRegistry::get_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::lock_guard<std::mutex> hub_lock(hub_->mutex);

    std::vector<Connection> connections;
    connections.reserve(hub_->connections.size());
    for (const auto& [name, connection] : hub_->connections) {
        auto copy = connection;
        if (auto it = clients_.find(name); it != clients_.end()) {
            copy.circuit_state = it->second->circuit_state();
        }
        connections.push_back(std::move(copy));
    }
    return connections;
}

std::optional<Connection> ServerRegistry::get_connection(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::lock_guard<std::mutex> hub_lock(hub_->mutex);

    auto it = hub_->connections.find(name);
    if (it == hub_->connections.end()) {
        return std::nullopt;
    }
    auto copy = it->second;
    if (auto client = clients_.find(name); client != clients_.end()) {
        copy.circuit_state = client->second->circuit_state();
    }
    return copy;
}

HealthReport ServerRegistry::health() const {
    HealthReport report;
    report.checked_at = std::chrono::system_clock::now();

    for (const auto& connection : get_connections()) {
        if (connection.state != ConnectionState::Connected) {
            report.healthy = false;
        }
        report.servers.push_back(ServerHealth{
            connection.server,
            connection.state,
            connection.last_connected,
            connection.error,
            connection.circuit_state
        });
    }
    return report;
}

std::shared_ptr<ServerClient> ServerRegistry::get_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> ServerRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, client] : clients_) {
        names.push_back(name);
    }
    return names;
}

ClientResult<std::shared_ptr<ServerClient>> ServerRegistry::find_client(const std::string& name) const {
    auto client = get_client(name);
    if (!client) {
        return tl::unexpected(ClientError::unknown_server(name));
    }
    return client;
}

ClientResult<std::shared_ptr<ServerClient>> ServerRegistry::find_connected_client(
    const std::string& name) const {
    auto client = find_client(name);
    if (client && !(*client)->is_connected()) {
        return tl::unexpected(ClientError::not_connected(name));
    }
    return client;
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

void ServerRegistry::start_health_monitor(std::chrono::milliseconds interval) {
    stop_health_monitor();
    health_monitor_ = std::make_shared<HealthMonitor>(executor_, *this, interval);
    health_monitor_->start();
}

void ServerRegistry::stop_health_monitor() {
    if (health_monitor_) {
        health_monitor_->stop();
        health_monitor_.reset();
    }
}

asio::awaitable<void> ServerRegistry::shutdown() {
    MCPHUB_LOG_INFO("shutting down registry");
    stop_health_monitor();

    std::map<std::string, std::shared_ptr<ServerClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
    }

    if (!clients.empty()) {
        using DoneChannel = asio::experimental::channel<void(asio::error_code)>;
        auto done = std::make_shared<DoneChannel>(executor_, clients.size());

        for (const auto& [name, client] : clients) {
            asio::co_spawn(executor_, client->disconnect(),
                [done, name = name](std::exception_ptr error) {
                    if (error) {
                        try {
                            std::rethrow_exception(error);
                        } catch (const std::exception& e) {
                            MCPHUB_LOG_ERROR("error disconnecting server '{}': {}", name, e.what());
                        } catch (...) {
                            MCPHUB_LOG_ERROR("unknown error disconnecting server '{}'", name);
                        }
                    }
                    done->try_send(asio::error_code{});
                });
        }

        for (std::size_t i = 0; i < clients.size(); ++i) {
            co_await done->async_receive(asio::as_tuple(asio::use_awaitable));
        }
    }

    // Events from a client that finishes connecting after this point are dropped.
    hub_->withdraw_all();
    MCPHUB_LOG_INFO("registry shutdown complete");
}

// ─────────────────────────────────────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────────────────────────────────────

void ServerRegistry::on_server_connected(ServerConnectedCallback callback) {
    std::lock_guard<std::mutex> lock(hub_->mutex);
    hub_->connected_callbacks.push_back(std::move(callback));
}

void ServerRegistry::on_server_disconnected(ServerDisconnectedCallback callback) {
    std::lock_guard<std::mutex> lock(hub_->mutex);
    hub_->disconnected_callbacks.push_back(std::move(callback));
}

void ServerRegistry::on_server_error(ServerErrorCallback callback) {
    std::lock_guard<std::mutex> lock(hub_->mutex);
    hub_->error_callbacks.push_back(std::move(callback));
}

void ServerRegistry::on_notification(NotificationCallback callback) {
    std::lock_guard<std::mutex> lock(hub_->mutex);
    hub_->notification_callbacks.push_back(std::move(callback));
}

}  // namespace mcphub
