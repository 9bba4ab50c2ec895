#include "mcphub/client/server_client.hpp"

#include "mcphub/log/logger.hpp"
#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/resilience/retry_executor.hpp"
#include "mcphub/transport/process_transport.hpp"

#include <asio/as_tuple.hpp>
#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <format>

namespace mcphub {

namespace {

// Upper bound on */list pages followed during discovery.
constexpr std::size_t kMaxDiscoveryPages = 100;

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ServerClient::ServerClient(
    asio::any_io_executor executor,
    ServerConfig config,
    ClientOptions options,
    TransportFactory transport_factory
)
    : executor_(executor)
    , strand_(asio::make_strand(executor))
    , config_(std::move(config))
    , options_(std::move(options))
    , transport_factory_(std::move(transport_factory))
    , circuit_breaker_([this] {
          auto breaker_config = options_.circuit_breaker;
          breaker_config.name = config_.name;
          return breaker_config;
      }())
{
    if (!transport_factory_) {
        transport_factory_ = [](asio::any_io_executor ex, const ServerConfig& cfg) {
            return make_process_transport(std::move(ex), cfg.to_process_config());
        };
    }
}

ServerClient::~ServerClient() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [id, pending] : pending_requests_) {
        pending->timeout_timer->cancel();
        pending->channel->close();
    }
    pending_requests_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ClientResult<Capabilities>> ServerClient::connect() {
    const auto current = state();
    if (current == ConnectionState::Connected) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (capabilities_) {
            co_return *capabilities_;
        }
        co_return Capabilities{};
    }
    if (current == ConnectionState::Connecting) {
        co_return tl::unexpected(ClientError::protocol_error(
            std::format("connection to server '{}' is already in progress", config_.name)));
    }

    set_state(ConnectionState::Connecting);

    auto transport = transport_factory_(executor_, config_);
    if (!transport) {
        auto error = ClientError::transport_error(
            std::format("no transport available for server '{}'", config_.name));
        set_last_error(error.message);
        set_state(ConnectionState::Error);
        emit_error(error);
        co_return tl::unexpected(error);
    }

    // Any disconnect() or competing connect() while the process starts bumps
    // the generation; the transport started here is then ours to stop.
    const std::uint64_t generation = ++generation_;
    auto started = co_await transport->async_start();
    if (generation_.load() != generation || state() != ConnectionState::Connecting) {
        if (started) {
            co_await transport->async_stop();
        }
        MCPHUB_LOG_DEBUG("server '{}': connection attempt superseded while starting", config_.name);
        co_return tl::unexpected(ClientError::cancelled(
            std::format("connection to server '{}' was interrupted", config_.name)));
    }
    if (!started) {
        auto error = ClientError::transport_error(std::format(
            "failed to start server '{}': {}", config_.name, started.error().message));
        MCPHUB_LOG_ERROR("{}", error.message);
        set_last_error(error.message);
        set_state(ConnectionState::Error);
        emit_error(error);
        co_return tl::unexpected(error);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport_ = transport;
    }

    asio::co_spawn(
        strand_,
        [self = shared_from_this(), transport, generation]() {
            return self->message_dispatcher(transport, generation);
        },
        asio::detached);

    // Handshake
    InitializeParams init_params;
    init_params.client_info = options_.client_info;

    auto init_result = co_await request_with_retry(
        Method::Initialize, init_params.to_json(), std::nullopt);
    if (!init_result) {
        co_return tl::unexpected(co_await abort_connect(transport, init_result.error()));
    }

    auto notified = co_await transport->async_send(JsonRpcNotification(Method::Initialized).to_json());
    if (!notified) {
        co_return tl::unexpected(co_await abort_connect(
            transport, ClientError::transport_error(notified.error().message)));
    }

    Capabilities caps = Capabilities::from_json(*init_result);
    co_await discover_capabilities(caps);

    // A disconnect() or transport failure during discovery wins.
    if (state() != ConnectionState::Connecting) {
        co_return tl::unexpected(ClientError::cancelled(
            std::format("connection to server '{}' was interrupted", config_.name)));
    }
    if (generation_.load() != generation) {
        co_return tl::unexpected(co_await abort_connect(transport, ClientError::transport_error(
            std::format("server '{}' closed during initialization", config_.name))));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        capabilities_ = caps;
        last_connected_ = std::chrono::system_clock::now();
        last_error_.reset();
    }
    set_state(ConnectionState::Connected);

    MCPHUB_LOG_INFO("server '{}' connected ({} tools, {} resources, {} prompts)",
                    config_.name, caps.tools.size(), caps.resources.size(), caps.prompts.size());

    emit_connected(caps);
    co_return caps;
}

asio::awaitable<ClientError> ServerClient::abort_connect(
    std::shared_ptr<IAsyncTransport> transport, ClientError error
) {
    // The transport is always stopped. Client state is only torn down while
    // this attempt still owns the connection; a disconnect() may have won.
    const bool owner = state() == ConnectionState::Connecting && this->transport() == transport;
    if (owner) {
        ++generation_;
        fail_all_pending(ClientError::cancelled("connection attempt aborted"));
    }

    co_await transport->async_stop();
    if (!owner) {
        co_return error;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (transport_ == transport) {
            transport_.reset();
        }
        capabilities_.reset();
    }

    MCPHUB_LOG_ERROR("server '{}' failed to initialize: {}", config_.name, error.message);
    set_last_error(error.message);
    auto connecting = ConnectionState::Connecting;
    if (state_.compare_exchange_strong(connecting, ConnectionState::Error)) {
        MCPHUB_LOG_INFO("server '{}': {} -> {}",
                        config_.name, to_string(ConnectionState::Connecting), to_string(ConnectionState::Error));
        emit_error(error);
    }
    co_return error;
}

asio::awaitable<void> ServerClient::disconnect() {
    ++generation_;
    const auto previous = state_.exchange(ConnectionState::Disconnected);
    if (previous != ConnectionState::Disconnected) {
        MCPHUB_LOG_INFO("server '{}': {} -> {}",
                        config_.name, to_string(previous), to_string(ConnectionState::Disconnected));
    }

    fail_all_pending(ClientError::cancelled());

    std::shared_ptr<IAsyncTransport> transport;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport = std::move(transport_);
        transport_.reset();
        capabilities_.reset();
    }

    if (transport) {
        co_await transport->async_stop();
    }

    if (previous != ConnectionState::Disconnected) {
        emit_disconnected();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ClientResult<Json>> ServerClient::request(
    std::string method,
    Json params,
    std::optional<std::chrono::milliseconds> timeout
) {
    if (!is_connected()) {
        co_return tl::unexpected(ClientError::not_connected(config_.name));
    }
    co_return co_await request_with_retry(std::move(method), std::move(params), timeout);
}

asio::awaitable<ClientResult<Json>> ServerClient::request_with_retry(
    std::string method,
    Json params,
    std::optional<std::chrono::milliseconds> timeout
) {
    const auto request_timeout = effective_timeout(timeout);
    RetryExecutor retry(executor_, config_.effective_retry_policy(), options_.backoff);

    co_return co_await retry.run<Json>([&]() {
        return send_request_once(this->transport(), method, params, request_timeout);
    });
}

asio::awaitable<ClientResult<Json>> ServerClient::send_request_once(
    std::shared_ptr<IAsyncTransport> transport,
    const std::string& method,
    const Json& params,
    std::chrono::milliseconds timeout
) {
    if (!circuit_breaker_.allow_request()) {
        co_return tl::unexpected(ClientError::circuit_open(config_.name));
    }

    const auto current = state();
    if (!transport ||
        (current != ConnectionState::Connected && current != ConnectionState::Connecting)) {
        co_return tl::unexpected(ClientError::not_connected(config_.name));
    }

    const std::uint64_t id = ++request_id_;

    // Register before sending so a fast reply always finds its entry.
    std::shared_ptr<PendingRequest::ResponseChannel> channel;
    {
        auto pending = std::make_unique<PendingRequest>(executor_, method, timeout);
        channel = pending->channel;

        pending->timeout_timer->expires_after(timeout);
        pending->timeout_timer->async_wait(asio::bind_executor(strand_,
            [weak = weak_from_this(), id](asio::error_code ec) {
                if (ec) {
                    return;  // cancelled: reply arrived or client shut down
                }
                if (auto self = weak.lock()) {
                    self->handle_timeout(id);
                }
            }));

        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_[id] = std::move(pending);
    }

    JsonRpcRequest request(method, static_cast<std::int64_t>(id), params);
    MCPHUB_LOG_TRACE("server '{}' <- {} (id {})", config_.name, method, id);

    auto sent = co_await transport->async_send(request.to_json());
    if (!sent) {
        circuit_breaker_.record_failure();
        take_pending(id);
        co_return tl::unexpected(ClientError::transport_error(std::format(
            "failed to send '{}' to server '{}': {}", method, config_.name, sent.error().message)));
    }

    auto [ec, result] = co_await channel->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        take_pending(id);
        co_return tl::unexpected(ClientError::cancelled());
    }

    if (result.has_value()) {
        circuit_breaker_.record_success();
    } else if (result.error().code == ClientErrorCode::ServerError) {
        circuit_breaker_.record_failure();
    }
    // Timeouts are recorded by handle_timeout().
    co_return std::move(result);
}

std::chrono::milliseconds ServerClient::effective_timeout(
    std::optional<std::chrono::milliseconds> timeout
) const {
    if (timeout) {
        return *timeout;
    }
    if (config_.timeout) {
        return *config_.timeout;
    }
    return options_.default_timeout;
}

// ─────────────────────────────────────────────────────────────────────────────
// Capability Discovery
// ─────────────────────────────────────────────────────────────────────────────

template <typename Item>
asio::awaitable<std::vector<Item>> ServerClient::fetch_all_pages(const char* method, const char* key) {
    std::vector<Item> items;
    std::optional<std::string> cursor;

    for (std::size_t page_count = 0; page_count < kMaxDiscoveryPages; ++page_count) {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = co_await request_with_retry(method, std::move(params), std::nullopt);
        if (!result) {
            MCPHUB_LOG_WARN("server '{}': {} failed: {}", config_.name, method, result.error().message);
            co_return std::vector<Item>{};
        }

        auto page = ListPage<Item>::from_json(*result, key);
        items.insert(items.end(),
                     std::make_move_iterator(page.items.begin()),
                     std::make_move_iterator(page.items.end()));

        if (!page.next_cursor) {
            co_return items;
        }
        cursor = std::move(page.next_cursor);
    }

    MCPHUB_LOG_WARN("server '{}': {} exceeded {} pages, keeping what was read",
                    config_.name, method, kMaxDiscoveryPages);
    co_return items;
}

asio::awaitable<void> ServerClient::discover_capabilities(Capabilities& caps) {
    if (caps.features.tools && !caps.has_inline_tools) {
        caps.tools = co_await fetch_all_pages<Tool>(Method::ToolsList, "tools");
    }
    if (caps.features.resources && !caps.has_inline_resources) {
        caps.resources = co_await fetch_all_pages<Resource>(Method::ResourcesList, "resources");
    }
    if (caps.features.prompts && !caps.has_inline_prompts) {
        caps.prompts = co_await fetch_all_pages<Prompt>(Method::PromptsList, "prompts");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Message Dispatch
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> ServerClient::message_dispatcher(
    std::shared_ptr<IAsyncTransport> transport,
    std::uint64_t generation
) {
    for (;;) {
        auto received = co_await transport->async_receive();

        if (generation_.load() != generation) {
            co_return;  // connection was replaced or torn down
        }

        if (!received) {
            co_await handle_transport_failure(transport, generation, received.error());
            co_return;
        }

        const Json& message = *received;

        switch (classify_message(message)) {
            case MessageKind::Response: {
                const auto& id_json = message["id"];
                std::optional<std::uint64_t> id;
                if (id_json.is_number_unsigned()) {
                    id = id_json.get<std::uint64_t>();
                } else if (id_json.is_number_integer() && id_json.get<std::int64_t>() >= 0) {
                    id = static_cast<std::uint64_t>(id_json.get<std::int64_t>());
                }
                if (!id) {
                    MCPHUB_LOG_WARN("server '{}': ignoring response with id {}",
                                    config_.name, id_json.dump());
                    break;
                }
                dispatch_response(*id, message);
                break;
            }

            case MessageKind::Request:
                co_await dispatch_server_request(transport, message);
                break;

            case MessageKind::Notification: {
                const auto method = message["method"].get<std::string>();
                dispatch_notification(method, message.value("params", Json::object()));
                break;
            }

            case MessageKind::Invalid:
                MCPHUB_LOG_WARN("server '{}': ignoring message that is neither request, response nor notification",
                                config_.name);
                break;
        }
    }
}

asio::awaitable<void> ServerClient::handle_transport_failure(
    std::shared_ptr<IAsyncTransport> transport,
    std::uint64_t generation,
    const TransportError& error
) {
    // Only the first observer of this connection's failure tears it down.
    std::uint64_t expected = generation;
    if (!generation_.compare_exchange_strong(expected, generation + 1)) {
        co_return;
    }

    auto client_error = ClientError::transport_error(std::format(
        "server '{}' transport failed: {}", config_.name, error.message));
    fail_all_pending(client_error);

    // connect() reports the failure through the handshake result.
    if (state() == ConnectionState::Connecting) {
        co_return;
    }

    co_await transport->async_stop();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (transport_ == transport) {
            transport_.reset();
        }
        capabilities_.reset();
    }

    if (error.category == TransportError::Category::Closed) {
        if (error.exit_code) {
            MCPHUB_LOG_INFO("server '{}' exited with code {}", config_.name, *error.exit_code);
        }
        set_state(ConnectionState::Disconnected);
        emit_disconnected();
    } else {
        MCPHUB_LOG_ERROR("{}", client_error.message);
        set_last_error(client_error.message);
        set_state(ConnectionState::Error);
        emit_error(client_error);
    }
}

asio::awaitable<void> ServerClient::dispatch_server_request(
    std::shared_ptr<IAsyncTransport> transport,
    const Json& request
) {
    const auto method = request["method"].get<std::string>();

    if (method == Method::Ping) {
        auto id = JsonRpcId::from_json(request["id"]);
        if (!id) {
            MCPHUB_LOG_WARN("server '{}': ping with invalid id: {}", config_.name, id.error().message);
            co_return;
        }
        auto sent = co_await transport->async_send(
            JsonRpcResponse::success(std::move(*id), Json::object()).to_json());
        if (!sent) {
            MCPHUB_LOG_WARN("server '{}': failed to answer ping: {}", config_.name, sent.error().message);
        }
        co_return;
    }

    MCPHUB_LOG_DEBUG("server '{}' sent unsupported request '{}'", config_.name, method);
    co_await send_error_response(transport, request["id"], ErrorCode::MethodNotFound,
                                 "method not found: " + method);
}

asio::awaitable<void> ServerClient::send_error_response(
    std::shared_ptr<IAsyncTransport> transport,
    const Json& request_id,
    int error_code,
    const std::string& message
) {
    auto id = JsonRpcId::from_json(request_id);
    if (!id) {
        MCPHUB_LOG_WARN("server '{}': cannot answer request: {}", config_.name, id.error().message);
        co_return;
    }

    JsonRpcError error;
    error.code = error_code;
    error.message = message;

    auto sent = co_await transport->async_send(
        JsonRpcResponse::failure(std::move(*id), std::move(error)).to_json());
    if (!sent) {
        MCPHUB_LOG_WARN("server '{}': failed to send error response: {}",
                        config_.name, sent.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Pending Requests
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<ServerClient::PendingRequest> ServerClient::take_pending(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_requests_.find(id);
    if (it == pending_requests_.end()) {
        return nullptr;
    }
    auto pending = std::move(it->second);
    pending_requests_.erase(it);
    pending->timeout_timer->cancel();
    return pending;
}

void ServerClient::dispatch_response(std::uint64_t id, const Json& response) {
    auto pending = take_pending(id);
    if (!pending) {
        MCPHUB_LOG_WARN("server '{}': response for unknown request id {}", config_.name, id);
        return;
    }

    if (response.contains("error")) {
        auto rpc_error = McpError::from_json(response["error"]);
        pending->channel->try_send(asio::error_code{},
                                   ClientResult<Json>(tl::unexpected(ClientError::from_rpc_error(rpc_error))));
        return;
    }
    pending->channel->try_send(asio::error_code{},
                               ClientResult<Json>(response.value("result", Json())));
}

void ServerClient::handle_timeout(std::uint64_t id) {
    auto pending = take_pending(id);
    if (!pending) {
        return;  // already answered
    }

    circuit_breaker_.record_failure();
    MCPHUB_LOG_WARN("server '{}': request '{}' (id {}) timed out after {} ms",
                    config_.name, pending->method, id, pending->timeout.count());

    pending->channel->try_send(asio::error_code{}, ClientResult<Json>(tl::unexpected(
        ClientError::timeout(std::format("request '{}' to server '{}' timed out after {} ms",
                                         pending->method, config_.name, pending->timeout.count())))));
}

void ServerClient::fail_all_pending(const ClientError& error) {
    std::unordered_map<std::uint64_t, std::unique_ptr<PendingRequest>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_requests_);
    }
    for (auto& [id, request] : pending) {
        request->timeout_timer->cancel();
        request->channel->try_send(asio::error_code{}, ClientResult<Json>(tl::unexpected(error)));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Capabilities> ServerClient::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

std::optional<std::string> ServerClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::optional<std::chrono::system_clock::time_point> ServerClient::last_connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_connected_;
}

std::size_t ServerClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_requests_.size();
}

std::shared_ptr<IAsyncTransport> ServerClient::transport() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transport_;
}

void ServerClient::set_state(ConnectionState state) {
    const auto previous = state_.exchange(state);
    if (previous != state) {
        MCPHUB_LOG_INFO("server '{}': {} -> {}", config_.name, to_string(previous), to_string(state));
    }
}

void ServerClient::set_last_error(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = std::move(message);
}

// ─────────────────────────────────────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────────────────────────────────────

namespace {

template <typename Callback, typename... Args>
void safe_invoke(const std::string& server, const char* event,
                 const std::vector<Callback>& callbacks, Args&&... args) {
    for (const auto& callback : callbacks) {
        try {
            callback(args...);
        } catch (const std::exception& e) {
            MCPHUB_LOG_ERROR("server '{}': {} handler threw: {}", server, event, e.what());
        }
    }
}

}  // namespace

void ServerClient::on_connected(ConnectedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    connected_callbacks_.push_back(std::move(callback));
}

void ServerClient::on_disconnected(DisconnectedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    disconnected_callbacks_.push_back(std::move(callback));
}

void ServerClient::on_error(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

void ServerClient::on_notification(NotificationCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    notification_callbacks_.push_back(std::move(callback));
}

void ServerClient::emit_connected(const Capabilities& caps) {
    std::vector<ConnectedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = connected_callbacks_;
    }
    safe_invoke(config_.name, "connected", callbacks, caps);
}

void ServerClient::emit_disconnected() {
    std::vector<DisconnectedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = disconnected_callbacks_;
    }
    safe_invoke(config_.name, "disconnected", callbacks);
}

void ServerClient::emit_error(const ClientError& error) {
    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = error_callbacks_;
    }
    safe_invoke(config_.name, "error", callbacks, error);
}

void ServerClient::dispatch_notification(const std::string& method, const Json& params) {
    std::vector<NotificationCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks = notification_callbacks_;
    }
    if (callbacks.empty()) {
        MCPHUB_LOG_DEBUG("server '{}': unhandled notification '{}'", config_.name, method);
        return;
    }
    safe_invoke(config_.name, "notification", callbacks, method, params);
}

}  // namespace mcphub
