#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// MockTransport - scripted in-memory IAsyncTransport
// ─────────────────────────────────────────────────────────────────────────────
// Every sent message is recorded and handed to the responder, whose return
// value is queued as inbound traffic. Returning nothing leaves a request
// unanswered (useful to force timeouts). Tests can also inject messages
// directly and simulate the process exiting.

#include "mcphub/transport/async_transport.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub::testing {

class MockTransport : public IAsyncTransport {
public:
    using Responder = std::function<std::vector<Json>(const Json& message)>;

    explicit MockTransport(asio::any_io_executor executor, Responder responder = {})
        : executor_(executor)
        , responder_(std::move(responder))
        , inbound_(executor, 1024)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport
    // ─────────────────────────────────────────────────────────────────────────

    asio::any_io_executor get_executor() override { return executor_; }

    asio::awaitable<TransportResult<void>> async_start() override {
        ++start_count_;
        if (start_delay_.count() > 0) {
            asio::steady_timer timer(executor_, start_delay_);
            co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
        }
        if (fail_start_) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Spawn, "failed to execute 'mock': No such file or directory",
                std::nullopt});
        }
        running_ = true;
        co_return TransportResult<void>{};
    }

    asio::awaitable<void> async_stop() override {
        running_ = false;
        ++stop_count_;
        inbound_.close();
        co_return;
    }

    asio::awaitable<TransportResult<void>> async_send(Json message) override {
        if (!running_) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Io, "no live process", std::nullopt});
        }
        sent_.push_back(message);
        if (responder_) {
            for (auto& reply : responder_(message)) {
                push(std::move(reply));
            }
        }
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<Json>> async_receive() override {
        auto [ec, message] = co_await inbound_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Closed, "transport closed", std::nullopt});
        }
        co_return message;
    }

    [[nodiscard]] bool is_running() const override { return running_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Controls
    // ─────────────────────────────────────────────────────────────────────────

    /// Queue an inbound message as if the server had written it.
    void push(Json message) {
        inbound_.try_send(asio::error_code{}, TransportResult<Json>(std::move(message)));
    }

    /// The process went away: later sends fail and the client sees Closed.
    void simulate_exit(std::optional<int> exit_code = 0) {
        running_ = false;
        inbound_.try_send(asio::error_code{}, TransportResult<Json>(tl::unexpected(TransportError{
            TransportError::Category::Closed, "server process exited", exit_code})));
    }

    /// A read failure other than a clean exit.
    void simulate_io_error(std::string message = "read failed") {
        running_ = false;
        inbound_.try_send(asio::error_code{}, TransportResult<Json>(tl::unexpected(TransportError{
            TransportError::Category::Io, std::move(message), std::nullopt})));
    }

    void set_fail_start(bool fail) { fail_start_ = fail; }
    /// async_start() waits this long before reporting its outcome.
    void set_start_delay(std::chrono::milliseconds delay) { start_delay_ = delay; }
    void set_responder(Responder responder) { responder_ = std::move(responder); }

    [[nodiscard]] const std::vector<Json>& sent() const noexcept { return sent_; }

    [[nodiscard]] std::vector<Json> sent_with_method(const std::string& method) const {
        std::vector<Json> matches;
        for (const auto& message : sent_) {
            if (message.value("method", "") == method) {
                matches.push_back(message);
            }
        }
        return matches;
    }

    [[nodiscard]] int start_count() const noexcept { return start_count_; }
    [[nodiscard]] int stop_count() const noexcept { return stop_count_; }

private:
    using InboundChannel = asio::experimental::channel<void(asio::error_code, TransportResult<Json>)>;

    asio::any_io_executor executor_;
    Responder responder_;
    InboundChannel inbound_;
    std::vector<Json> sent_;
    bool running_{false};
    bool fail_start_{false};
    std::chrono::milliseconds start_delay_{0};
    int start_count_{0};
    int stop_count_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Reply builders
// ─────────────────────────────────────────────────────────────────────────────

inline Json reply(const Json& request, Json result) {
    return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}};
}

inline Json error_reply(const Json& request, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", request["id"]},
            {"error", {{"code", code}, {"message", message}}}};
}

inline bool is_request(const Json& message) {
    return message.contains("id") && message.contains("method");
}

/// initialize result carrying the given tools inline.
inline Json initialize_result(Json tools = Json::array(), Json resources = Json::array()) {
    return {
        {"protocolVersion", "2024-11-05"},
        {"serverInfo", {{"name", "mock-server"}, {"version", "1.0.0"}}},
        {"tools", std::move(tools)},
        {"resources", std::move(resources)}
    };
}

/// A well-behaved server: answers initialize, echoes tools/call arguments and
/// returns the uri for resources/read.
inline MockTransport::Responder echo_server(Json tools = Json::array({{{"name", "echo"}}}),
                                            Json resources = Json::array()) {
    return [tools, resources](const Json& message) -> std::vector<Json> {
        if (!is_request(message)) {
            return {};
        }
        const auto method = message["method"].get<std::string>();
        if (method == "initialize") {
            return {reply(message, initialize_result(tools, resources))};
        }
        if (method == "tools/call") {
            return {reply(message, {
                {"content", Json::array({{{"type", "text"}, {"text", message["params"]["name"]}}})},
                {"echo", message["params"].value("arguments", Json::object())}
            })};
        }
        if (method == "resources/read") {
            return {reply(message, {
                {"contents", Json::array({{{"uri", message["params"]["uri"]}, {"text", "data"}}})}
            })};
        }
        return {error_reply(message, -32601, "method not found: " + method)};
    };
}

}  // namespace mcphub::testing
