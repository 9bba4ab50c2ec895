// ─────────────────────────────────────────────────────────────────────────────
// ServerRegistry Tests
// ─────────────────────────────────────────────────────────────────────────────
// Registration, routing, listing, projections, events, health monitoring and
// shutdown, all against MockTransport servers.

#include <catch2/catch_test_macros.hpp>

#include "mcphub/registry/health_monitor.hpp"
#include "mcphub/registry/server_registry.hpp"
#include "mocks/mock_transport.hpp"
#include "test_helpers.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

ServerConfig server(std::string name, bool auto_connect = true) {
    ServerConfig config;
    config.name = std::move(name);
    config.command = "mock-" + config.name;
    config.retry_policy = RetryPolicy{.max_retries = 0};
    config.auto_connect = auto_connect;
    return config;
}

Json tools(std::initializer_list<const char*> names) {
    Json list = Json::array();
    for (const auto* name : names) {
        list.push_back({{"name", name}});
    }
    return list;
}

// Answers nothing, so every request waits for its timeout.
MockTransport::Responder silent_server() {
    return [](const Json&) -> std::vector<Json> { return {}; };
}

// Stopping fails with something that is not a std::exception.
class UnstoppableTransport : public MockTransport {
public:
    using MockTransport::MockTransport;

    asio::awaitable<void> async_stop() override {
        co_await MockTransport::async_stop();
        throw 42;
    }
};

// One mock server per registered name. Unknown names get echo_server().
struct RegistryFixture {
    asio::io_context io;
    std::map<std::string, MockTransport::Responder> responders;
    std::set<std::string> failing;
    std::map<std::string, std::vector<std::shared_ptr<MockTransport>>> transports;
    std::unique_ptr<ServerRegistry> registry;

    explicit RegistryFixture(RegistryOptions options = {}) {
        options.default_timeout = 1000ms;
        options.backoff = std::make_shared<NoBackoff>();
        options.transport_factory = [this](asio::any_io_executor ex, const ServerConfig& config) {
            auto it = responders.find(config.name);
            auto transport = std::make_shared<MockTransport>(
                ex, it != responders.end() ? it->second : echo_server());
            transport->set_fail_start(failing.count(config.name) > 0);
            transports[config.name].push_back(transport);
            return transport;
        };
        registry = std::make_unique<ServerRegistry>(io.get_executor(), std::move(options));
    }

    ClientResult<void> add(ServerConfig config) {
        return run_sync(io, registry->add_server(std::move(config)));
    }

    MockTransport& transport(const std::string& name) { return *transports.at(name).back(); }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry adds and auto-connects servers", "[registry][add]") {
    RegistryFixture f;

    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.registry->server_names() == std::vector<std::string>{"alpha"});

    auto client = f.registry->get_client("alpha");
    REQUIRE(client != nullptr);
    REQUIRE(client->is_connected());
    REQUIRE(f.transport("alpha").start_count() == 1);
}

TEST_CASE("ServerRegistry leaves servers alone when auto-connect is off", "[registry][add]") {
    SECTION("disabled per server") {
        RegistryFixture f;
        REQUIRE(f.add(server("alpha", false)).has_value());
        REQUIRE(f.transports.empty());
        REQUIRE(f.registry->get_client("alpha")->state() == ConnectionState::Disconnected);
    }

    SECTION("disabled globally") {
        RegistryOptions options;
        options.enable_auto_connect = false;
        RegistryFixture f(options);
        REQUIRE(f.add(server("alpha", true)).has_value());
        REQUIRE(f.transports.empty());
    }
}

TEST_CASE("ServerRegistry rejects duplicate and invalid servers", "[registry][add]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());

    auto duplicate = f.add(server("alpha"));
    REQUIRE_FALSE(duplicate.has_value());
    REQUIRE(duplicate.error().code == ClientErrorCode::DuplicateServer);
    REQUIRE(f.transports.at("alpha").size() == 1);

    ServerConfig invalid;
    invalid.name = "no-command";
    auto rejected = f.add(invalid);
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().code == ClientErrorCode::InvalidConfig);
    REQUIRE(f.registry->get_client("no-command") == nullptr);
}

TEST_CASE("ServerRegistry keeps a server whose auto-connect failed", "[registry][add][error]") {
    RegistryFixture f;
    f.failing.insert("broken");

    std::vector<std::pair<std::string, std::string>> errors;
    f.registry->on_server_error([&](const std::string& name, const std::string& message) {
        errors.emplace_back(name, message);
    });

    REQUIRE(f.add(server("broken")).has_value());
    REQUIRE(f.registry->server_names() == std::vector<std::string>{"broken"});

    auto connection = f.registry->get_connection("broken");
    REQUIRE(connection.has_value());
    REQUIRE(connection->state == ConnectionState::Error);
    REQUIRE(connection->error.has_value());
    REQUIRE_FALSE(connection->capabilities.has_value());

    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].first == "broken");

    auto call = run_sync(f.io, f.registry->call_tool("broken", "echo"));
    REQUIRE_FALSE(call.has_value());
    REQUIRE(call.error().code == ClientErrorCode::NotConnected);
}

TEST_CASE("ServerRegistry removes servers", "[registry][remove]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.add(server("beta")).has_value());

    auto removed = run_sync(f.io, f.registry->remove_server("alpha"));
    REQUIRE(removed.has_value());
    REQUIRE(f.registry->server_names() == std::vector<std::string>{"beta"});
    REQUIRE_FALSE(f.registry->get_connection("alpha").has_value());
    REQUIRE(f.transport("alpha").stop_count() == 1);

    auto call = run_sync(f.io, f.registry->call_tool("alpha", "echo"));
    REQUIRE_FALSE(call.has_value());
    REQUIRE(call.error().code == ClientErrorCode::UnknownServer);

    auto again = run_sync(f.io, f.registry->remove_server("alpha"));
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ClientErrorCode::UnknownServer);
}

// ═══════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry fails calls to unknown servers without sending", "[registry][call]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());
    const auto sent_before = f.transport("alpha").sent().size();

    auto call = run_sync(f.io, f.registry->call_tool("ghost", "echo"));
    REQUIRE_FALSE(call.has_value());
    REQUIRE(call.error().code == ClientErrorCode::UnknownServer);
    REQUIRE(call.error().message.find("ghost") != std::string::npos);

    auto resource = run_sync(f.io, f.registry->get_resource("ghost", "file:///x"));
    REQUIRE_FALSE(resource.has_value());
    REQUIRE(resource.error().code == ClientErrorCode::UnknownServer);

    auto connect = run_sync(f.io, f.registry->connect_server("ghost"));
    REQUIRE_FALSE(connect.has_value());
    REQUIRE(connect.error().code == ClientErrorCode::UnknownServer);

    auto disconnect = run_sync(f.io, f.registry->disconnect_server("ghost"));
    REQUIRE_FALSE(disconnect.has_value());

    REQUIRE(f.transport("alpha").sent().size() == sent_before);
}

TEST_CASE("ServerRegistry fails calls to disconnected servers", "[registry][call]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha", false)).has_value());

    auto call = run_sync(f.io, f.registry->call_tool("alpha", "echo"));
    REQUIRE_FALSE(call.has_value());
    REQUIRE(call.error().code == ClientErrorCode::NotConnected);

    auto resource = run_sync(f.io, f.registry->get_resource("alpha", "file:///x"));
    REQUIRE_FALSE(resource.has_value());
    REQUIRE(resource.error().code == ClientErrorCode::NotConnected);
    REQUIRE(f.transports.empty());
}

TEST_CASE("ServerRegistry routes tool calls to the named server", "[registry][call]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.add(server("beta")).has_value());

    auto result = run_sync(f.io, f.registry->call_tool("beta", "echo", {{"text", "hi"}}));
    REQUIRE(result.has_value());
    REQUIRE((*result)["echo"]["text"] == "hi");
    REQUIRE((*result)["content"][0]["text"] == "echo");

    auto beta_calls = f.transport("beta").sent_with_method("tools/call");
    REQUIRE(beta_calls.size() == 1);
    REQUIRE(beta_calls[0]["params"]["name"] == "echo");
    REQUIRE(beta_calls[0]["params"]["arguments"]["text"] == "hi");
    REQUIRE(f.transport("alpha").sent_with_method("tools/call").empty());
}

TEST_CASE("ServerRegistry reads resources", "[registry][call]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());

    auto result = run_sync(f.io, f.registry->get_resource("alpha", "file:///etc/motd"));
    REQUIRE(result.has_value());
    REQUIRE((*result)["contents"][0]["uri"] == "file:///etc/motd");

    auto reads = f.transport("alpha").sent_with_method("resources/read");
    REQUIRE(reads.size() == 1);
    REQUIRE(reads[0]["params"]["uri"] == "file:///etc/motd");
}

TEST_CASE("ServerRegistry passes per-call timeouts", "[registry][call][timeout]") {
    RegistryFixture f;
    auto echo = echo_server();
    f.responders["alpha"] = [echo](const Json& message) -> std::vector<Json> {
        if (message.value("method", "") == "tools/call" && message["params"]["name"] == "slow") {
            return {};
        }
        return echo(message);
    };
    REQUIRE(f.add(server("alpha")).has_value());

    auto result = run_sync(f.io, f.registry->call_tool("alpha", "slow", Json::object(), CallOptions{50ms}));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ClientErrorCode::Timeout);
    REQUIRE(result.error().rpc_code() == ErrorCode::Timeout);
}

// ═══════════════════════════════════════════════════════════════════════════
// Listing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry lists the union of connected servers' tools", "[registry][list]") {
    RegistryFixture f;
    f.responders["alpha"] = echo_server(tools({"read", "write"}));
    f.responders["beta"] = echo_server(tools({"search"}),
                                       Json::array({{{"uri", "db://users"}, {"name", "users"}}}));
    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.add(server("beta")).has_value());
    REQUIRE(f.add(server("gamma", false)).has_value());

    auto all = f.registry->list_tools();
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 3);

    std::multiset<std::string> tagged;
    for (const auto& entry : *all) {
        tagged.insert(entry.server + "/" + entry.tool.name);
    }
    REQUIRE(tagged == std::multiset<std::string>{"alpha/read", "alpha/write", "beta/search"});
    REQUIRE((*all)[0].to_json().contains("server"));

    auto resources = f.registry->list_resources();
    REQUIRE(resources.has_value());
    REQUIRE(resources->size() == 1);
    REQUIRE((*resources)[0].server == "beta");
    REQUIRE((*resources)[0].to_json()["uri"] == "db://users");

    auto prompts = f.registry->list_prompts();
    REQUIRE(prompts.has_value());
    REQUIRE(prompts->empty());

    SECTION("filtered by server") {
        auto beta = f.registry->list_tools("beta");
        REQUIRE(beta.has_value());
        REQUIRE(beta->size() == 1);

        auto gamma = f.registry->list_tools("gamma");
        REQUIRE(gamma.has_value());
        REQUIRE(gamma->empty());

        auto ghost = f.registry->list_tools("ghost");
        REQUIRE_FALSE(ghost.has_value());
        REQUIRE(ghost.error().code == ClientErrorCode::UnknownServer);
    }

    SECTION("disconnected servers drop out") {
        REQUIRE(run_sync(f.io, f.registry->disconnect_server("alpha")).has_value());
        auto remaining = f.registry->list_tools();
        REQUIRE(remaining.has_value());
        REQUIRE(remaining->size() == 1);
        REQUIRE((*remaining)[0].server == "beta");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Projections and Health
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry projects connection state", "[registry][connections]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());

    auto connection = f.registry->get_connection("alpha");
    REQUIRE(connection.has_value());
    REQUIRE(connection->server == "alpha");
    REQUIRE(connection->id.rfind("conn_", 0) == 0);
    REQUIRE(connection->state == ConnectionState::Connected);
    REQUIRE(connection->capabilities.has_value());
    REQUIRE(connection->last_connected.has_value());
    REQUIRE(connection->circuit_state == CircuitState::Closed);

    auto j = connection->to_json();
    REQUIRE(j["state"] == "connected");
    REQUIRE(j["circuitState"] == "closed");
    REQUIRE(j["lastConnected"].get<std::string>().back() == 'Z');
    REQUIRE(j["capabilities"]["tools"].size() == 1);

    REQUIRE(run_sync(f.io, f.registry->disconnect_server("alpha")).has_value());
    connection = f.registry->get_connection("alpha");
    REQUIRE(connection.has_value());
    REQUIRE(connection->state == ConnectionState::Disconnected);
    REQUIRE_FALSE(connection->capabilities.has_value());
    REQUIRE(connection->last_connected.has_value());

    REQUIRE(f.registry->get_connections().size() == 1);
}

TEST_CASE("ServerRegistry follows a server process exit", "[registry][connections]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.add(server("beta")).has_value());
    REQUIRE(f.registry->health().healthy);

    f.transport("beta").simulate_exit(1);
    run_for(f.io, 20ms);

    auto beta = f.registry->get_connection("beta");
    REQUIRE(beta->state == ConnectionState::Disconnected);

    auto report = f.registry->health();
    REQUIRE_FALSE(report.healthy);
    REQUIRE(report.servers.size() == 2);

    auto j = report.to_json();
    REQUIRE(j["healthy"] == false);
    REQUIRE(j["servers"].size() == 2);
    REQUIRE(j.contains("checkedAt"));
}

TEST_CASE("ServerRegistry reports an empty registry as healthy", "[registry][health]") {
    RegistryFixture f;
    auto report = f.registry->health();
    REQUIRE(report.healthy);
    REQUIRE(report.servers.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry forwards client events with the server name", "[registry][events]") {
    RegistryFixture f;

    std::vector<std::string> connected;
    std::vector<std::string> disconnected;
    std::vector<std::string> notifications;
    f.registry->on_server_connected([&](const std::string& name, const Capabilities& caps) {
        connected.push_back(name + ":" + std::to_string(caps.tools.size()));
    });
    f.registry->on_server_disconnected([&](const std::string& name) {
        disconnected.push_back(name);
    });
    f.registry->on_notification([&](const std::string& name, const std::string& method, const Json&) {
        notifications.push_back(name + " " + method);
    });
    f.registry->on_server_connected([](const std::string&, const Capabilities&) {
        throw std::runtime_error("subscriber failure stays contained");
    });

    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(connected == std::vector<std::string>{"alpha:1"});

    f.transport("alpha").push({{"jsonrpc", "2.0"}, {"method", "notifications/resources/updated"},
                               {"params", {{"uri", "file:///x"}}}});
    run_for(f.io, 20ms);
    REQUIRE(notifications == std::vector<std::string>{"alpha notifications/resources/updated"});

    REQUIRE(run_sync(f.io, f.registry->disconnect_server("alpha")).has_value());
    REQUIRE(disconnected == std::vector<std::string>{"alpha"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Initialize and Shutdown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ServerRegistry initializes from configuration", "[registry][initialize]") {
    RegistryFixture f;

    RegistryConfig config;
    config.servers = {server("alpha"), server("alpha"), server("beta", false)};
    config.enable_health_check = false;
    config.client_info = {"test-agent", "9.9"};

    const auto added = run_sync(f.io, f.registry->initialize(config));
    REQUIRE(added == 2);
    REQUIRE(f.registry->server_names() == std::vector<std::string>{"alpha", "beta"});
    REQUIRE(f.registry->get_client("alpha")->is_connected());
    REQUIRE_FALSE(f.registry->get_client("beta")->is_connected());

    auto init = f.transport("alpha").sent_with_method("initialize");
    REQUIRE(init.size() == 1);
    REQUIRE(init[0]["params"]["clientInfo"]["name"] == "test-agent");

    run_sync(f.io, f.registry->shutdown());
}

TEST_CASE("ServerRegistry shutdown disconnects every server", "[registry][shutdown]") {
    RegistryFixture f;
    REQUIRE(f.add(server("alpha")).has_value());
    REQUIRE(f.add(server("beta")).has_value());
    REQUIRE(f.add(server("gamma", false)).has_value());

    int disconnected = 0;
    f.registry->on_server_disconnected([&](const std::string&) { ++disconnected; });

    run_sync(f.io, f.registry->shutdown());

    REQUIRE(f.registry->server_names().empty());
    REQUIRE(f.registry->get_connections().empty());
    REQUIRE(f.transport("alpha").stop_count() == 1);
    REQUIRE(f.transport("beta").stop_count() == 1);
    REQUIRE(disconnected == 2);

    // Nothing left to shut down
    run_sync(f.io, f.registry->shutdown());
}

TEST_CASE("ServerRegistry shutdown completes when a transport fails to stop", "[registry][shutdown]") {
    asio::io_context io;
    std::vector<std::shared_ptr<UnstoppableTransport>> created;

    RegistryOptions options;
    options.default_timeout = 1000ms;
    options.backoff = std::make_shared<NoBackoff>();
    options.transport_factory = [&created](asio::any_io_executor ex, const ServerConfig&) {
        auto transport = std::make_shared<UnstoppableTransport>(ex, echo_server());
        created.push_back(transport);
        return transport;
    };
    ServerRegistry registry(io.get_executor(), options);

    REQUIRE(run_sync(io, registry.add_server(server("alpha"))).has_value());
    REQUIRE(run_sync(io, registry.add_server(server("beta"))).has_value());

    REQUIRE_NOTHROW(run_sync(io, registry.shutdown()));

    REQUIRE(registry.server_names().empty());
    REQUIRE(registry.get_connections().empty());
    REQUIRE(created.size() == 2);
    for (const auto& transport : created) {
        REQUIRE(transport->stop_count() == 1);
        REQUIRE_FALSE(transport->is_running());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Health Monitor
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HealthMonitor reconnects servers in error", "[registry][health_monitor]") {
    RegistryFixture f;
    f.failing.insert("flaky");
    REQUIRE(f.add(server("flaky")).has_value());
    REQUIRE(f.registry->get_connection("flaky")->state == ConnectionState::Error);

    f.failing.clear();

    auto monitor = std::make_shared<HealthMonitor>(f.io.get_executor(), *f.registry, 1000ms);
    std::vector<HealthReport> reports;
    monitor->on_check([&](const HealthReport& report) { reports.push_back(report); });

    run_sync(f.io, monitor->check_once());

    REQUIRE(monitor->checks_completed() == 1);
    REQUIRE(reports.size() == 1);
    REQUIRE_FALSE(reports[0].healthy);
    REQUIRE(f.registry->get_connection("flaky")->state == ConnectionState::Connected);
    REQUIRE(f.transports.at("flaky").size() == 2);
}

TEST_CASE("HealthMonitor skips servers without auto-connect", "[registry][health_monitor]") {
    RegistryFixture f;
    f.failing.insert("manual");
    REQUIRE(f.add(server("manual", false)).has_value());
    REQUIRE_FALSE(run_sync(f.io, f.registry->connect_server("manual")).has_value());
    REQUIRE(f.registry->get_connection("manual")->state == ConnectionState::Error);

    f.failing.clear();
    auto monitor = std::make_shared<HealthMonitor>(f.io.get_executor(), *f.registry, 1000ms);
    run_sync(f.io, monitor->check_once());

    REQUIRE(f.registry->get_connection("manual")->state == ConnectionState::Error);
    REQUIRE(f.transports.at("manual").size() == 1);
}

TEST_CASE("HealthMonitor abandons a reconnect cut short by shutdown", "[registry][health_monitor][shutdown]") {
    RegistryFixture f;
    f.failing.insert("flaky");
    REQUIRE(f.add(server("flaky")).has_value());
    f.failing.clear();
    f.responders["flaky"] = silent_server();

    auto monitor = std::make_shared<HealthMonitor>(f.io.get_executor(), *f.registry, 1h);
    bool finished = false;
    asio::co_spawn(f.io, [monitor, &finished]() -> asio::awaitable<void> {
        co_await monitor->check_once();
        finished = true;
    }, asio::detached);

    run_for(f.io, 20ms);
    REQUIRE(f.transports.at("flaky").size() == 2);
    REQUIRE(f.registry->get_client("flaky")->state() == ConnectionState::Connecting);

    monitor->stop();
    run_sync(f.io, f.registry->shutdown());
    run_for(f.io, 100ms);

    REQUIRE(finished);
    REQUIRE(monitor->checks_completed() == 0);
    REQUIRE(f.registry->server_names().empty());
    REQUIRE(f.registry->get_connections().empty());
    REQUIRE_FALSE(f.transport("flaky").is_running());
}

TEST_CASE("HealthMonitor disconnects a reconnect that completes after stop", "[registry][health_monitor]") {
    RegistryFixture f;
    f.failing.insert("flaky");
    REQUIRE(f.add(server("flaky")).has_value());
    f.failing.clear();

    std::optional<Json> initialize;
    f.responders["flaky"] = [&initialize](const Json& message) -> std::vector<Json> {
        if (message.value("method", "") == "initialize") {
            initialize = message;
        }
        return {};
    };

    auto monitor = std::make_shared<HealthMonitor>(f.io.get_executor(), *f.registry, 1h);
    bool finished = false;
    asio::co_spawn(f.io, [monitor, &finished]() -> asio::awaitable<void> {
        co_await monitor->check_once();
        finished = true;
    }, asio::detached);

    run_for(f.io, 20ms);
    REQUIRE(initialize.has_value());

    // The server answers only after the monitor was told to stop
    monitor->stop();
    f.transport("flaky").push(reply(*initialize, initialize_result()));
    run_for(f.io, 100ms);

    auto client = f.registry->get_client("flaky");
    REQUIRE(finished);
    REQUIRE(monitor->checks_completed() == 0);
    REQUIRE(client->state() == ConnectionState::Disconnected);
    REQUIRE(f.transport("flaky").stop_count() == 1);
    REQUIRE_FALSE(f.transport("flaky").is_running());

    run_sync(f.io, f.registry->shutdown());
}

TEST_CASE("HealthMonitor outlives a registry destroyed mid-reconnect", "[registry][health_monitor]") {
    RegistryFixture f;
    auto slow = [](ServerConfig config) {
        config.timeout = 100ms;
        return config;
    };

    f.failing = {"a", "b"};
    REQUIRE(f.add(slow(server("a"))).has_value());
    REQUIRE(f.add(slow(server("b"))).has_value());
    f.failing.clear();
    f.responders["a"] = silent_server();
    f.responders["b"] = silent_server();

    f.registry->start_health_monitor(10ms);
    run_for(f.io, 30ms);
    REQUIRE(f.transports.at("a").size() == 2);

    // Destroying the registry stops the monitor; the pending reconnect of
    // "a" runs into its timeout and "b" is never attempted.
    f.registry.reset();
    run_for(f.io, 300ms);

    REQUIRE(f.transports.at("a").size() == 2);
    REQUIRE(f.transports.at("b").size() == 1);
    REQUIRE_FALSE(f.transport("a").is_running());
    REQUIRE(f.transport("a").stop_count() == 1);
}

TEST_CASE("ServerRegistry runs periodic health checks", "[registry][health_monitor]") {
    RegistryFixture f;
    f.failing.insert("flaky");
    REQUIRE(f.add(server("flaky")).has_value());
    f.failing.clear();

    f.registry->start_health_monitor(20ms);
    run_for(f.io, 150ms);

    REQUIRE(f.registry->get_connection("flaky")->state == ConnectionState::Connected);
    REQUIRE(f.registry->health().healthy);

    f.registry->stop_health_monitor();
    run_sync(f.io, f.registry->shutdown());
}
