// ─────────────────────────────────────────────────────────────────────────────
// Integration Tests - End-to-End Over Real Pipes
// ─────────────────────────────────────────────────────────────────────────────
// The registry spawns a small /bin/sh server that speaks newline-delimited
// JSON-RPC, so these tests cover:
// - ProcessTransport spawning and framing
// - The initialize handshake
// - Tool calls routed through the registry
// - Process exit and reconnection

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcphub/registry/server_registry.hpp"
#include "test_helpers.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <string>

using namespace mcphub;
using namespace mcphub::testing;
using Json = nlohmann::json;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Test Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace {

// Requests are written compactly, so the id appears as "id":N.
constexpr const char* kShellServer = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([0-9][0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2024-11-05","serverInfo":{"name":"sh-server","version":"1.0"},"tools":[{"name":"greet","description":"says hello"},{"name":"quit"}]}}\n' "$id"
      ;;
    *'"name":"quit"'*)
      echo 'shutting down' >&2
      exit 0
      ;;
    *'"method":"tools/call"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"hello from %s"}]}}\n' "$id" "$SERVER_LABEL"
      ;;
    *)
      if [ -n "$id" ]; then
        printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32601,"message":"not supported"}}\n' "$id"
      fi
      ;;
  esac
done
)SH";

ServerConfig shell_server(std::string name, std::string label) {
    ServerConfig config;
    config.name = std::move(name);
    config.command = "/bin/sh";
    config.args = {"-c", kShellServer};
    config.env = {{"SERVER_LABEL", std::move(label)}};
    config.timeout = 5000ms;
    config.retry_policy = RetryPolicy{.max_retries = 0};
    return config;
}

RegistryOptions fast_options() {
    RegistryOptions options;
    options.backoff = std::make_shared<NoBackoff>();
    return options;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// End-to-End
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Integration: registry talks to real server processes", "[integration]") {
    asio::io_context io;
    ServerRegistry registry(io.get_executor(), fast_options());

    REQUIRE(run_sync(io, registry.add_server(shell_server("left", "L"))).has_value());
    REQUIRE(run_sync(io, registry.add_server(shell_server("right", "R"))).has_value());

    auto left = registry.get_connection("left");
    REQUIRE(left.has_value());
    REQUIRE(left->state == ConnectionState::Connected);
    REQUIRE(left->capabilities->server_info->name == "sh-server");

    auto tools = registry.list_tools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 4);

    auto from_left = run_sync(io, registry.call_tool("left", "greet"));
    REQUIRE(from_left.has_value());
    REQUIRE((*from_left)["content"][0]["text"] == "hello from L");

    auto from_right = run_sync(io, registry.call_tool("right", "greet", {{"who", "you"}}));
    REQUIRE(from_right.has_value());
    REQUIRE((*from_right)["content"][0]["text"] == "hello from R");

    auto unsupported = run_sync(io, registry.get_resource("left", "file:///nothing"));
    REQUIRE_FALSE(unsupported.has_value());
    REQUIRE(unsupported.error().code == ClientErrorCode::ServerError);
    REQUIRE(unsupported.error().rpc_code() == -32601);

    REQUIRE(registry.health().healthy);

    run_sync(io, registry.shutdown());
    REQUIRE(registry.server_names().empty());
}

TEST_CASE("Integration: server exit is observed and reconnect works", "[integration]") {
    asio::io_context io;
    ServerRegistry registry(io.get_executor(), fast_options());

    REQUIRE(run_sync(io, registry.add_server(shell_server("solo", "S"))).has_value());

    int disconnects = 0;
    registry.on_server_disconnected([&](const std::string&) { ++disconnects; });

    // The server exits instead of answering, so the call fails and the
    // connection drops.
    auto quit = run_sync(io, registry.call_tool("solo", "quit"));
    REQUIRE_FALSE(quit.has_value());
    REQUIRE(quit.error().code == ClientErrorCode::TransportError);

    run_for(io, 100ms);
    REQUIRE(disconnects == 1);
    REQUIRE(registry.get_connection("solo")->state == ConnectionState::Disconnected);

    auto not_connected = run_sync(io, registry.call_tool("solo", "greet"));
    REQUIRE_FALSE(not_connected.has_value());
    REQUIRE(not_connected.error().code == ClientErrorCode::NotConnected);

    auto reconnected = run_sync(io, registry.connect_server("solo"));
    REQUIRE(reconnected.has_value());

    auto greeting = run_sync(io, registry.call_tool("solo", "greet"));
    REQUIRE(greeting.has_value());
    REQUIRE((*greeting)["content"][0]["text"] == "hello from S");

    run_sync(io, registry.shutdown());
}

TEST_CASE("Integration: a missing executable leaves the server in error", "[integration]") {
    asio::io_context io;
    ServerRegistry registry(io.get_executor(), fast_options());

    ServerConfig missing;
    missing.name = "missing";
    missing.command = "/nonexistent/mcphub-server";

    REQUIRE(run_sync(io, registry.add_server(missing)).has_value());

    auto connection = registry.get_connection("missing");
    REQUIRE(connection.has_value());
    REQUIRE(connection->state == ConnectionState::Error);
    REQUIRE(connection->error->find("/nonexistent/mcphub-server") != std::string::npos);
    REQUIRE_FALSE(registry.health().healthy);

    run_sync(io, registry.shutdown());
}
