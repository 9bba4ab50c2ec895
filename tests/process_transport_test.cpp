// ─────────────────────────────────────────────────────────────────────────────
// Process Transport Tests
// ─────────────────────────────────────────────────────────────────────────────
// Exercises the pipe transport against small /bin/sh scripts, so no external
// capability server is required.

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcphub/transport/process_transport.hpp"
#include "test_helpers.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <set>
#include <string>

using namespace mcphub;
using namespace mcphub::testing;
using Json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Reads JSON lines from stdin and writes them back unchanged.
constexpr const char* kEchoScript = "while IFS= read -r line; do printf '%s\\n' \"$line\"; done";

std::shared_ptr<ProcessTransport> make_shell(asio::io_context& io, std::string script) {
    ProcessConfig config;
    config.command = "/bin/sh";
    config.args = {"-c", std::move(script)};
    config.name = "test-shell";
    return std::make_shared<ProcessTransport>(io.get_executor(), config);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport starts and stops cleanly", "[process][lifecycle]") {
    asio::io_context io;
    auto transport = make_shell(io, "sleep 30");

    REQUIRE_FALSE(transport->is_running());

    auto started = run_sync(io, transport->async_start());
    REQUIRE(started.has_value());
    REQUIRE(transport->is_running());
    REQUIRE(transport->child_pid() > 0);

    run_sync(io, transport->async_stop());
    REQUIRE_FALSE(transport->is_running());
    REQUIRE(transport->exit_code().has_value());

    // Stopping twice is harmless
    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport rejects a second start", "[process][lifecycle]") {
    asio::io_context io;
    auto transport = make_shell(io, "sleep 30");

    REQUIRE(run_sync(io, transport->async_start()).has_value());
    auto second = run_sync(io, transport->async_start());
    REQUIRE_FALSE(second.has_value());

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport reports exec failures from start", "[process][error]") {
    asio::io_context io;

    ProcessConfig config;
    config.command = "/nonexistent/mcphub-test-binary";
    auto transport = std::make_shared<ProcessTransport>(io.get_executor(), config);

    auto started = run_sync(io, transport->async_start());
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().category == TransportError::Category::Spawn);
    REQUIRE(started.error().message.find("/nonexistent/mcphub-test-binary") != std::string::npos);
    REQUIRE_FALSE(transport->is_running());
}

TEST_CASE("ProcessTransport rejects an empty command", "[process][error]") {
    asio::io_context io;
    auto transport = std::make_shared<ProcessTransport>(io.get_executor(), ProcessConfig{});

    auto started = run_sync(io, transport->async_start());
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().category == TransportError::Category::Spawn);
}

TEST_CASE("ProcessTransport send fails immediately without a process", "[process][error]") {
    asio::io_context io;
    auto transport = make_shell(io, kEchoScript);

    auto sent = run_sync(io, transport->async_send({{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}}));
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().category == TransportError::Category::Io);
}

// ═══════════════════════════════════════════════════════════════════════════
// Framing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport round-trips newline-delimited JSON", "[process][framing]") {
    asio::io_context io;
    auto transport = make_shell(io, kEchoScript);
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    Json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}, {"params", Json::object()}};
    REQUIRE(run_sync(io, transport->async_send(request)).has_value());

    auto received = run_sync(io, transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE(*received == request);

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport keeps message order", "[process][framing]") {
    asio::io_context io;
    auto transport = make_shell(io,
        "printf '{\"n\":1}\\n{\"n\":2}\\n'; printf '{\"n\":3}\\n'; sleep 5");
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    for (int expected = 1; expected <= 3; ++expected) {
        auto received = run_sync(io, transport->async_receive());
        REQUIRE(received.has_value());
        REQUIRE((*received)["n"] == expected);
    }

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport drops malformed and blank lines", "[process][framing]") {
    asio::io_context io;
    auto transport = make_shell(io,
        "echo 'this is not json'; echo ''; printf '{\"ok\":true}\\r\\n'; sleep 5");
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    auto received = run_sync(io, transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["ok"] == true);

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport drops lines longer than the limit", "[process][framing]") {
    asio::io_context io;

    ProcessConfig config;
    config.command = "/bin/sh";
    config.args = {"-c",
        "printf '{\"padding\":\"xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx\"}\\n';"
        "printf '{\"n\":1}\\n'; sleep 5"};
    config.max_line_size = 32;
    auto transport = std::make_shared<ProcessTransport>(io.get_executor(), config);
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    auto received = run_sync(io, transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["n"] == 1);

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport serializes concurrent senders", "[process][framing]") {
    asio::io_context io;
    auto transport = make_shell(io, kEchoScript);
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    constexpr int kMessages = 25;
    auto received_ids = run_sync(io, [&]() -> asio::awaitable<std::set<int>> {
        for (int i = 0; i < kMessages; ++i) {
            asio::co_spawn(io, [transport, i]() -> asio::awaitable<void> {
                Json message = {{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"},
                                {"params", {{"payload", std::string(512, 'a' + i % 26)}}}};
                co_await transport->async_send(std::move(message));
            }, asio::detached);
        }

        std::set<int> ids;
        for (int i = 0; i < kMessages; ++i) {
            auto message = co_await transport->async_receive();
            if (message) {
                ids.insert((*message)["id"].get<int>());
            }
        }
        co_return ids;
    }());

    REQUIRE(received_ids.size() == kMessages);

    run_sync(io, transport->async_stop());
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment and Diagnostics
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport passes environment overrides", "[process][env]") {
    asio::io_context io;

    ProcessConfig config;
    config.command = "/bin/sh";
    config.args = {"-c", "printf '{\"value\":\"%s\",\"home\":\"%s\"}\\n' \"$MCPHUB_TEST_VAR\" \"${HOME:+set}\"; sleep 5"};
    config.env = {{"MCPHUB_TEST_VAR", "override"}};
    auto transport = std::make_shared<ProcessTransport>(io.get_executor(), config);
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    auto received = run_sync(io, transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["value"] == "override");

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport captures stderr", "[process][stderr]") {
    asio::io_context io;
    auto transport = make_shell(io,
        "echo 'warming up' >&2; sleep 0.3; printf '{\"ready\":true}\\n'; sleep 5");
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    auto received = run_sync(io, transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE(transport->stderr_output().find("warming up") != std::string::npos);

    run_sync(io, transport->async_stop());
}

TEST_CASE("ProcessTransport surfaces process exit as Closed", "[process][exit]") {
    asio::io_context io;
    auto transport = make_shell(io, "printf '{\"last\":true}\\n'; exit 3");
    REQUIRE(run_sync(io, transport->async_start()).has_value());

    auto last = run_sync(io, transport->async_receive());
    REQUIRE(last.has_value());
    REQUIRE((*last)["last"] == true);

    auto closed = run_sync(io, transport->async_receive());
    REQUIRE_FALSE(closed.has_value());
    REQUIRE(closed.error().category == TransportError::Category::Closed);
    REQUIRE(transport->exit_code() == 3);
    REQUIRE_FALSE(transport->is_running());

    // Nothing to write to any more
    auto sent = run_sync(io, transport->async_send({{"method", "ping"}}));
    REQUIRE_FALSE(sent.has_value());
    REQUIRE(sent.error().category == TransportError::Category::Io);
}
