// Example 02: Circuit Breaker
//
// Demonstrates the per-server circuit breaker on a single ServerClient.

#include <mcphub/client/server_client.hpp>
#include <mcphub/resilience/circuit_breaker.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace mcphub;
using Json = nlohmann::json;

void print_stats(const CircuitBreakerStats& stats) {
    std::cout << "Total requests: " << stats.total_requests << "\n";
    std::cout << "Successful: " << stats.successful_requests << "\n";
    std::cout << "Failed: " << stats.failed_requests << "\n";
    std::cout << "Rejected: " << stats.rejected_requests << "\n";
    std::cout << "State: " << to_string(stats.current_state) << "\n\n";
}

asio::awaitable<void> run_client(std::shared_ptr<ServerClient> client) {
    std::cout << "=== Circuit Breaker Example ===\n\n";

    // 1. Register state change callback
    client->circuit_breaker().on_state_change([](CircuitState old_state, CircuitState new_state) {
        std::cout << "\n*** Circuit state changed: "
                  << to_string(old_state) << " -> " << to_string(new_state) << " ***\n\n";
    });

    // 2. Connect
    auto caps = co_await client->connect();
    if (!caps) {
        std::cerr << "Failed to connect: " << caps.error().message << "\n";
        co_return;
    }
    if (caps->server_info) {
        std::cout << "Connected to: " << caps->server_info->name << "\n\n";
    }

    // 3. Successful requests
    std::cout << "=== Making Successful Requests ===\n";
    for (int i = 0; i < 3; ++i) {
        auto result = co_await client->request("tools/call",
            CallToolParams{"list_directory", {{"path", "/tmp"}}}.to_json());
        std::cout << "Request " << (i + 1) << ": "
                  << (result ? "SUCCESS" : "FAILED - " + result.error().message) << "\n";
    }
    std::cout << "\n";
    print_stats(client->circuit_stats());

    // 4. Failing requests open the breaker
    std::cout << "=== Making Failing Requests ===\n";
    for (int i = 0; i < 4; ++i) {
        auto result = co_await client->request("no/such/method");
        std::cout << "Request " << (i + 1) << ": "
                  << (result ? std::string("SUCCESS") : std::string(to_string(result.error().code)))
                  << "\n";
    }
    std::cout << "\n";
    print_stats(client->circuit_stats());

    // 5. Manual control
    std::cout << "Forcing circuit CLOSED...\n";
    client->circuit_breaker().force_close();
    auto after_close = co_await client->request("tools/call",
        CallToolParams{"list_directory", {{"path", "/tmp"}}}.to_json());
    std::cout << "Request: " << (after_close ? "SUCCESS" : "FAILED - " + after_close.error().message) << "\n\n";

    std::cout << "=== Final Statistics ===\n";
    print_stats(client->circuit_stats());

    co_await client->disconnect();
    std::cout << "Done!\n";
}

int main() {
    ServerConfig config;
    config.name = "files";
    config.command = "npx";
    config.args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    config.retry_policy = RetryPolicy{.max_retries = 0};

    ClientOptions options;
    options.circuit_breaker.failure_threshold = 3;  // Open after 3 failures
    options.circuit_breaker.reset_timeout = std::chrono::seconds(5);

    std::cout << "Circuit Breaker Configuration:\n";
    std::cout << "  Failure threshold: " << options.circuit_breaker.failure_threshold << "\n";
    std::cout << "  Reset timeout: 5 seconds\n\n";

    asio::io_context io;
    auto client = std::make_shared<ServerClient>(io.get_executor(), config, options);

    asio::co_spawn(io, run_client(client), asio::detached);
    io.run();
    return 0;
}
