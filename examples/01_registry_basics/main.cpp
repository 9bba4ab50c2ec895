// Example 01: Registry Basics
//
// Loads a configuration file (or registers the filesystem server), lists the
// aggregated tools, calls one, and prints the health report.

#include <mcphub/log/spdlog_logger.hpp>
#include <mcphub/registry/registry_config.hpp>
#include <mcphub/registry/server_registry.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

using namespace mcphub;
using Json = nlohmann::json;

asio::awaitable<int> run_registry(ServerRegistry& registry, RegistryConfig config) {
    std::cout << "=== Registry Basics Example ===\n\n";

    // 1. Register every configured server (auto-connects)
    const auto added = co_await registry.initialize(std::move(config));
    std::cout << "Registered " << added << " server(s)\n\n";

    // 2. Connection status
    std::cout << "=== Connections ===\n";
    for (const auto& connection : registry.get_connections()) {
        std::cout << "  " << connection.server << ": " << to_string(connection.state);
        if (connection.error) {
            std::cout << " (" << *connection.error << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";

    // 3. Aggregated tools
    std::cout << "=== Available Tools ===\n";
    auto tools = registry.list_tools();
    if (tools && tools->empty()) {
        std::cout << "  (no tools available)\n";
    }
    if (tools) {
        for (const auto& entry : *tools) {
            std::cout << "  - " << entry.server << "/" << entry.tool.name;
            if (entry.tool.description) {
                std::cout << ": " << *entry.tool.description;
            }
            std::cout << "\n";
        }
    }
    std::cout << "\n";

    // 4. Call list_directory wherever it is offered
    if (tools) {
        for (const auto& entry : *tools) {
            if (entry.tool.name != "list_directory") {
                continue;
            }
            std::cout << "=== Calling: " << entry.server << "/list_directory ===\n";
            auto result = co_await registry.call_tool(entry.server, "list_directory", {{"path", "/tmp"}});
            if (result) {
                for (const auto& content : result->value("content", Json::array())) {
                    if (content.value("type", "") == "text") {
                        std::cout << content.value("text", "") << "\n";
                    }
                }
            } else {
                std::cerr << "  Failed: " << result.error().message << "\n";
            }
            std::cout << "\n";
            break;
        }
    }

    // 5. Health
    std::cout << "=== Health ===\n";
    std::cout << registry.health().to_json().dump(2) << "\n\n";

    // 6. Shutdown
    std::cout << "Shutting down...\n";
    co_await registry.shutdown();
    std::cout << "Done!\n";

    co_return 0;
}

int main(int argc, char* argv[]) {
    RegistryConfig config;
    if (argc > 1) {
        auto loaded = load_registry_config(argv[1]);
        if (!loaded) {
            std::cerr << "ERROR: " << loaded.error().message << "\n";
            return 1;
        }
        config = std::move(*loaded);
    } else {
        ServerConfig files;
        files.name = "files";
        files.command = "npx";
        files.args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
        config.servers.push_back(files);
    }
    config.enable_health_check = false;
    apply_environment_overrides(config);

    set_logger(make_logger(config.logging));

    asio::io_context io;
    ServerRegistry registry(io.get_executor());

    int exit_code = 1;
    asio::co_spawn(io, run_registry(registry, std::move(config)),
        [&](std::exception_ptr error, int code) {
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    std::cerr << "ERROR: " << e.what() << "\n";
                }
                return;
            }
            exit_code = code;
        });

    io.run();
    return exit_code;
}
