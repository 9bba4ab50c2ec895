// ─────────────────────────────────────────────────────────────────────────────
// mcphub-cli - capability server registry tool
// ─────────────────────────────────────────────────────────────────────────────
// Loads a registry configuration (or a single server given on the command
// line), connects the servers, and runs one command against them.
//
// Usage:
//   # Every server in a config file
//   mcphub-cli --config mcphub.json --health
//   mcphub-cli --config mcphub.json --list-tools
//   mcphub-cli --config mcphub.json --server fs --call-tool read_file \
//              --tool-args '{"path":"/tmp/notes.txt"}'
//
//   # A single server
//   mcphub-cli -c python3 -a server.py --list-resources --json
//
// Environment:
//   MCPHUB_ENV, MCPHUB_SERVERS, MCPHUB_LOG_LEVEL (see registry_config.hpp)

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcphub/log/logger.hpp"
#include "mcphub/log/spdlog_logger.hpp"
#include "mcphub/registry/registry_config.hpp"
#include "mcphub/registry/server_registry.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mcphub;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* blue    = "\033[34m";
    const char* magenta = "\033[35m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

const char* state_color(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected:    return color::green;
        case ConnectionState::Connecting:   return color::yellow;
        case ConnectionState::Error:        return color::red;
        case ConnectionState::Disconnected: return color::dim;
    }
    return color::reset;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

struct CliCommand {
    enum class Kind { Health, ListTools, ListResources, ListPrompts, CallTool, ReadResource };

    Kind kind{Kind::Health};
    std::optional<std::string> server;
    std::string tool;
    std::string tool_args{"{}"};
    std::string uri;
    std::optional<std::chrono::milliseconds> timeout;
    bool json_output{false};
};

int cmd_health(const ServerRegistry& registry, bool json_output) {
    auto report = registry.health();
    if (json_output) {
        print_json(report.to_json());
        return report.healthy ? 0 : 2;
    }

    print_header("Servers");
    if (report.servers.empty()) {
        std::cout << color::c(color::dim) << "(no servers registered)" << color::c(color::reset) << "\n";
    }
    for (const auto& server : report.servers) {
        std::cout << color::c(color::bold) << "• " << server.name << color::c(color::reset) << "  "
                  << color::c(state_color(server.state)) << to_string(server.state) << color::c(color::reset)
                  << color::c(color::dim) << "  circuit " << to_string(server.circuit_state)
                  << color::c(color::reset) << "\n";
        if (server.error) {
            std::cout << "  " << color::c(color::red) << *server.error << color::c(color::reset) << "\n";
        }
    }
    std::cout << "\n" << (report.healthy ? color::c(color::green) + "healthy" : color::c(color::red) + "unhealthy")
              << color::c(color::reset) << "\n";
    return report.healthy ? 0 : 2;
}

int cmd_list_tools(const ServerRegistry& registry, const CliCommand& command) {
    auto tools = registry.list_tools(command.server);
    if (!tools) {
        print_error(tools.error().message);
        return 1;
    }

    if (command.json_output) {
        Json output = Json::array();
        for (const auto& entry : *tools) {
            output.push_back(entry.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools->empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
    }
    for (const auto& entry : *tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << entry.tool.name << color::c(color::reset)
                  << color::c(color::dim) << "  [" << entry.server << "]" << color::c(color::reset);
        if (entry.tool.description) {
            std::cout << "\n  " << color::c(color::dim) << *entry.tool.description << color::c(color::reset);
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_list_resources(const ServerRegistry& registry, const CliCommand& command) {
    auto resources = registry.list_resources(command.server);
    if (!resources) {
        print_error(resources.error().message);
        return 1;
    }

    if (command.json_output) {
        Json output = Json::array();
        for (const auto& entry : *resources) {
            output.push_back(entry.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Resources");
    if (resources->empty()) {
        std::cout << color::c(color::dim) << "(no resources available)" << color::c(color::reset) << "\n";
    }
    for (const auto& entry : *resources) {
        std::cout << color::c(color::bold) << color::c(color::blue)
                  << "• " << entry.resource.name << color::c(color::reset)
                  << color::c(color::dim) << "  [" << entry.server << "]" << color::c(color::reset) << "\n";
        std::cout << "  " << color::c(color::dim) << entry.resource.uri << color::c(color::reset);
        if (entry.resource.mime_type) {
            std::cout << " (" << *entry.resource.mime_type << ")";
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_list_prompts(const ServerRegistry& registry, const CliCommand& command) {
    auto prompts = registry.list_prompts(command.server);
    if (!prompts) {
        print_error(prompts.error().message);
        return 1;
    }

    if (command.json_output) {
        Json output = Json::array();
        for (const auto& entry : *prompts) {
            output.push_back(entry.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Prompts");
    if (prompts->empty()) {
        std::cout << color::c(color::dim) << "(no prompts available)" << color::c(color::reset) << "\n";
    }
    for (const auto& entry : *prompts) {
        std::cout << color::c(color::bold) << color::c(color::magenta)
                  << "• " << entry.prompt.name << color::c(color::reset)
                  << color::c(color::dim) << "  [" << entry.server << "]" << color::c(color::reset);
        if (!entry.prompt.arguments.empty()) {
            std::cout << "\n  Arguments: ";
            for (std::size_t i = 0; i < entry.prompt.arguments.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << entry.prompt.arguments[i].name;
                if (entry.prompt.arguments[i].required) {
                    std::cout << color::c(color::red) << "*" << color::c(color::reset);
                }
            }
        }
        std::cout << "\n\n";
    }
    return 0;
}

// Picks --server, or the only registered server.
std::optional<std::string> target_server(const ServerRegistry& registry, const CliCommand& command) {
    if (command.server) {
        return command.server;
    }
    auto names = registry.server_names();
    if (names.size() == 1) {
        return names.front();
    }
    print_error("--server is required when more than one server is configured");
    return std::nullopt;
}

int print_call_result(const ClientResult<Json>& result, bool json_output) {
    if (!result) {
        if (json_output) {
            print_json({{"error", result.error().to_json()}});
        } else {
            print_error(result.error().message);
        }
        return 1;
    }

    if (json_output) {
        print_json(*result);
        return 0;
    }

    // Text content blocks are printed as-is; anything else as JSON.
    const bool is_error = result->value("isError", false);
    if (result->contains("content") && (*result)["content"].is_array()) {
        for (const auto& block : (*result)["content"]) {
            if (block.value("type", "") == "text") {
                std::cout << block.value("text", "") << "\n";
            } else {
                print_json(block);
            }
        }
    } else if (result->contains("contents") && (*result)["contents"].is_array()) {
        for (const auto& block : (*result)["contents"]) {
            if (block.contains("text")) {
                std::cout << block.value("text", "") << "\n";
            } else {
                print_json(block);
            }
        }
    } else {
        print_json(*result);
    }
    return is_error ? 1 : 0;
}

asio::awaitable<int> run_command(ServerRegistry& registry, const CliCommand& command) {
    using Kind = CliCommand::Kind;

    if (command.server && !registry.get_client(*command.server)) {
        print_error("server '" + *command.server + "' not found");
        co_return 1;
    }

    // Servers configured without auto-connect are connected on demand.
    if (command.server) {
        auto client = registry.get_client(*command.server);
        if (!client->is_connected()) {
            auto connected = co_await registry.connect_server(*command.server);
            if (!connected) {
                print_error(connected.error().message);
                co_return 1;
            }
        }
    }

    switch (command.kind) {
        case Kind::Health:
            co_return cmd_health(registry, command.json_output);
        case Kind::ListTools:
            co_return cmd_list_tools(registry, command);
        case Kind::ListResources:
            co_return cmd_list_resources(registry, command);
        case Kind::ListPrompts:
            co_return cmd_list_prompts(registry, command);

        case Kind::CallTool: {
            auto server = target_server(registry, command);
            if (!server) {
                co_return 1;
            }
            auto args = Json::parse(command.tool_args, nullptr, false);
            if (args.is_discarded() || !args.is_object()) {
                print_error("--tool-args must be a JSON object");
                co_return 1;
            }
            auto result = co_await registry.call_tool(*server, command.tool, std::move(args),
                                                      CallOptions{command.timeout});
            co_return print_call_result(result, command.json_output);
        }

        case Kind::ReadResource: {
            auto server = target_server(registry, command);
            if (!server) {
                co_return 1;
            }
            auto result = co_await registry.get_resource(*server, command.uri,
                                                         CallOptions{command.timeout});
            co_return print_call_result(result, command.json_output);
        }
    }
    co_return 1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcphub-cli", "Capability server registry tool");

    options.add_options()
        // Server selection
        ("f,config", "Registry configuration file (JSON)", cxxopts::value<std::string>())
        ("c,command", "Run a single server from this command", cxxopts::value<std::string>())
        ("a,args", "Arguments for --command (can be repeated)", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("n,name", "Server name for --command", cxxopts::value<std::string>()->default_value("server"))
        ("s,server", "Target server for calls and listings", cxxopts::value<std::string>())

        // Commands
        ("health", "Show connection health (default)")
        ("list-tools", "List tools of connected servers")
        ("list-resources", "List resources of connected servers")
        ("list-prompts", "List prompts of connected servers")
        ("call-tool", "Call a tool by name", cxxopts::value<std::string>())
        ("tool-args", "JSON arguments for tool call", cxxopts::value<std::string>()->default_value("{}"))
        ("read-resource", "Read a resource by URI", cxxopts::value<std::string>())
        ("t,timeout", "Request timeout in milliseconds", cxxopts::value<long>())

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcphub-cli --config mcphub.json --health\n";
            std::cout << "    mcphub-cli --config mcphub.json --list-tools --json\n";
            std::cout << "    mcphub-cli -c python3 -a server.py --call-tool echo --tool-args '{\"text\":\"hi\"}'\n";
            return 0;
        }

        color::enabled = !result.count("no-color");

        // ─────────────────────────────────────────────────────────────────────
        // Configuration
        // ─────────────────────────────────────────────────────────────────────

        const bool use_file = result.count("config") > 0;
        const bool use_command = result.count("command") > 0;
        if (use_file == use_command) {
            print_error("Specify exactly one of --config or --command");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        RegistryConfig config;
        if (use_file) {
            auto loaded = load_registry_config(result["config"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        } else {
            ServerConfig server;
            server.name = result["name"].as<std::string>();
            server.command = result["command"].as<std::string>();
            for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
                if (!arg.empty()) {
                    server.args.push_back(arg);
                }
            }
            config.servers.push_back(std::move(server));
        }

        apply_environment_overrides(config);
        config.enable_health_check = false;  // one-shot tool

        CliCommand command;
        command.json_output = result.count("json") > 0;
        if (result.count("server")) {
            command.server = result["server"].as<std::string>();
        }
        if (result.count("timeout")) {
            command.timeout = std::chrono::milliseconds(result["timeout"].as<long>());
        }

        if (result.count("list-tools")) {
            command.kind = CliCommand::Kind::ListTools;
        } else if (result.count("list-resources")) {
            command.kind = CliCommand::Kind::ListResources;
        } else if (result.count("list-prompts")) {
            command.kind = CliCommand::Kind::ListPrompts;
        } else if (result.count("call-tool")) {
            command.kind = CliCommand::Kind::CallTool;
            command.tool = result["call-tool"].as<std::string>();
            command.tool_args = result["tool-args"].as<std::string>();
        } else if (result.count("read-resource")) {
            command.kind = CliCommand::Kind::ReadResource;
            command.uri = result["read-resource"].as<std::string>();
        }

        // ─────────────────────────────────────────────────────────────────────
        // Logging
        // ─────────────────────────────────────────────────────────────────────

        // --log-level, then the file or MCPHUB_LOG_LEVEL, then quiet by default.
        std::optional<LogLevel> requested_level;
        if (result.count("log-level")) {
            requested_level = parse_log_level(result["log-level"].as<std::string>());
            if (!requested_level) {
                print_error("unknown log level '" + result["log-level"].as<std::string>() + "'");
                return 1;
            }
        }
        LoggingConfig logging = resolve_logging(config, requested_level, LogLevel::Warn);
        if (result.count("log-file")) {
            logging.file = result["log-file"].as<std::string>();
        }
        // Keep stdout clean for --json output.
        logging.console = !command.json_output;
        set_logger(make_logger(logging));

        // ─────────────────────────────────────────────────────────────────────
        // Run
        // ─────────────────────────────────────────────────────────────────────

        asio::io_context io;
        ServerRegistry registry(io.get_executor());
        int exit_code = 1;

        asio::co_spawn(io, [&]() -> asio::awaitable<void> {
            co_await registry.initialize(std::move(config));
            exit_code = co_await run_command(registry, command);
            co_await registry.shutdown();
        }, asio::detached);

        io.run();
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("cannot set up logging: ") + e.what());
        return 1;
    }
}
