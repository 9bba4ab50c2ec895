#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Registry Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Top-level configuration file:
//
//   {
//     "servers": [ { "name": "fs", "command": "mcp-fs", ... } ],
//     "defaultTimeout": 30000,
//     "enableAutoConnect": true,
//     "enableHealthCheck": true,
//     "healthCheckInterval": 60000,
//     "clientInfo": { "name": "mcphub", "version": "0.1.0" },
//     "circuitBreaker": { "threshold": 5, "resetTimeout": 60000 },
//     "logging": { "level": "info", "file": "mcphub.log", "async": false }
//   }
//
// Every key is optional. Server entries are parsed with ServerConfig::from_json.

#include "mcphub/client/server_config.hpp"
#include "mcphub/log/spdlog_logger.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mcphub/resilience/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

struct RegistryConfig {
    std::vector<ServerConfig> servers;

    std::chrono::milliseconds default_timeout{30000};
    bool enable_auto_connect{true};
    bool enable_health_check{true};
    std::chrono::milliseconds health_check_interval{60000};

    Implementation client_info{"mcphub", "0.1.0"};
    CircuitBreakerConfig circuit_breaker;
    LoggingConfig logging;

    /// Set when the file or MCPHUB_LOG_LEVEL named a level explicitly.
    bool log_level_set{false};

    static ConfigResult<RegistryConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;

    /// Names that appear more than once in `servers`, in order of first repeat.
    [[nodiscard]] std::vector<std::string> duplicate_server_names() const;
};

/// Read and parse a configuration file. Errors name the file.
[[nodiscard]] ConfigResult<RegistryConfig> load_registry_config(const std::filesystem::path& path);

// ─────────────────────────────────────────────────────────────────────────────
// Environment Overrides
// ─────────────────────────────────────────────────────────────────────────────
// MCPHUB_ENV=production  doubles each server timeout (default timeout when
//                        unset) and raises maxRetries to 5 where a server
//                        carries its own retry policy
// MCPHUB_SERVERS         JSON array of extra server definitions to append
// MCPHUB_LOG_LEVEL       overrides logging.level

using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// Reads the process environment.
[[nodiscard]] std::optional<std::string> system_env(const char* name);

void apply_environment_overrides(RegistryConfig& config, const EnvLookup& lookup = system_env);

/// Logging setup for a front end: `requested` (a command-line flag) wins,
/// then a level set by the file or the environment, then `fallback`.
[[nodiscard]] LoggingConfig resolve_logging(const RegistryConfig& config,
                                            std::optional<LogLevel> requested,
                                            LogLevel fallback);

}  // namespace mcphub
