#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Configuration
// ═══════════════════════════════════════════════════════════════════════════
// One capability server definition. JSON keys follow the configuration file
// format:
//
//   {
//     "name": "files",
//     "command": "npx",
//     "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
//     "env": {"DEBUG": "1"},
//     "timeout": 30000,
//     "retryPolicy": {"maxRetries": 3, "initialDelay": 1000,
//                     "maxDelay": 10000, "backoffMultiplier": 2},
//     "autoConnect": true
//   }

#include "mcphub/client/config_error.hpp"
#include "mcphub/resilience/retry_executor.hpp"
#include "mcphub/transport/process_transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Per-request timeout; the registry default applies when unset
    std::optional<std::chrono::milliseconds> timeout;

    /// Retry policy; RetryPolicy{} applies when unset
    std::optional<RetryPolicy> retry_policy;

    bool auto_connect{true};

    [[nodiscard]] RetryPolicy effective_retry_policy() const {
        return retry_policy.value_or(RetryPolicy{});
    }

    [[nodiscard]] ConfigResult<void> validate() const;

    [[nodiscard]] ProcessConfig to_process_config() const;

    static ConfigResult<ServerConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;
};

}  // namespace mcphub
