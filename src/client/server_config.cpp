#include "mcphub/client/server_config.hpp"

#include <format>

namespace mcphub {

namespace {

ConfigError field_error(const std::string& server, const char* field, const char* expected) {
    return ConfigError{std::format("server '{}': '{}' must be {}", server, field, expected)};
}

}  // namespace

ConfigResult<void> ServerConfig::validate() const {
    if (name.empty()) {
        return tl::unexpected(ConfigError{"server name is required"});
    }
    if (command.empty()) {
        return tl::unexpected(ConfigError{std::format("server '{}': command is required", name)});
    }
    if (timeout && timeout->count() <= 0) {
        return tl::unexpected(ConfigError{std::format("server '{}': timeout must be positive", name)});
    }
    if (retry_policy && retry_policy->backoff_multiplier < 1.0) {
        return tl::unexpected(ConfigError{
            std::format("server '{}': backoffMultiplier must be at least 1", name)});
    }
    return {};
}

ProcessConfig ServerConfig::to_process_config() const {
    ProcessConfig process;
    process.command = command;
    process.args = args;
    process.env = env;
    process.name = name;
    return process;
}

ConfigResult<ServerConfig> ServerConfig::from_json(const nlohmann::json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError{"server definition must be an object"});
    }

    ServerConfig config;

    if (j.contains("name") == false || j["name"].is_string() == false) {
        return tl::unexpected(ConfigError{"server definition needs a string 'name'"});
    }
    config.name = j["name"].get<std::string>();

    if (j.contains("command")) {
        if (j["command"].is_string() == false) {
            return tl::unexpected(field_error(config.name, "command", "a string"));
        }
        config.command = j["command"].get<std::string>();
    } else if (j.contains("url")) {
        return tl::unexpected(ConfigError{std::format(
            "server '{}': command is required (network transports are not supported)",
            config.name)});
    }

    if (j.contains("args")) {
        if (j["args"].is_array() == false) {
            return tl::unexpected(field_error(config.name, "args", "an array of strings"));
        }
        for (const auto& arg : j["args"]) {
            if (arg.is_string() == false) {
                return tl::unexpected(field_error(config.name, "args", "an array of strings"));
            }
            config.args.push_back(arg.get<std::string>());
        }
    }

    if (j.contains("env")) {
        if (j["env"].is_object() == false) {
            return tl::unexpected(field_error(config.name, "env", "an object"));
        }
        for (const auto& [key, value] : j["env"].items()) {
            config.env[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    if (j.contains("timeout") && j["timeout"].is_null() == false) {
        if (j["timeout"].is_number() == false) {
            return tl::unexpected(field_error(config.name, "timeout", "a number of milliseconds"));
        }
        config.timeout = std::chrono::milliseconds(j["timeout"].get<std::int64_t>());
    }

    if (j.contains("retryPolicy") && j["retryPolicy"].is_null() == false) {
        if (j["retryPolicy"].is_object() == false) {
            return tl::unexpected(field_error(config.name, "retryPolicy", "an object"));
        }
        auto policy = RetryPolicy::from_json(j["retryPolicy"]);
        if (!policy) {
            return tl::unexpected(ConfigError{std::format(
                "server '{}': retryPolicy: {}", config.name, policy.error().message)});
        }
        config.retry_policy = *policy;
    }

    if (j.contains("autoConnect")) {
        if (j["autoConnect"].is_boolean() == false) {
            return tl::unexpected(field_error(config.name, "autoConnect", "a boolean"));
        }
        config.auto_connect = j["autoConnect"].get<bool>();
    }

    auto valid = config.validate();
    if (!valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

nlohmann::json ServerConfig::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"command", command},
        {"args", args},
        {"env", env},
        {"autoConnect", auto_connect}
    };
    if (timeout) {
        j["timeout"] = timeout->count();
    }
    if (retry_policy) {
        j["retryPolicy"] = retry_policy->to_json();
    }
    return j;
}

}  // namespace mcphub
