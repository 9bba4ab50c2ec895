#include "mcphub/registry/registry_config.hpp"

#include "mcphub/log/logger.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <set>

namespace mcphub {

namespace {

constexpr std::size_t kProductionMaxRetries = 5;

ConfigResult<std::chrono::milliseconds> parse_positive_millis(const nlohmann::json& j, const char* key,
                                                              std::chrono::milliseconds fallback) {
    auto value = config_field::millis(j, key, fallback);
    if (value && value->count() <= 0) {
        return tl::unexpected(ConfigError{std::format("'{}' must be a positive number of milliseconds", key)});
    }
    return value;
}

ConfigResult<LoggingConfig> parse_logging(const nlohmann::json& j) {
    LoggingConfig logging;
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError{"'logging' must be an object"});
    }

    auto level_name = config_field::text(j, "level", std::string(to_string(logging.level)));
    if (!level_name) {
        return tl::unexpected(level_name.error());
    }
    auto level = parse_log_level(*level_name);
    if (!level) {
        return tl::unexpected(ConfigError{std::format("unknown log level '{}'", *level_name)});
    }
    logging.level = *level;

    auto file = config_field::text(j, "file", "");
    if (!file) {
        return tl::unexpected(file.error());
    }
    if (!file->empty()) {
        logging.file = std::move(*file);
    }

    auto async = config_field::flag(j, "async", logging.async);
    if (!async) {
        return tl::unexpected(async.error());
    }
    logging.async = *async;

    auto pattern = config_field::text(j, "pattern", "");
    if (!pattern) {
        return tl::unexpected(pattern.error());
    }
    logging.pattern = std::move(*pattern);
    return logging;
}

ConfigResult<Implementation> parse_client_info(const nlohmann::json& j, Implementation fallback) {
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError{"'clientInfo' must be an object"});
    }
    auto name = config_field::text(j, "name", fallback.name);
    if (!name) {
        return tl::unexpected(name.error());
    }
    auto version = config_field::text(j, "version", fallback.version);
    if (!version) {
        return tl::unexpected(version.error());
    }
    return Implementation{*name, *version};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// RegistryConfig
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<RegistryConfig> RegistryConfig::from_json(const nlohmann::json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(ConfigError{"configuration must be a JSON object"});
    }

    RegistryConfig config;

    if (j.contains("servers")) {
        if (j["servers"].is_array() == false) {
            return tl::unexpected(ConfigError{"'servers' must be an array"});
        }
        for (const auto& entry : j["servers"]) {
            auto server = ServerConfig::from_json(entry);
            if (!server) {
                return tl::unexpected(server.error());
            }
            config.servers.push_back(std::move(*server));
        }
    }

    auto default_timeout = parse_positive_millis(j, "defaultTimeout", config.default_timeout);
    if (!default_timeout) {
        return tl::unexpected(default_timeout.error());
    }
    config.default_timeout = *default_timeout;

    auto interval = parse_positive_millis(j, "healthCheckInterval", config.health_check_interval);
    if (!interval) {
        return tl::unexpected(interval.error());
    }
    config.health_check_interval = *interval;

    auto auto_connect = config_field::flag(j, "enableAutoConnect", config.enable_auto_connect);
    if (!auto_connect) {
        return tl::unexpected(auto_connect.error());
    }
    config.enable_auto_connect = *auto_connect;

    auto health_check = config_field::flag(j, "enableHealthCheck", config.enable_health_check);
    if (!health_check) {
        return tl::unexpected(health_check.error());
    }
    config.enable_health_check = *health_check;

    if (config_field::absent(j, "clientInfo") == false) {
        auto info = parse_client_info(j.at("clientInfo"), config.client_info);
        if (!info) {
            return tl::unexpected(info.error());
        }
        config.client_info = std::move(*info);
    }

    if (config_field::absent(j, "circuitBreaker") == false) {
        auto breaker = CircuitBreakerConfig::from_json(j.at("circuitBreaker"));
        if (!breaker) {
            return tl::unexpected(ConfigError{"circuitBreaker: " + breaker.error().message});
        }
        config.circuit_breaker = std::move(*breaker);
    }

    if (config_field::absent(j, "logging") == false) {
        auto logging = parse_logging(j.at("logging"));
        if (!logging) {
            return tl::unexpected(logging.error());
        }
        config.logging = std::move(*logging);
        config.log_level_set = !config_field::absent(j.at("logging"), "level");
    }

    return config;
}

nlohmann::json RegistryConfig::to_json() const {
    nlohmann::json servers_json = nlohmann::json::array();
    for (const auto& server : servers) {
        servers_json.push_back(server.to_json());
    }

    nlohmann::json logging_json = {
        {"level", std::string(to_string(logging.level))},
        {"async", logging.async}
    };
    if (logging.file) {
        logging_json["file"] = *logging.file;
    }

    return {
        {"servers", servers_json},
        {"defaultTimeout", default_timeout.count()},
        {"enableAutoConnect", enable_auto_connect},
        {"enableHealthCheck", enable_health_check},
        {"healthCheckInterval", health_check_interval.count()},
        {"clientInfo", client_info.to_json()},
        {"circuitBreaker", circuit_breaker.to_json()},
        {"logging", logging_json}
    };
}

std::vector<std::string> RegistryConfig::duplicate_server_names() const {
    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& server : servers) {
        if (seen.insert(server.name).second == false) {
            duplicates.push_back(server.name);
        }
    }
    return duplicates;
}

ConfigResult<RegistryConfig> load_registry_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return tl::unexpected(ConfigError{std::format("{}: cannot open file", path.string())});
    }

    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(ConfigError{std::format("{}: invalid JSON", path.string())});
    }

    auto config = RegistryConfig::from_json(document);
    if (!config) {
        return tl::unexpected(ConfigError{std::format("{}: {}", path.string(), config.error().message)});
    }

    for (const auto& name : config->duplicate_server_names()) {
        MCPHUB_LOG_WARN("{}: server '{}' is defined more than once, the first definition wins",
                        path.string(), name);
    }
    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment Overrides
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> system_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void apply_environment_overrides(RegistryConfig& config, const EnvLookup& lookup) {
    if (lookup("MCPHUB_ENV") == std::optional<std::string>("production")) {
        for (auto& server : config.servers) {
            server.timeout = server.timeout.value_or(config.default_timeout) * 2;
            if (server.retry_policy) {
                server.retry_policy->max_retries = kProductionMaxRetries;
            }
        }
    }

    if (auto extra = lookup("MCPHUB_SERVERS")) {
        auto parsed = nlohmann::json::parse(*extra, nullptr, false);
        if (parsed.is_discarded() || parsed.is_array() == false) {
            MCPHUB_LOG_ERROR("MCPHUB_SERVERS is not a JSON array, ignoring it");
        } else {
            for (const auto& entry : parsed) {
                auto server = ServerConfig::from_json(entry);
                if (!server) {
                    MCPHUB_LOG_ERROR("MCPHUB_SERVERS: {}", server.error().message);
                    continue;
                }
                config.servers.push_back(std::move(*server));
            }
        }
    }

    if (auto level_name = lookup("MCPHUB_LOG_LEVEL")) {
        if (auto level = parse_log_level(*level_name)) {
            config.logging.level = *level;
            config.log_level_set = true;
        } else {
            MCPHUB_LOG_WARN("MCPHUB_LOG_LEVEL '{}' is not a log level, ignoring it", *level_name);
        }
    }
}

LoggingConfig resolve_logging(const RegistryConfig& config,
                              std::optional<LogLevel> requested,
                              LogLevel fallback) {
    LoggingConfig logging = config.logging;
    if (requested) {
        logging.level = *requested;
    } else if (!config.log_level_set) {
        logging.level = fallback;
    }
    return logging;
}

}  // namespace mcphub
