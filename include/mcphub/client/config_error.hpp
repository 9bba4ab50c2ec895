#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace mcphub {

struct ConfigError {
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Typed Field Readers
// ─────────────────────────────────────────────────────────────────────────────
// An absent or null key yields `fallback`. A value of the wrong type is a
// ConfigError naming the key; nothing here throws.

namespace config_field {

inline bool absent(const nlohmann::json& j, const char* key) {
    return j.contains(key) == false || j.at(key).is_null();
}

inline ConfigError wrong_type(const char* key, const char* expected) {
    return ConfigError{std::format("'{}' must be {}", key, expected)};
}

inline ConfigResult<std::int64_t> count(const nlohmann::json& j, const char* key, std::int64_t fallback) {
    if (absent(j, key)) {
        return fallback;
    }
    const auto& node = j.at(key);
    if (node.is_number_unsigned()) {
        return static_cast<std::int64_t>(node.get<std::uint64_t>());
    }
    if (node.is_number_integer() == false || node.get<std::int64_t>() < 0) {
        return tl::unexpected(wrong_type(key, "a non-negative integer"));
    }
    return node.get<std::int64_t>();
}

inline ConfigResult<std::chrono::milliseconds> millis(const nlohmann::json& j, const char* key,
                                                      std::chrono::milliseconds fallback) {
    if (absent(j, key)) {
        return fallback;
    }
    const auto& node = j.at(key);
    if (node.is_number() == false || node.get<double>() < 0.0) {
        return tl::unexpected(wrong_type(key, "a non-negative number of milliseconds"));
    }
    return std::chrono::milliseconds(node.get<std::int64_t>());
}

inline ConfigResult<double> number(const nlohmann::json& j, const char* key, double fallback) {
    if (absent(j, key)) {
        return fallback;
    }
    if (j.at(key).is_number() == false) {
        return tl::unexpected(wrong_type(key, "a number"));
    }
    return j.at(key).get<double>();
}

inline ConfigResult<bool> flag(const nlohmann::json& j, const char* key, bool fallback) {
    if (absent(j, key)) {
        return fallback;
    }
    if (j.at(key).is_boolean() == false) {
        return tl::unexpected(wrong_type(key, "a boolean"));
    }
    return j.at(key).get<bool>();
}

inline ConfigResult<std::string> text(const nlohmann::json& j, const char* key, std::string fallback) {
    if (absent(j, key)) {
        return fallback;
    }
    if (j.at(key).is_string() == false) {
        return tl::unexpected(wrong_type(key, "a string"));
    }
    return j.at(key).get<std::string>();
}

}  // namespace config_field

}  // namespace mcphub
