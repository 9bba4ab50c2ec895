#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("info", "WARN", "warning", "off", ...).
/// Returns nullopt for names that match no level.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string msg,
               std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::move(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, std::string(msg), loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, std::string(msg), loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, std::string(msg), loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, std::string(msg), loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, std::string(msg), loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, std::string(msg), loc);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default backend, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr with colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Defaults to NullLogger until set_logger() is called.
[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Logging macros take a std::format string plus arguments. Arguments are only
// evaluated when the level is enabled; the call site is captured as the
// record's source location.

#define MCPHUB_LOG_AT(level, ...) \
    do { \
        auto& mcphub_log_target_ = ::mcphub::get_logger(); \
        if (mcphub_log_target_.should_log(level)) { \
            mcphub_log_target_.write(level, std::format(__VA_ARGS__)); \
        } \
    } while (false)

#define MCPHUB_LOG_TRACE(...) MCPHUB_LOG_AT(::mcphub::LogLevel::Trace, __VA_ARGS__)
#define MCPHUB_LOG_DEBUG(...) MCPHUB_LOG_AT(::mcphub::LogLevel::Debug, __VA_ARGS__)
#define MCPHUB_LOG_INFO(...)  MCPHUB_LOG_AT(::mcphub::LogLevel::Info, __VA_ARGS__)
#define MCPHUB_LOG_WARN(...)  MCPHUB_LOG_AT(::mcphub::LogLevel::Warn, __VA_ARGS__)
#define MCPHUB_LOG_ERROR(...) MCPHUB_LOG_AT(::mcphub::LogLevel::Error, __VA_ARGS__)
#define MCPHUB_LOG_FATAL(...) MCPHUB_LOG_AT(::mcphub::LogLevel::Fatal, __VA_ARGS__)

}  // namespace mcphub
