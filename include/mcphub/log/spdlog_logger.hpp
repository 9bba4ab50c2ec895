#pragma once

#include "mcphub/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────

class SpdlogLogger final : public ILogger {
public:
    /// Default pattern: [timestamp] [level] [file:line] message
    static constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    /// Colored console sink on stdout.
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wraps an existing spdlog logger; its level becomes the minimum level.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// One logger fanning out to several sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Logging configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LoggingConfig {
    LogLevel level{LogLevel::Info};

    /// When set, records also go to this file.
    std::optional<std::string> file;

    /// Hand records to a background thread instead of writing inline.
    bool async{false};

    /// Empty keeps SpdlogLogger::kDefaultPattern.
    std::string pattern;

    /// Write to the console sink (stdout). Disabled by tools that print
    /// machine-readable output on stdout.
    bool console{true};
};

/// Build the backend described by `config`. Throws spdlog::spdlog_ex when the
/// log file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_logger(const LoggingConfig& config);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace mcphub
