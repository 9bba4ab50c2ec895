#include "mcphub/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <mutex>

namespace mcphub {

namespace {

// ANSI escapes for the console backend.
namespace ansi {
    constexpr std::string_view reset = "\033[0m";
    constexpr std::string_view dim   = "\033[90m";
    constexpr std::string_view bold  = "\033[1m";
}

[[nodiscard]] std::string_view color_for(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return ansi::reset;
}

[[nodiscard]] std::string_view basename_of(std::string_view path) noexcept {
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// HH:MM:SS.mmm in UTC
[[nodiscard]] std::string clock_time(std::chrono::system_clock::time_point tp) {
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(tp);
    const auto since_midnight = millis - std::chrono::floor<std::chrono::days>(millis);
    return std::format("{:%T}", std::chrono::hh_mm_ss{since_midnight});
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string key;
    key.reserve(name.size());
    std::transform(name.begin(), name.end(), std::back_inserter(key),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    struct Alias {
        std::string_view name;
        LogLevel level;
    };
    static constexpr Alias kAliases[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"critical", LogLevel::Fatal},
        {"off", LogLevel::Off},
        {"none", LogLevel::Off},
    };
    for (const auto& alias : kAliases) {
        if (alias.name == key) {
            return alias.level;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const auto where = std::format("{}:{}",
        basename_of(record.location.file_name()), record.location.line());

    std::string line;
    if (colors_enabled_) {
        line = std::format("{}{}{} {}{}{:<5}{} {}{}{} {}\n",
            ansi::dim, clock_time(record.timestamp), ansi::reset,
            ansi::bold, color_for(record.level), to_string(record.level), ansi::reset,
            ansi::dim, where, ansi::reset,
            record.message);
    } else {
        line = std::format("{} {:<5} {} {}\n",
            clock_time(record.timestamp), to_string(record.level), where, record.message);
    }

    // One write per record keeps lines from interleaving.
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::fwrite(line.data(), 1, line.size(), stderr);
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
};

GlobalLogger& global_logger() {
    static GlobalLogger global;
    return global;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    return *global.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    if (logger) {
        global.instance = std::move(logger);
    } else {
        global.instance = std::make_unique<NullLogger>();
    }
}

}  // namespace mcphub
