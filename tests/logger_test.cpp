#include <catch2/catch_test_macros.hpp>

#include "mcphub/log/logger.hpp"

#include <vector>

using namespace mcphub;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log records for verification
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts common spellings", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == LogLevel::Info);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.info("ignored");
    logger.fatal("ignored");
}

TEST_CASE("ILogger filters below the minimum level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[0].message == "warn message");
    REQUIRE(logger.records()[1].level == LogLevel::Error);
}

TEST_CASE("LogRecord captures the caller's source location", "[log]") {
    TestLogger logger;
    logger.info("test message");

    REQUIRE(logger.records().size() == 1);
    std::string_view filename(logger.records()[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(logger.records()[0].location.line() > 0);
}

TEST_CASE("ConsoleLogger level can be changed", "[log]") {
    ConsoleLogger logger(LogLevel::Error);

    REQUIRE(logger.should_log(LogLevel::Warn) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == true);

    logger.set_level(LogLevel::Warn);
    REQUIRE(logger.level() == LogLevel::Warn);
    REQUIRE(logger.should_log(LogLevel::Warn) == true);
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("MCPHUB_LOG macros format arguments and honour the level", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw = test_logger.get();
    set_logger(std::move(test_logger));

    MCPHUB_LOG_TRACE("filtered {}", 1);
    MCPHUB_LOG_DEBUG("plain");
    MCPHUB_LOG_INFO("server {} connected after {} ms", "alpha", 42);
    MCPHUB_LOG_ERROR("braces {{}} survive");

    REQUIRE(raw->records().size() == 3);
    REQUIRE(raw->records()[0].message == "plain");
    REQUIRE(raw->records()[1].message == "server alpha connected after 42 ms");
    REQUIRE(raw->records()[1].level == LogLevel::Info);
    REQUIRE(raw->records()[2].message == "braces {} survive");

    std::string_view filename(raw->records()[1].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);

    set_logger(nullptr);
}

TEST_CASE("MCPHUB_LOG macros skip argument evaluation when filtered", "[log]") {
    set_logger(std::make_unique<TestLogger>(LogLevel::Error));

    int evaluations = 0;
    auto count = [&evaluations] { return ++evaluations; };
    MCPHUB_LOG_DEBUG("value {}", count());
    REQUIRE(evaluations == 0);

    MCPHUB_LOG_ERROR("value {}", count());
    REQUIRE(evaluations == 1);

    set_logger(nullptr);
}
