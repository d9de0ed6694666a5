/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include "posting_engine.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>

using namespace ledgercore;

namespace {

// Flat parser for the logger's one-level, string-valued JSON lines
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        result[key] = line.substr(val_start + 1, val_end - val_start - 1);
        pos = val_end + 1;
    }

    return result;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

} // namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "ledgercore.log");
    }

    SECTION("Level names") {
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("Log level filtering") {
        log_to_file("test_level_filter.log", LogLevel::WARN);
        Logger& logger = Logger::get_instance();
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.log_workflow_event(LogContext("loan.create", "officer-1"), "loan_created", {});
        logger.log_warning(LogContext("post", "clerk-1"), "suspense account used");
        logger.flush();

        auto lines = read_lines("test_level_filter.log");
        REQUIRE(lines.size() == 1);
        REQUIRE(parse_json_log(lines[0])["event"] == "warning");

        ledgercore::testing::quiet_logger();
        std::filesystem::remove("test_level_filter.log");
    }
}

TEST_CASE("Logger posting events", "[logger]") {
    log_to_file("test_posting_events.log");
    Logger& logger = Logger::get_instance();

    LogContext ctx("post", "approver-7", "loans");
    logger.log_entry_posted(ctx, "JE20240315000001", Money::parse("1500.00"));
    logger.flush();

    auto lines = read_lines("test_posting_events.log");
    REQUIRE(lines.size() == 2);

    auto posted = parse_json_log(lines[0]);
    REQUIRE(posted["event"] == "entry_posted");
    REQUIRE(posted["level"] == "INFO");
    REQUIRE(posted["operation"] == "post");
    REQUIRE(posted["actor_id"] == "approver-7");
    REQUIRE(posted["entry_number"] == "JE20240315000001");
    REQUIRE(posted["total"] == "1500.00");
    REQUIRE_FALSE(posted["timestamp"].empty());

    auto financial = parse_json_log(lines[1]);
    REQUIRE(financial["event"] == "financial");
    REQUIRE(financial["category"] == "FINANCIAL");
    REQUIRE(financial["amount"] == "1500.00");
    REQUIRE(financial["source"] == "loans");

    ledgercore::testing::quiet_logger();
    std::filesystem::remove("test_posting_events.log");
}

TEST_CASE("Logger rejections and batch events", "[logger]") {
    log_to_file("test_rejections.log");
    Logger& logger = Logger::get_instance();

    LedgerError error(ErrorKind::UNBALANCED_ENTRY, "Entry does not balance",
                      {{"total_debit", "100.00"}, {"total_credit", "90.00"}});
    logger.log_rejected(LogContext("post", "clerk-1", "manual"), error);
    logger.log_batch_item_failed("accrue_fixed_deposits", "42", error);
    logger.log_batch_summary("accrue_fixed_deposits", 9, 1, 12.5);
    logger.flush();

    auto lines = read_lines("test_rejections.log");
    REQUIRE(lines.size() == 3);

    auto rejected = parse_json_log(lines[0]);
    REQUIRE(rejected["event"] == "rejected");
    REQUIRE(rejected["level"] == "WARN");
    REQUIRE(rejected["error_kind"] == "UNBALANCED_ENTRY");
    REQUIRE(rejected["detail.total_debit"] == "100.00");
    REQUIRE(rejected["detail.total_credit"] == "90.00");

    auto item = parse_json_log(lines[1]);
    REQUIRE(item["event"] == "batch_item_failed");
    REQUIRE(item["level"] == "ERROR");
    REQUIRE(item["item_id"] == "42");

    auto summary = parse_json_log(lines[2]);
    REQUIRE(summary["event"] == "batch_summary");
    REQUIRE(summary["level"] == "WARN");
    REQUIRE(summary["processed"] == "9");
    REQUIRE(summary["failed"] == "1");

    ledgercore::testing::quiet_logger();
    std::filesystem::remove("test_rejections.log");
}

TEST_CASE("Lock wait timeouts are logged once", "[logger]") {
    TransactionLimits limits;
    limits.max_wait_ms = 50;
    ledgercore::testing::LedgerFixture fx(Date(2024, 1, 15), limits);
    log_to_file("test_lock_timeout.log");

    Transaction holder(*fx.ctx, LogContext("hold", "test"));
    REQUIRE(holder.acquired());
    auto blocked = std::async(std::launch::async, [&fx]() {
        return submit(*fx.ctx, fx.simple_entry("1300", "1100", "100", Date(2024, 1, 15)));
    });
    REQUIRE(blocked.get().kind() == ErrorKind::TRANSACTION_TIMEOUT);
    holder.rollback("released by test");
    Logger::get_instance().flush();

    size_t rejections = 0;
    for (const auto& line : read_lines("test_lock_timeout.log")) {
        auto fields = parse_json_log(line);
        if (fields["event"] == "rejected") {
            REQUIRE(fields["error_kind"] == "TRANSACTION_TIMEOUT");
            REQUIRE(fields["operation"] == "submit");
            ++rejections;
        }
    }
    REQUIRE(rejections == 1);

    ledgercore::testing::quiet_logger();
    std::filesystem::remove("test_lock_timeout.log");
}

TEST_CASE("Logger plain text output", "[logger]") {
    std::filesystem::remove("test_plain.log");
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = false;
    config.log_file_path = "test_plain.log";
    Logger::get_instance().configure(config);

    Logger::get_instance().log_period_closed(LogContext("period.close", "cfo"), "2024-01", "OPEN", "HARD_CLOSE");
    Logger::get_instance().flush();

    auto lines = read_lines("test_plain.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("Financial period closed") != std::string::npos);
    REQUIRE(lines[0].find("2024-01") != std::string::npos);
    REQUIRE(lines[0].front() != '{');

    ledgercore::testing::quiet_logger();
    std::filesystem::remove("test_plain.log");
}
