/**
 * @file logger.hpp
 * @brief Structured logging for the ledger with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (operation, actor, source module)
 * - A financial-event line mirroring every posting
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef LEDGERCORE_LOGGER_HPP
#define LEDGERCORE_LOGGER_HPP

#include "ledger_error.hpp"
#include "money.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ledgercore {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (lock waits, undo journal sizes)
    INFO,    ///< Informational messages (entries posted, periods closed)
    WARN,    ///< Warning messages (rejected operations, rollbacks)
    ERROR    ///< Error messages (failures, exceptions)
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Operation context for logging
 */
struct LogContext {
    std::string operation;  ///< e.g. "post", "reverse", "loan.repay"
    std::string actor_id;   ///< Acting user, empty for batch jobs
    std::string source;     ///< Source module (loans, savings, fixed_deposits, manual)

    LogContext() = default;

    LogContext(const std::string& op, const std::string& actor)
        : operation(op), actor_id(actor) {}

    LogContext(const std::string& op, const std::string& actor, const std::string& src)
        : operation(op), actor_id(actor), source(src) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("ledgercore.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "ledger.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("post", "approver-7", "loans");
 *   logger.log_entry_posted(ctx, "JE20240315000001", total);
 *   @endcode
 *
 * Emission is serialized so concurrent transactions never interleave lines.
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log creation of a journal entry (draft or auto-posted)
     */
    void log_entry_created(
        const LogContext& ctx,
        const std::string& entry_number,
        const std::string& status,
        Money total,
        size_t line_count
    );

    /**
     * @brief Log the posting of an entry
     *
     * Also emits the financial-event line (amount, entry number, actor, source).
     */
    void log_entry_posted(
        const LogContext& ctx,
        const std::string& entry_number,
        Money total
    );

    /**
     * @brief Log a reversal
     *
     * @param original_number Entry number of the reversed entry
     * @param reversal_number Entry number of the new mirror entry
     */
    void log_entry_reversed(
        const LogContext& ctx,
        const std::string& original_number,
        const std::string& reversal_number,
        const std::string& reason
    );

    void log_period_closed(
        const LogContext& ctx,
        const std::string& period,
        const std::string& old_status,
        const std::string& new_status
    );

    /**
     * @brief Log an operation rejected with a tagged error
     */
    void log_rejected(const LogContext& ctx, const LedgerError& error);

    /**
     * @brief Log a rolled-back transaction
     *
     * @param undo_count Number of undo actions replayed
     */
    void log_rollback(
        const LogContext& ctx,
        const std::string& reason,
        size_t undo_count
    );

    /**
     * @brief Log a workflow event (loan disbursed, deposit, FD matured...)
     *
     * @param event Event name
     * @param fields Event-specific key/value pairs
     */
    void log_workflow_event(
        const LogContext& ctx,
        const std::string& event,
        const std::map<std::string, std::string>& fields
    );

    void log_batch_item_failed(
        const std::string& job,
        const std::string& item_id,
        const LedgerError& error
    );

    void log_batch_summary(
        const std::string& job,
        size_t processed,
        size_t failed,
        double elapsed_ms
    );

    void log_error(const LogContext& ctx, const std::string& error_message);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex output_mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace ledgercore

#endif // LEDGERCORE_LOGGER_HPP
