/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ledgercore {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_entry_created(
    const LogContext& ctx,
    const std::string& entry_number,
    const std::string& status,
    Money total,
    size_t line_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "entry_created";
    add_context(fields, ctx);
    fields["entry_number"] = entry_number;
    fields["status"] = status;
    fields["total"] = total.to_string();
    fields["line_count"] = std::to_string(line_count);

    log(LogLevel::INFO, "Journal entry created", fields);
}

void Logger::log_entry_posted(
    const LogContext& ctx,
    const std::string& entry_number,
    Money total
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "entry_posted";
    add_context(fields, ctx);
    fields["entry_number"] = entry_number;
    fields["total"] = total.to_string();

    log(LogLevel::INFO, "Journal entry posted", fields);

    // Financial audit line
    std::map<std::string, std::string> financial;
    financial["event"] = "financial";
    financial["category"] = "FINANCIAL";
    financial["amount"] = total.to_string();
    financial["entry_number"] = entry_number;
    financial["actor_id"] = ctx.actor_id.empty() ? "system" : ctx.actor_id;
    financial["source"] = ctx.source.empty() ? "manual" : ctx.source;

    log(LogLevel::INFO, "Financial event", financial);
}

void Logger::log_entry_reversed(
    const LogContext& ctx,
    const std::string& original_number,
    const std::string& reversal_number,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "entry_reversed";
    add_context(fields, ctx);
    fields["original_entry"] = original_number;
    fields["reversal_entry"] = reversal_number;
    fields["reason"] = reason;

    log(LogLevel::INFO, "Journal entry reversed", fields);
}

void Logger::log_period_closed(
    const LogContext& ctx,
    const std::string& period,
    const std::string& old_status,
    const std::string& new_status
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "period_closed";
    add_context(fields, ctx);
    fields["period"] = period;
    fields["old_status"] = old_status;
    fields["new_status"] = new_status;

    log(LogLevel::INFO, "Financial period closed", fields);
}

void Logger::log_rejected(const LogContext& ctx, const LedgerError& error) {
    std::map<std::string, std::string> fields;
    fields["event"] = "rejected";
    add_context(fields, ctx);
    fields["error_kind"] = error_kind_to_string(error.kind);
    fields["error_message"] = error.message;
    for (const auto& [key, value] : error.details) {
        fields["detail." + key] = value;
    }

    log(LogLevel::WARN, "Operation rejected", fields);
}

void Logger::log_rollback(
    const LogContext& ctx,
    const std::string& reason,
    size_t undo_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "rollback";
    add_context(fields, ctx);
    fields["reason"] = reason;
    fields["undo_count"] = std::to_string(undo_count);

    log(LogLevel::WARN, "Transaction rolled back", fields);
}

void Logger::log_workflow_event(
    const LogContext& ctx,
    const std::string& event,
    const std::map<std::string, std::string>& extra
) {
    std::map<std::string, std::string> fields = extra;
    fields["event"] = event;
    add_context(fields, ctx);

    log(LogLevel::INFO, "Workflow event", fields);
}

void Logger::log_batch_item_failed(
    const std::string& job,
    const std::string& item_id,
    const LedgerError& error
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_item_failed";
    fields["job"] = job;
    fields["item_id"] = item_id;
    fields["error_kind"] = error_kind_to_string(error.kind);
    fields["error_message"] = error.message;

    log(LogLevel::ERROR, "Batch item failed", fields);
}

void Logger::log_batch_summary(
    const std::string& job,
    size_t processed,
    size_t failed,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "batch_summary";
    fields["job"] = job;
    fields["processed"] = std::to_string(processed);
    fields["failed"] = std::to_string(failed);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(failed > 0 ? LogLevel::WARN : LogLevel::INFO, "Batch job completed", fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Ledger error", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    if (!ctx.operation.empty()) fields["operation"] = ctx.operation;
    if (!ctx.actor_id.empty()) fields["actor_id"] = ctx.actor_id;
    if (!ctx.source.empty()) fields["source"] = ctx.source;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace ledgercore
