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
#include <stdexcept>

namespace carboncalc {

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str);
}

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
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(const LogContext& ctx, size_t num_years) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["model_id"] = ctx.model_id;
    fields["phase"] = ctx.phase;
    fields["num_years"] = std::to_string(num_years);

    log(LogLevel::INFO, "Starting model run", fields);
}

void Logger::log_run_complete(const LogContext& ctx, const RunSummary& summary) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["model_id"] = ctx.model_id;
    fields["phase"] = ctx.phase;
    fields["num_years"] = std::to_string(summary.num_years);
    fields["npv"] = std::to_string(summary.npv);
    fields["ending_cash"] = std::to_string(summary.ending_cash);
    fields["max_abs_balance_check"] = std::to_string(summary.max_abs_balance_check);
    fields["invariant_failures"] = std::to_string(summary.invariant_failures);
    fields["execution_time_ms"] = std::to_string(summary.execution_time_ms);

    log(summary.invariant_failures == 0 ? LogLevel::INFO : LogLevel::WARN,
        "Model run completed", fields);
}

void Logger::log_advisory(
    const LogContext& ctx,
    const std::string& advisory,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> all_fields = fields;
    all_fields["event"] = advisory + "_advisory";
    all_fields["model_id"] = ctx.model_id;
    all_fields["phase"] = ctx.phase;

    log(LogLevel::WARN, message, all_fields);
}

void Logger::log_invariant_failure(
    const LogContext& ctx,
    const std::string& invariant_name,
    const std::string& details
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "invariant_failure";
    fields["model_id"] = ctx.model_id;
    fields["phase"] = ctx.phase;
    fields["invariant"] = invariant_name;
    fields["details"] = details;

    log(LogLevel::WARN, "Invariant check failed", fields);
}

void Logger::log_output_written(const LogContext& ctx, const std::string& format,
                                const std::string& path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["model_id"] = ctx.model_id;
    fields["format"] = format;
    fields["path"] = path;

    log(LogLevel::INFO, "Output written", fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["model_id"] = ctx.model_id;
    fields["phase"] = ctx.phase;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Model error", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["model_id"] = ctx.model_id;
    fields["phase"] = ctx.phase;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_debug(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> all_fields = fields;
    all_fields["model_id"] = ctx.model_id;
    all_fields["phase"] = ctx.phase;

    log(LogLevel::DEBUG, message, all_fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace carboncalc
