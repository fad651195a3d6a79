/**
 * @file logger.hpp
 * @brief Structured logging for the engine and CLI
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Console (stderr) and/or append-mode file output
 * - Model context on every event (model id, pipeline phase)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef CARBONCALC_LOGGER_HPP
#define CARBONCALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace carboncalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values, per-phase detail
    INFO,    ///< Run start/end, outputs written
    WARN,    ///< Non-fatal issues (opening-balance advisory, failed invariants)
    ERROR    ///< Validation failures, IO errors
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 *
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    std::string model_id;            ///< Identifier of the model run (usually the input file name)
    std::string phase;               ///< Pipeline phase (parse, validate, compute, check, write)

    LogContext() : model_id(""), phase("") {}

    LogContext(const std::string& id, const std::string& ph)
        : model_id(id), phase(ph) {}
};

/**
 * @brief Summary of a completed model run
 */
struct RunSummary {
    size_t num_years;                ///< Projection horizon length
    double npv;                      ///< Equity NPV
    double ending_cash;              ///< Cash at the end of the horizon
    double max_abs_balance_check;    ///< Largest |balance_check| across years
    size_t invariant_failures;       ///< Number of failed identity checks
    double execution_time_ms;        ///< Wall time for the compute call

    RunSummary()
        : num_years(0), npv(0.0), ending_cash(0.0), max_abs_balance_check(0.0),
          invariant_failures(0), execution_time_ms(0.0) {}
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
          log_file_path("carboncalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("scenario_simple", "validate");
 *   Logger::get_instance().log_advisory(ctx, "opening_balance", "Opening cash differs", {});
 *   @endcode
 *
 * Writes are serialised, so concurrent model runs may share the instance.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a model run
     *
     * @param ctx Log context
     * @param num_years Projection horizon
     */
    void log_run_start(const LogContext& ctx, size_t num_years);

    /**
     * @brief Log a completed model run
     */
    void log_run_complete(const LogContext& ctx, const RunSummary& summary);

    /**
     * @brief Log a non-fatal advisory raised while validating inputs
     *
     * @param ctx Log context
     * @param advisory Advisory identifier (e.g. "opening_balance")
     * @param message Human readable text
     * @param fields Extra key/value detail
     */
    void log_advisory(
        const LogContext& ctx,
        const std::string& advisory,
        const std::string& message,
        const std::map<std::string, std::string>& fields
    );

    /**
     * @brief Log a failed accounting identity
     */
    void log_invariant_failure(
        const LogContext& ctx,
        const std::string& invariant_name,
        const std::string& details
    );

    /**
     * @brief Log an output artefact written to disk
     */
    void log_output_written(const LogContext& ctx, const std::string& format, const std::string& path);

    void log_error(const LogContext& ctx, const std::string& error_message);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    void log_debug(
        const LogContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& fields
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

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
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace carboncalc

#endif // CARBONCALC_LOGGER_HPP
