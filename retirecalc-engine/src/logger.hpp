/**
 * @file logger.hpp
 * @brief Structured logging for simulation runs
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON or plain-text lines on stderr and/or a log file
 * - Run context (run id, seed, phase) attached to every event
 *
 * Writes are serialized, so worker threads may log excluded scenarios
 * while a run is in progress.
 */

#ifndef RETIRECALC_LOGGER_HPP
#define RETIRECALC_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace retirecalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-search-step detail
    INFO,    ///< Run start and completion
    WARN,    ///< Excluded scenarios, skipped variance reduction, low-confidence results
    ERROR    ///< Validation and infrastructure failures
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
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the run an event belongs to
 */
struct RunContext {
    std::string run_id;              ///< Caller-supplied or derived from the seed
    uint64_t seed;                   ///< Run seed
    std::string phase;               ///< main, ltc_counterfactual, swr_search

    RunContext()
        : run_id(""), seed(0), phase("") {}

    RunContext(const std::string& id, uint64_t run_seed, const std::string& run_phase)
        : run_id(id), seed(run_seed), phase(run_phase) {}
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
          log_file_path("retirecalc.log"),
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
 *   RunContext ctx("run-42", 42, "main");
 *   Logger::get_instance().log_run_start(ctx, 1000, 8);
 *   @endcode
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
     * @brief Log the start of a simulation run
     *
     * @param ctx Run context
     * @param iterations Scenario count
     * @param workers Worker threads used
     */
    void log_run_start(const RunContext& ctx, size_t iterations, int workers);

    /**
     * @brief Log run completion with summary statistics
     *
     * @param ctx Run context
     * @param summary Flat key/value summary (success probability, counts, timing)
     */
    void log_run_complete(const RunContext& ctx, const std::map<std::string, std::string>& summary);

    /**
     * @brief Log a scenario dropped for numeric instability
     */
    void log_scenario_excluded(const RunContext& ctx, size_t scenario, int year,
                               const std::string& reason);

    /**
     * @brief Log rejected input
     */
    void log_validation_failure(const RunContext& ctx, const std::string& field,
                                const std::string& message);

    /**
     * @brief Log the outcome of a safe-withdrawal-rate search
     */
    void log_swr_search(const RunContext& ctx, double rate, int iterations, bool low_confidence);

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_debug(const RunContext& ctx, const std::string& message,
                   const std::map<std::string, std::string>& fields);

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
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    static void add_context(std::map<std::string, std::string>& fields, const RunContext& ctx);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace retirecalc

#endif // RETIRECALC_LOGGER_HPP
