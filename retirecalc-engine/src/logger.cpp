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

namespace retirecalc {

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

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const RunContext& ctx) {
    fields["run_id"] = ctx.run_id;
    fields["seed"] = std::to_string(ctx.seed);
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

void Logger::log_run_start(const RunContext& ctx, size_t iterations, int workers) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    add_context(fields, ctx);
    fields["iterations"] = std::to_string(iterations);
    fields["workers"] = std::to_string(workers);

    log(LogLevel::INFO, "Starting simulation run", std::move(fields));
}

void Logger::log_run_complete(const RunContext& ctx,
                              const std::map<std::string, std::string>& summary) {
    std::map<std::string, std::string> fields = summary;
    fields["event"] = "run_complete";
    add_context(fields, ctx);

    log(LogLevel::INFO, "Simulation run completed", std::move(fields));
}

void Logger::log_scenario_excluded(const RunContext& ctx, size_t scenario, int year,
                                   const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_excluded";
    add_context(fields, ctx);
    fields["scenario"] = std::to_string(scenario);
    fields["year"] = std::to_string(year);
    fields["reason"] = reason;

    log(LogLevel::WARN, "Scenario excluded from aggregation", std::move(fields));
}

void Logger::log_validation_failure(const RunContext& ctx, const std::string& field,
                                    const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "validation_failed";
    add_context(fields, ctx);
    fields["field"] = field;
    fields["error"] = message;

    log(LogLevel::ERROR, "Invalid simulation parameters", std::move(fields));
}

void Logger::log_swr_search(const RunContext& ctx, double rate, int iterations,
                            bool low_confidence) {
    std::map<std::string, std::string> fields;
    fields["event"] = "swr_search";
    add_context(fields, ctx);
    fields["rate"] = std::to_string(rate);
    fields["iterations"] = std::to_string(iterations);
    fields["low_confidence"] = low_confidence ? "true" : "false";

    log(low_confidence ? LogLevel::WARN : LogLevel::INFO,
        "Safe withdrawal rate search finished", std::move(fields));
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);

    log(LogLevel::ERROR, error_message, std::move(fields));
}

void Logger::log_debug(const RunContext& ctx, const std::string& message,
                       const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> fields = extra;
    add_context(fields, ctx);

    log(LogLevel::DEBUG, message, std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
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

// ============================================================================
// Helpers
// ============================================================================

void Logger::log(LogLevel level, const std::string& message,
                 std::map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
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
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

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

} // namespace retirecalc
