/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace retirecalc;

namespace {

// Helper function to parse JSON log line
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    // Very simple JSON parser for test purposes (all values are strings)
    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

std::string test_log_path() {
    return (std::filesystem::temp_directory_path() / "retirecalc_test_logger.log").string();
}

// Routes the logger to a fresh file only
void configure_file_logger(LogLevel min_level) {
    std::filesystem::remove(test_log_path());

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = test_log_path();
    config.enable_json = true;
    Logger::get_instance().configure(config);
}

std::vector<std::map<std::string, std::string>> read_log_lines() {
    Logger::get_instance().flush();

    std::vector<std::map<std::string, std::string>> entries;
    std::ifstream in(test_log_path());
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            entries.push_back(parse_json_log(line));
        }
    }
    return entries;
}

void restore_quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(test_log_path());
}

} // anonymous namespace

TEST_CASE("Logger configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.log_file_path == "retirecalc.log");
        REQUIRE(config.enable_json == true);
    }

    SECTION("Minimum level follows configuration") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
    }

    restore_quiet_logger();
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(level_to_string(LogLevel::DEBUG) == "DEBUG");
    REQUIRE(level_to_string(LogLevel::INFO) == "INFO");
    REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
    REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");

    REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
    REQUIRE(string_to_level("WARN") == LogLevel::WARN);
    REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
    REQUIRE(string_to_level("verbose") == LogLevel::INFO);
}

TEST_CASE("Run events carry run context", "[logger]") {
    configure_file_logger(LogLevel::INFO);
    Logger& logger = Logger::get_instance();
    RunContext ctx("run-42", 42, "main");

    logger.log_run_start(ctx, 1000, 8);
    logger.log_run_complete(ctx, {{"success_probability", "0.870000"}});

    auto entries = read_log_lines();
    REQUIRE(entries.size() == 2);

    const auto& start = entries[0];
    REQUIRE(start.at("event") == "run_start");
    REQUIRE(start.at("level") == "INFO");
    REQUIRE(start.at("run_id") == "run-42");
    REQUIRE(start.at("seed") == "42");
    REQUIRE(start.at("phase") == "main");
    REQUIRE(start.at("iterations") == "1000");
    REQUIRE(start.at("workers") == "8");
    REQUIRE(start.at("timestamp").back() == 'Z');
    REQUIRE_FALSE(start.at("message").empty());

    const auto& complete = entries[1];
    REQUIRE(complete.at("event") == "run_complete");
    REQUIRE(complete.at("success_probability") == "0.870000");

    restore_quiet_logger();
}

TEST_CASE("Warning and error events", "[logger]") {
    configure_file_logger(LogLevel::INFO);
    Logger& logger = Logger::get_instance();
    RunContext ctx("run-7", 7, "");

    logger.log_scenario_excluded(ctx, 12, 30, "non-finite balance");
    logger.log_validation_failure(ctx, "allocation.weights", "weights must sum to 1");
    logger.log_swr_search(ctx, 0.04, 12, true);
    logger.log_swr_search(ctx, 0.05, 9, false);
    logger.log_warning(ctx, "control variates skipped");
    logger.log_error(ctx, "worker failed");

    auto entries = read_log_lines();
    REQUIRE(entries.size() == 6);

    REQUIRE(entries[0].at("event") == "scenario_excluded");
    REQUIRE(entries[0].at("level") == "WARN");
    REQUIRE(entries[0].at("scenario") == "12");
    REQUIRE(entries[0].at("year") == "30");
    REQUIRE(entries[0].at("reason") == "non-finite balance");
    // Empty phase is omitted
    REQUIRE(entries[0].count("phase") == 0);

    REQUIRE(entries[1].at("event") == "validation_failed");
    REQUIRE(entries[1].at("level") == "ERROR");
    REQUIRE(entries[1].at("field") == "allocation.weights");

    REQUIRE(entries[2].at("event") == "swr_search");
    REQUIRE(entries[2].at("level") == "WARN");
    REQUIRE(entries[2].at("low_confidence") == "true");
    REQUIRE(entries[3].at("level") == "INFO");
    REQUIRE(entries[3].at("low_confidence") == "false");

    REQUIRE(entries[4].at("event") == "warning");
    REQUIRE(entries[4].at("message") == "control variates skipped");
    REQUIRE(entries[5].at("event") == "error");
    REQUIRE(entries[5].at("message") == "worker failed");

    restore_quiet_logger();
}

TEST_CASE("Events below the minimum level are dropped", "[logger]") {
    configure_file_logger(LogLevel::WARN);
    Logger& logger = Logger::get_instance();
    RunContext ctx("run-1", 1, "swr_search");

    logger.log_debug(ctx, "bisection step", {{"rate", "0.041"}});
    logger.log_run_start(ctx, 10, 1);
    logger.log_warning(ctx, "kept");

    auto entries = read_log_lines();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].at("message") == "kept");
    REQUIRE(entries[0].at("phase") == "swr_search");

    SECTION("Debug events carry their extra fields") {
        configure_file_logger(LogLevel::DEBUG);
        logger.log_debug(ctx, "bisection step", {{"rate", "0.041"}});
        auto debug_entries = read_log_lines();
        REQUIRE(debug_entries.size() == 1);
        REQUIRE(debug_entries[0].at("level") == "DEBUG");
        REQUIRE(debug_entries[0].at("rate") == "0.041");
        REQUIRE(debug_entries[0].count("event") == 0);
    }

    restore_quiet_logger();
}
