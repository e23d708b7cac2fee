/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace overpay;
using json = nlohmann::json;

namespace {

const char* TEST_LOG_FILE = "overpay_test_logger.log";

// Route logs to a fresh file only
void configure_file_logger(LogLevel min_level, bool json_lines = true) {
    std::filesystem::remove(TEST_LOG_FILE);

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = TEST_LOG_FILE;
    config.enable_json = json_lines;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_log_lines() {
    Logger::get_instance().flush();
    std::vector<std::string> lines;
    std::ifstream file(TEST_LOG_FILE);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::vector<json> read_json_lines() {
    std::vector<json> entries;
    for (const std::string& line : read_log_lines()) {
        entries.push_back(json::parse(line));
    }
    return entries;
}

void reset_logger() {
    Logger::get_instance().configure(LoggerConfig());
    std::filesystem::remove(TEST_LOG_FILE);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "overpay.log");
    }

    SECTION("Level round-trips through strings") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("Minimum level is applied") {
        configure_file_logger(LogLevel::WARN);
        REQUIRE(Logger::get_instance().get_min_level() == LogLevel::WARN);
        reset_logger();
    }
}

TEST_CASE("Logger writes simulation lifecycle as JSON", "[logger]") {
    configure_file_logger(LogLevel::DEBUG);
    Logger& logger = Logger::get_instance();

    SimulationConfig config;
    SimulationResult result = run_simulation(config);
    RunContext ctx("test-run", "overpayment");

    logger.log_simulation_start(ctx, config);
    logger.log_simulation_complete(ctx, result);

    std::vector<json> entries = read_json_lines();
    REQUIRE(entries.size() == result.events.size() + 2);

    const json& start = entries.front();
    REQUIRE(start["event"] == "simulation_start");
    REQUIRE(start["level"] == "INFO");
    REQUIRE(start["run_id"] == "test-run");
    REQUIRE(start["scenario"] == "overpayment");
    REQUIRE(start["principal"] == "100000.00");
    REQUIRE(start["term_months"] == "300");
    REQUIRE(start.contains("timestamp"));

    for (size_t i = 0; i < result.events.size(); ++i) {
        const json& entry = entries[i + 1];
        REQUIRE(entry["event"] == "overpayment");
        REQUIRE(entry["level"] == "DEBUG");
        REQUIRE(entry["month"] == std::to_string(result.events[i].month));
        REQUIRE(entry["label"] == result.events[i].label());
    }

    const json& complete = entries.back();
    REQUIRE(complete["event"] == "simulation_complete");
    REQUIRE(complete["status"] == "paid_off");
    REQUIRE(complete["payoff"] == result.summary.payoff_description());
    REQUIRE(complete["overpayment_events"] == std::to_string(result.events.size()));

    reset_logger();
}

TEST_CASE("Logger filters below the minimum level", "[logger]") {
    configure_file_logger(LogLevel::INFO);
    Logger& logger = Logger::get_instance();

    SimulationResult result = run_simulation(SimulationConfig());
    logger.log_simulation_complete(RunContext("filtered", "overpayment"), result);

    std::vector<json> entries = read_json_lines();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0]["event"] == "simulation_complete");

    reset_logger();
}

TEST_CASE("Logger warns about deficit months", "[logger]") {
    configure_file_logger(LogLevel::WARN);
    Logger& logger = Logger::get_instance();

    SimulationConfig config;
    config.monthly_expenses = 4000.0;
    config.horizon_months = 12;
    config.overpayments_enabled = false;
    SimulationResult result = run_simulation(config);
    REQUIRE(result.summary.deficit_months > 0);

    logger.log_simulation_complete(RunContext("deficit", "baseline"), result);

    std::vector<json> entries = read_json_lines();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0]["event"] == "warning");
    REQUIRE(entries[0]["level"] == "WARN");
    REQUIRE(entries[0]["warning"].get<std::string>().find("12 month(s)") != std::string::npos);

    reset_logger();
}

TEST_CASE("Logger records configuration errors and comparisons", "[logger]") {
    configure_file_logger(LogLevel::INFO);
    Logger& logger = Logger::get_instance();
    RunContext ctx("cli", "overpayment");

    logger.log_config_error(ctx, "variable_rate", "rate must be in [0, 1)");
    logger.log_comparison_complete(ctx, compare_with_baseline(SimulationConfig()));
    logger.log_error(ctx, "disk \"full\"\nretry");

    std::vector<json> entries = read_json_lines();
    REQUIRE(entries.size() == 3);

    REQUIRE(entries[0]["event"] == "config_error");
    REQUIRE(entries[0]["level"] == "ERROR");
    REQUIRE(entries[0]["field"] == "variable_rate");

    REQUIRE(entries[1]["event"] == "comparison_complete");
    REQUIRE(std::stoi(entries[1]["months_saved"].get<std::string>()) > 0);

    // Quotes and newlines survive escaping
    REQUIRE(entries[2]["error_message"] == "disk \"full\"\nretry");

    reset_logger();
}

TEST_CASE("Logger plain text output", "[logger]") {
    configure_file_logger(LogLevel::INFO, false);
    Logger::get_instance().log_warning(RunContext("plain", "baseline"), "low savings");

    std::vector<std::string> lines = read_log_lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] low savings") != std::string::npos);
    REQUIRE(lines[0].find("run_id=plain") != std::string::npos);

    reset_logger();
}
