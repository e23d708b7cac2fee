#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_engine(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "overpay_test_stdout.txt";
    std::string stderr_file = "overpay_test_stderr.txt";

    std::string full_cmd = std::string(OVERPAY_ENGINE_PATH) + " " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    result.exit_code = WEXITSTATUS(status);

    std::remove(stdout_file.c_str());
    std::remove(stderr_file.c_str());
    return result;
}

std::string data_path(const std::string& name) {
    return std::string(OVERPAY_DATA_DIR) + "/" + name;
}

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_engine("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--config") != std::string::npos);
    REQUIRE(result.stderr_output.find("--fixed-periods") != std::string::npos);
    REQUIRE(result.stderr_output.find("--compare") != std::string::npos);
    REQUIRE(result.stderr_output.find("--no-overpayments") != std::string::npos);
}

TEST_CASE("CLI runs the built-in example", "[cli]") {
    auto result = run_engine("--log-level ERROR");
    REQUIRE(result.exit_code == 0);

    json doc = json::parse(result.stdout_output);
    REQUIRE(doc["summary"]["status"] == "paid_off");
    REQUIRE_FALSE(doc["events"].empty());
    REQUIRE(doc.contains("schedule"));
    REQUIRE(result.stderr_output.find("Mortgage free in:") != std::string::npos);
}

TEST_CASE("CLI reads a config file", "[cli]") {
    auto result = run_engine("--config " + data_path("sample_config.json") + " --summary-only --log-level ERROR");
    REQUIRE(result.exit_code == 0);

    json doc = json::parse(result.stdout_output);
    REQUIRE_FALSE(doc.contains("schedule"));
    REQUIRE(doc["summary"]["paid_off"] == true);
}

TEST_CASE("CLI overrides apply on top of defaults", "[cli]") {
    SECTION("Overpayments disabled") {
        auto result = run_engine("--no-overpayments --summary-only --log-level ERROR");
        REQUIRE(result.exit_code == 0);
        json doc = json::parse(result.stdout_output);
        REQUIRE(doc["events"].empty());
        REQUIRE(doc["summary"]["total_overpayments"].get<double>() == 0.0);
    }

    SECTION("Short horizon") {
        auto result = run_engine("--horizon-years 2 --summary-only --log-level ERROR");
        REQUIRE(result.exit_code == 0);
        json doc = json::parse(result.stdout_output);
        REQUIRE(doc["summary"]["status"] == "horizon_exhausted");
        REQUIRE(doc["summary"]["months_to_payoff"].is_null());
        REQUIRE(doc["months_simulated"] == 24);
    }

    SECTION("Fixed periods from CSV") {
        auto result = run_engine("--fixed-periods " + data_path("sample_fixed_periods.csv") +
                                 " --summary-only --log-level ERROR");
        REQUIRE(result.exit_code == 0);
        json doc = json::parse(result.stdout_output);
        REQUIRE(doc["events"][2]["label"] == "End of fixed period 1");
    }
}

TEST_CASE("CLI comparison mode", "[cli]") {
    auto result = run_engine("--compare --log-level ERROR");
    REQUIRE(result.exit_code == 0);

    json doc = json::parse(result.stdout_output);
    REQUIRE(doc["months_saved"].get<int>() > 0);
    REQUIRE(doc["without_overpayments"]["events"].empty());
    REQUIRE(result.stderr_output.find("Months saved:") != std::string::npos);
}

TEST_CASE("CLI writes output files", "[cli]") {
    const std::string json_path = "overpay_cli_result.json";
    const std::string csv_path = "overpay_cli_schedule.csv";
    const std::string summary_path = "overpay_cli_schedule_summary.csv";

    auto result = run_engine("--output " + json_path + " --csv " + csv_path + " --log-level ERROR");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());
    REQUIRE(result.stderr_output.find("Output written to:") != std::string::npos);

    json doc = json::parse(read_file(json_path));
    REQUIRE(doc["summary"]["paid_off"] == true);
    REQUIRE(read_file(csv_path).rfind("Month,Year,", 0) == 0);
    REQUIRE(read_file(summary_path).rfind("Metric,Value", 0) == 0);

    std::filesystem::remove(json_path);
    std::filesystem::remove(csv_path);
    std::filesystem::remove(summary_path);
}

TEST_CASE("CLI appends log lines to a file", "[cli]") {
    const std::string log_path = "overpay_cli_test.log";
    std::filesystem::remove(log_path);

    auto result = run_engine("--summary-only --log-level DEBUG --log-file " + log_path);
    REQUIRE(result.exit_code == 0);

    std::string log = read_file(log_path);
    REQUIRE(log.find("Starting simulation") != std::string::npos);
    REQUIRE(log.find("Overpayment applied") != std::string::npos);
    REQUIRE(log.find("Simulation completed") != std::string::npos);

    std::filesystem::remove(log_path);
}

TEST_CASE("CLI income override rescales the emergency floor", "[cli]") {
    const std::string log_path = "overpay_cli_income.log";
    std::filesystem::remove(log_path);

    SECTION("Built-in four month floor") {
        auto result = run_engine("--income 5000 --summary-only --log-level INFO --log-file " + log_path);
        REQUIRE(result.exit_code == 0);
        REQUIRE(read_file(log_path).find("emergency_floor=20000.00") != std::string::npos);
    }

    SECTION("Floor pinned in the config file keeps its month count") {
        const std::string config_path = "overpay_cli_pinned_floor.json";
        {
            std::ofstream out(config_path);
            out << R"({"household": {"monthly_income": 3130}, "savings": {"emergency_floor": 6260}})";
        }

        auto result = run_engine("--config " + config_path +
                                 " --income 5000 --summary-only --log-level INFO --log-file " + log_path);
        REQUIRE(result.exit_code == 0);
        REQUIRE(read_file(log_path).find("emergency_floor=10000.00") != std::string::npos);

        std::filesystem::remove(config_path);
    }

    std::filesystem::remove(log_path);
}

TEST_CASE("CLI rejects bad input", "[cli]") {
    SECTION("Unknown option") {
        auto result = run_engine("--bogus");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Non-numeric value") {
        auto result = run_engine("--principal lots");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid numeric value") != std::string::npos);
    }

    SECTION("Missing config file") {
        auto result = run_engine("--config no_such_config.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Config file not found") != std::string::npos);
    }

    SECTION("Invalid log level") {
        auto result = run_engine("--log-level LOUD");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Invalid configuration") {
        auto result = run_engine("--variable-rate 1.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid configuration") != std::string::npos);
        REQUIRE(result.stderr_output.find("variable_rate") != std::string::npos);
    }

    SECTION("Year counts too large for a month count") {
        auto result = run_engine("--horizon-years 2000000000");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--horizon-years is out of range") != std::string::npos);

        result = run_engine("--term-years 200000000");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--term-years is out of range") != std::string::npos);
    }

    SECTION("Negative principal") {
        auto result = run_engine("--principal -5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("initial_principal") != std::string::npos);
    }
}
