#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include "config.hpp"
#include "simulation.hpp"
#include "comparison.hpp"
#include "logger.hpp"
#include "io/config_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

// Optional overrides are applied only when the flag was given
template <typename T>
struct Override {
    bool set = false;
    T value{};

    void assign(const T& v) {
        value = v;
        set = true;
    }
};

struct CLIArgs {
    std::string config_path;
    std::string fixed_periods_path;
    std::string output_path;
    std::string csv_path;
    std::string parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool compare = false;
    bool no_overpayments = false;
    bool include_schedule = true;
    bool help = false;

    Override<double> principal;
    Override<int> term_years;
    Override<double> variable_rate;
    Override<double> income;
    Override<double> expenses;
    Override<double> savings;
    Override<double> emergency_months;
    Override<double> threshold;
    Override<int> horizon_years;
};

void print_usage(const char* program_name) {
    std::cerr << "Overpay Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Simulates a repayment mortgage and a savings balance month by month under an\n";
    std::cerr << "overpayment policy. Without --config the built-in example household is used.\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON simulation configuration\n";
    std::cerr << "  --fixed-periods <path>      CSV of fixed-rate deals (columns: months,rate)\n\n";
    std::cerr << "Overrides:\n";
    std::cerr << "  --principal <amount>        Outstanding mortgage balance\n";
    std::cerr << "  --term-years <years>        Original mortgage term\n";
    std::cerr << "  --variable-rate <rate>      Rate after fixed deals expire (e.g. 0.05)\n";
    std::cerr << "  --income <amount>           Monthly net income\n";
    std::cerr << "  --expenses <amount>         Monthly expenses\n";
    std::cerr << "  --savings <amount>          Current savings\n";
    std::cerr << "  --emergency-months <m>      Emergency fund in months of income\n";
    std::cerr << "  --threshold <amount>        Minimum overpayment threshold\n";
    std::cerr << "  --horizon-years <years>     Simulation period\n";
    std::cerr << "  --no-overpayments           Disable all overpayment rules\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --summary-only              Omit the monthly schedule from JSON output\n";
    std::cerr << "  --csv <path>                Monthly schedule CSV (summary beside it)\n";
    std::cerr << "  --parquet <path>            Monthly schedule Parquet (requires Arrow)\n";
    std::cerr << "  --compare                   Also run without overpayments and report the difference\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --config data/sample_config.json --output result.json\n";
    std::cerr << "  " << program_name << " --principal 150000 --term-years 30 --compare\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--fixed-periods" && i + 1 < argc) {
                args.fixed_periods_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--csv" && i + 1 < argc) {
                args.csv_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--compare") {
                args.compare = true;
            } else if (arg == "--no-overpayments") {
                args.no_overpayments = true;
            } else if (arg == "--summary-only") {
                args.include_schedule = false;
            } else if (arg == "--principal" && i + 1 < argc) {
                args.principal.assign(std::stod(argv[++i]));
            } else if (arg == "--term-years" && i + 1 < argc) {
                args.term_years.assign(std::stoi(argv[++i]));
            } else if (arg == "--variable-rate" && i + 1 < argc) {
                args.variable_rate.assign(std::stod(argv[++i]));
            } else if (arg == "--income" && i + 1 < argc) {
                args.income.assign(std::stod(argv[++i]));
            } else if (arg == "--expenses" && i + 1 < argc) {
                args.expenses.assign(std::stod(argv[++i]));
            } else if (arg == "--savings" && i + 1 < argc) {
                args.savings.assign(std::stod(argv[++i]));
            } else if (arg == "--emergency-months" && i + 1 < argc) {
                args.emergency_months.assign(std::stod(argv[++i]));
            } else if (arg == "--threshold" && i + 1 < argc) {
                args.threshold.assign(std::stod(argv[++i]));
            } else if (arg == "--horizon-years" && i + 1 < argc) {
                args.horizon_years.assign(std::stoi(argv[++i]));
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid numeric value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Year overrides become month counts, which must fit in an int
bool years_in_range(const Override<int>& years) {
    return !years.set || (years.value <= overpay::io::MAX_DURATION_YEARS &&
                          years.value >= -overpay::io::MAX_DURATION_YEARS);
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.fixed_periods_path.empty() && !file_exists(args.fixed_periods_path)) {
        std::cerr << "Error: Fixed periods file not found: " << args.fixed_periods_path << "\n";
        valid = false;
    }

    if (!years_in_range(args.term_years)) {
        std::cerr << "Error: --term-years is out of range\n";
        valid = false;
    }

    if (!years_in_range(args.horizon_years)) {
        std::cerr << "Error: --horizon-years is out of range\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be one of DEBUG, INFO, WARN, ERROR\n";
        valid = false;
    }

    return valid;
}

overpay::SimulationConfig build_config(const CLIArgs& args) {
    overpay::SimulationConfig config;
    if (!args.config_path.empty()) {
        config = overpay::io::parse_simulation_config_from_file(args.config_path);
    }

    if (!args.fixed_periods_path.empty()) {
        config.fixed_terms = overpay::io::load_fixed_terms_from_csv(args.fixed_periods_path);
    }

    if (args.principal.set) config.initial_principal = args.principal.value;
    if (args.term_years.set) config.term_months = args.term_years.value * 12;
    if (args.variable_rate.set) config.variable_rate = args.variable_rate.value;
    if (args.expenses.set) config.monthly_expenses = args.expenses.value;
    if (args.savings.set) config.initial_savings = args.savings.value;
    if (args.threshold.set) config.min_overpayment_threshold = args.threshold.value;
    if (args.horizon_years.set) config.horizon_months = args.horizon_years.value * 12;
    if (args.no_overpayments) config.overpayments_enabled = false;

    // The floor keeps its size in months of income, pinned or not
    if (args.income.set) {
        double months = config.monthly_income > 0.0
            ? config.emergency_floor / config.monthly_income
            : overpay::io::DEFAULT_EMERGENCY_FUND_MONTHS;
        config.monthly_income = args.income.value;
        config.emergency_floor = overpay::emergency_floor_from_months(config.monthly_income, months);
    }
    if (args.emergency_months.set) {
        config.emergency_floor = overpay::emergency_floor_from_months(
            config.monthly_income, args.emergency_months.value);
    }

    overpay::validate_config(config);
    return config;
}

void print_summary(const std::string& title, const overpay::SimulationResult& result,
                   const overpay::SimulationConfig& config) {
    const overpay::SimulationSummary& summary = result.summary;
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "\n" << title << ":\n";
    std::cerr << "  Mortgage free in:   " << summary.payoff_description();
    if (summary.paid_off()) {
        std::cerr << " (" << summary.years_saved(config.term_months) << " years early)";
    } else {
        std::cerr << " within " << config.horizon_months / 12 << " years";
    }
    std::cerr << "\n";
    std::cerr << "  Interest paid:      " << summary.total_interest_paid << "\n";
    std::cerr << "  Interest saved:     " << summary.interest_saved << "\n";
    std::cerr << "  Total overpayments: " << summary.total_overpayments << "\n";
    std::cerr << "  Final savings:      " << summary.final_savings << "\n";
    std::cerr << "  Overpayment events: " << result.events.size() << "\n";
    for (const overpay::OverpaymentEvent& event : result.events) {
        std::cerr << "    Year " << std::setprecision(1) << event.month / 12.0
                  << std::setprecision(2) << "  " << event.amount
                  << "  " << event.label() << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    overpay::LoggerConfig log_config;
    log_config.min_level = overpay::string_to_level(args.log_level);
    log_config.enable_json = false;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    overpay::Logger& logger = overpay::Logger::get_instance();
    logger.configure(log_config);

    overpay::RunContext ctx("cli", "overpayment");

    try {
        overpay::SimulationConfig config = build_config(args);

        if (args.compare) {
            logger.log_simulation_start(ctx, config);
            overpay::ComparisonResult comparison = overpay::compare_with_baseline(config);
            logger.log_simulation_complete(ctx, comparison.with_overpayments);
            logger.log_simulation_complete(overpay::RunContext("cli", "baseline"),
                                           comparison.without_overpayments);
            logger.log_comparison_complete(ctx, comparison);

            print_summary("With overpayments", comparison.with_overpayments, config);
            print_summary("Without overpayments", comparison.without_overpayments, config);
            std::cerr << "\n  Months saved:        " << comparison.months_saved() << "\n";
            std::cerr << "  Interest difference: " << comparison.interest_difference() << "\n";

            if (args.output_path.empty()) {
                overpay::io::write_comparison_json(std::cout, comparison, config.term_months);
            } else {
                overpay::io::write_comparison_json(args.output_path, comparison, config.term_months);
                std::cerr << "\nOutput written to: " << args.output_path << "\n";
            }
            if (!args.csv_path.empty()) {
                overpay::io::write_schedule_csv(args.csv_path, comparison.with_overpayments);
                overpay::io::write_summary_csv(overpay::io::summary_path_for(args.csv_path),
                                               comparison.with_overpayments, config);
            }
            if (!args.parquet_path.empty()) {
                overpay::ParquetWriter::write_schedule(comparison.with_overpayments, args.parquet_path);
            }
        } else {
            if (!config.overpayments_enabled) {
                ctx.scenario = "baseline";
            }
            logger.log_simulation_start(ctx, config);
            overpay::SimulationResult result = overpay::run_simulation(config);
            logger.log_simulation_complete(ctx, result);

            print_summary("Results", result, config);

            if (args.output_path.empty()) {
                overpay::io::write_simulation_result_json(std::cout, result, config.term_months,
                                                          args.include_schedule);
            } else {
                overpay::io::write_simulation_result_json(args.output_path, result, config.term_months,
                                                          args.include_schedule);
                std::cerr << "\nOutput written to: " << args.output_path << "\n";
            }
            if (!args.csv_path.empty()) {
                overpay::io::write_schedule_csv(args.csv_path, result);
                overpay::io::write_summary_csv(overpay::io::summary_path_for(args.csv_path),
                                               result, config);
            }
            if (!args.parquet_path.empty()) {
                overpay::ParquetWriter::write_schedule(result, args.parquet_path);
            }
        }

        logger.flush();
        return 0;
    } catch (const overpay::InvalidConfiguration& e) {
        logger.log_config_error(ctx, e.field(), e.what());
        std::cerr << "Error: Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
