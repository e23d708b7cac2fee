#ifndef OVERPAY_IO_CONFIG_READER_HPP
#define OVERPAY_IO_CONFIG_READER_HPP

#include "../config.hpp"
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace overpay {
namespace io {

/**
 * @brief Exception thrown when a config file cannot be read or parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Emergency fund used when the config names neither a floor nor a month count
constexpr double DEFAULT_EMERGENCY_FUND_MONTHS = 4.0;

// Largest year count whose month count still fits in an int
constexpr int MAX_DURATION_YEARS = std::numeric_limits<int>::max() / 12;

/**
 * @brief Parses a SimulationConfig from a JSON string
 *
 * Every key is optional; missing keys keep the SimulationConfig defaults.
 *
 *   {
 *     "mortgage": {
 *       "principal": 100000,
 *       "term_years": 25,              // or "term_months"
 *       "fixed_periods": [{"months": 24, "rate": 0.041}],
 *       "variable_rate": 0.05
 *     },
 *     "household": {
 *       "monthly_income": 3130, "monthly_expenses": 2000,
 *       "income_growth_rate": 0.02, "expense_growth_rate": 0.02
 *     },
 *     "savings": {
 *       "initial": 16000, "rate": 0.036, "tax_rate": 0.20,
 *       "emergency_fund_months": 4     // or "emergency_floor"
 *     },
 *     "overpayments": {"enabled": true, "min_threshold": 1000},
 *     "simulation": {"horizon_years": 30}   // or "horizon_months"
 *   }
 *
 * "fixed_periods_csv" is only honoured by parse_simulation_config_from_file.
 *
 * @throws ConfigParseError on malformed JSON or wrongly typed values
 * @throws InvalidConfiguration if the resulting configuration is invalid
 */
SimulationConfig parse_simulation_config_from_string(const std::string& json_string);

/**
 * @brief Parses a SimulationConfig from a JSON file
 *
 * A top-level "fixed_periods_csv" path (relative to the config file) replaces
 * "mortgage.fixed_periods" with the rows of that CSV.
 */
SimulationConfig parse_simulation_config_from_file(const std::string& file_path);

/**
 * @brief Loads fixed-rate deals from CSV with header months,rate
 *
 * @throws std::runtime_error on unreadable files or malformed rows
 */
std::vector<FixedRateTerm> load_fixed_terms_from_csv(const std::string& file_path);
std::vector<FixedRateTerm> load_fixed_terms_from_csv(std::istream& is);

/**
 * @brief Resolves a path relative to the directory of the config file
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace io
} // namespace overpay

#endif // OVERPAY_IO_CONFIG_READER_HPP
