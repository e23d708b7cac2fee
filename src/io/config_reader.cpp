#include "config_reader.hpp"
#include "csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace overpay {
namespace io {

namespace {

template <typename T>
void read_if_present(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

int months_from_years(const json& section, const char* key) {
    long long years = section.at(key).get<long long>();
    if (years > MAX_DURATION_YEARS || years < -MAX_DURATION_YEARS) {
        throw ConfigParseError(std::string("'") + key + "' is out of range: " + std::to_string(years));
    }
    return static_cast<int>(years) * 12;
}

void require_object(const json& j, const char* key) {
    if (j.contains(key) && !j.at(key).is_object()) {
        throw ConfigParseError(std::string("Section '") + key + "' must be an object");
    }
}

SimulationConfig parse_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigParseError("Configuration root must be a JSON object");
    }
    for (const char* section : {"mortgage", "household", "savings", "overpayments", "simulation"}) {
        require_object(j, section);
    }

    SimulationConfig config;

    if (j.contains("mortgage")) {
        const json& mortgage = j.at("mortgage");
        read_if_present(mortgage, "principal", config.initial_principal);
        if (mortgage.contains("term_months")) {
            config.term_months = mortgage.at("term_months").get<int>();
        } else if (mortgage.contains("term_years")) {
            config.term_months = months_from_years(mortgage, "term_years");
        }
        read_if_present(mortgage, "variable_rate", config.variable_rate);

        if (mortgage.contains("fixed_periods")) {
            const json& periods = mortgage.at("fixed_periods");
            if (!periods.is_array()) {
                throw ConfigParseError("mortgage.fixed_periods must be an array");
            }
            config.fixed_terms.clear();
            for (const auto& period : periods) {
                if (!period.contains("months") || !period.contains("rate")) {
                    throw ConfigParseError("Each fixed period requires 'months' and 'rate'");
                }
                config.fixed_terms.emplace_back(period.at("months").get<int>(),
                                                period.at("rate").get<double>());
            }
        }
    }

    if (j.contains("household")) {
        const json& household = j.at("household");
        read_if_present(household, "monthly_income", config.monthly_income);
        read_if_present(household, "monthly_expenses", config.monthly_expenses);
        read_if_present(household, "income_growth_rate", config.income_growth_rate);
        read_if_present(household, "expense_growth_rate", config.expense_growth_rate);
    }

    // Floor defaults to a number of months of the (possibly overridden) income
    config.emergency_floor = emergency_floor_from_months(config.monthly_income,
                                                         DEFAULT_EMERGENCY_FUND_MONTHS);

    if (j.contains("savings")) {
        const json& savings = j.at("savings");
        read_if_present(savings, "initial", config.initial_savings);
        read_if_present(savings, "rate", config.savings_rate);
        read_if_present(savings, "tax_rate", config.savings_tax_rate);
        if (savings.contains("emergency_floor")) {
            config.emergency_floor = savings.at("emergency_floor").get<double>();
        } else if (savings.contains("emergency_fund_months")) {
            config.emergency_floor = emergency_floor_from_months(
                config.monthly_income, savings.at("emergency_fund_months").get<double>());
        }
    }

    if (j.contains("overpayments")) {
        const json& overpayments = j.at("overpayments");
        read_if_present(overpayments, "enabled", config.overpayments_enabled);
        read_if_present(overpayments, "min_threshold", config.min_overpayment_threshold);
    }

    if (j.contains("simulation")) {
        const json& simulation = j.at("simulation");
        if (simulation.contains("horizon_months")) {
            config.horizon_months = simulation.at("horizon_months").get<int>();
        } else if (simulation.contains("horizon_years")) {
            config.horizon_months = months_from_years(simulation, "horizon_years");
        }
    }

    return config;
}

json parse_document(const std::string& json_string) {
    try {
        return json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
}

SimulationConfig parse_checked(const json& j) {
    SimulationConfig config;
    try {
        config = parse_json(j);
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }
    return config;
}

} // anonymous namespace

SimulationConfig parse_simulation_config_from_string(const std::string& json_string) {
    SimulationConfig config = parse_checked(parse_document(json_string));
    validate_config(config);
    return config;
}

SimulationConfig parse_simulation_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    json j = parse_document(buffer.str());
    SimulationConfig config = parse_checked(j);

    if (j.contains("fixed_periods_csv")) {
        if (!j.at("fixed_periods_csv").is_string()) {
            throw ConfigParseError("fixed_periods_csv must be a string path");
        }
        std::string csv_path = resolve_relative_path(
            j.at("fixed_periods_csv").get<std::string>(), file_path);
        config.fixed_terms = load_fixed_terms_from_csv(csv_path);
    }

    validate_config(config);
    return config;
}

std::vector<FixedRateTerm> load_fixed_terms_from_csv(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file) {
        throw std::runtime_error("Cannot open fixed periods file: " + file_path);
    }
    return load_fixed_terms_from_csv(file);
}

std::vector<FixedRateTerm> load_fixed_terms_from_csv(std::istream& is) {
    CsvReader reader(is);
    std::vector<FixedRateTerm> terms;

    auto header = reader.read_row();
    if (header.size() < 2 || header[0] != "months" || header[1] != "rate") {
        throw std::runtime_error("Fixed periods CSV requires header: months,rate");
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 2) {
            throw std::runtime_error("Fixed periods CSV line " + std::to_string(reader.line_number()) +
                                     ": expected months,rate");
        }
        try {
            terms.emplace_back(std::stoi(row[0]), std::stod(row[1]));
        } catch (const std::logic_error&) {
            throw std::runtime_error("Fixed periods CSV line " + std::to_string(reader.line_number()) +
                                     ": non-numeric value");
        }
    }

    return terms;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (fs::path(config_file_path).parent_path() / p).string();
}

} // namespace io
} // namespace overpay
