#ifndef OVERPAY_CONFIG_HPP
#define OVERPAY_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace overpay {

// Thrown when a SimulationConfig fails validation. Raised before any month is
// simulated, so a rejected configuration never produces a partial result.
class InvalidConfiguration : public std::invalid_argument {
public:
    InvalidConfiguration(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Declared fixed-rate deal: a duration and the annual rate charged during it.
// Start/end months are derived by RateSchedule from the cumulative durations.
struct FixedRateTerm {
    int months;             // Length of the deal in months (> 0)
    double annual_rate;     // Annual rate as a fraction (0.041 = 4.1%)

    FixedRateTerm();
    FixedRateTerm(int m, double rate);

    bool operator==(const FixedRateTerm& other) const;
};

// Immutable input to a simulation run. All rates are annual fractions.
struct SimulationConfig {
    // Mortgage
    double initial_principal;               // Outstanding balance at month 0
    int term_months;                        // Original term, months
    std::vector<FixedRateTerm> fixed_terms; // Consecutive fixed deals from month 0
    double variable_rate;                   // Rate once every fixed deal has expired

    // Household cash flow
    double monthly_income;
    double monthly_expenses;
    double income_growth_rate;              // Applied at each year boundary
    double expense_growth_rate;

    // Savings
    double initial_savings;
    double savings_rate;
    double savings_tax_rate;                // Fraction of savings interest withheld
    double emergency_floor;                 // Savings never swept below this amount

    // Overpayment policy
    double min_overpayment_threshold;
    bool overpayments_enabled;

    int horizon_months;                     // Simulation length cap

    // Defaults reproduce the calculator's example household
    SimulationConfig();
};

// Emergency floor expressed as a number of months of monthly income
double emergency_floor_from_months(double monthly_income, double months);

// Validate a configuration. Throws InvalidConfiguration naming the first bad field.
void validate_config(const SimulationConfig& config);

} // namespace overpay

#endif // OVERPAY_CONFIG_HPP
