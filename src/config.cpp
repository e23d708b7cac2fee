#include "config.hpp"
#include <cmath>

namespace overpay {

// ============================================================================
// FixedRateTerm Implementation
// ============================================================================

FixedRateTerm::FixedRateTerm() : months(0), annual_rate(0.0) {}

FixedRateTerm::FixedRateTerm(int m, double rate) : months(m), annual_rate(rate) {}

bool FixedRateTerm::operator==(const FixedRateTerm& other) const {
    return months == other.months && annual_rate == other.annual_rate;
}

// ============================================================================
// SimulationConfig Implementation
// ============================================================================

SimulationConfig::SimulationConfig()
    : initial_principal(100000.0),
      term_months(25 * 12),
      fixed_terms{FixedRateTerm(24, 0.041), FixedRateTerm(60, 0.034)},
      variable_rate(0.05),
      monthly_income(3130.0),
      monthly_expenses(2000.0),
      income_growth_rate(0.02),
      expense_growth_rate(0.02),
      initial_savings(16000.0),
      savings_rate(0.036),
      savings_tax_rate(0.20),
      emergency_floor(emergency_floor_from_months(3130.0, 4.0)),
      min_overpayment_threshold(1000.0),
      overpayments_enabled(true),
      horizon_months(30 * 12) {}

double emergency_floor_from_months(double monthly_income, double months) {
    if (months < 0.0) {
        throw InvalidConfiguration("emergency_fund_months", "must be non-negative");
    }
    return monthly_income * months;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require_finite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidConfiguration(field, "must be a finite number");
    }
}

void require_non_negative(const std::string& field, double value) {
    require_finite(field, value);
    if (value < 0.0) {
        throw InvalidConfiguration(field, "must be non-negative");
    }
}

// Rates live in [0, 1)
void require_rate(const std::string& field, double rate) {
    require_finite(field, rate);
    if (rate < 0.0 || rate >= 1.0) {
        throw InvalidConfiguration(field, "rate must be in [0, 1), got " + std::to_string(rate));
    }
}

} // anonymous namespace

void validate_config(const SimulationConfig& config) {
    require_finite("initial_principal", config.initial_principal);
    if (config.initial_principal <= 0.0) {
        throw InvalidConfiguration("initial_principal", "must be positive");
    }
    if (config.term_months <= 0) {
        throw InvalidConfiguration("term_months", "must be positive");
    }
    if (config.horizon_months <= 0) {
        throw InvalidConfiguration("horizon_months", "must be positive");
    }

    for (size_t i = 0; i < config.fixed_terms.size(); ++i) {
        const FixedRateTerm& term = config.fixed_terms[i];
        const std::string field = "fixed_terms[" + std::to_string(i) + "]";
        if (term.months <= 0) {
            throw InvalidConfiguration(field, "duration must be positive");
        }
        require_rate(field, term.annual_rate);
    }

    require_rate("variable_rate", config.variable_rate);
    require_rate("income_growth_rate", config.income_growth_rate);
    require_rate("expense_growth_rate", config.expense_growth_rate);
    require_rate("savings_rate", config.savings_rate);
    require_rate("savings_tax_rate", config.savings_tax_rate);

    require_non_negative("monthly_income", config.monthly_income);
    require_non_negative("monthly_expenses", config.monthly_expenses);
    require_non_negative("initial_savings", config.initial_savings);
    require_non_negative("emergency_floor", config.emergency_floor);
    require_non_negative("min_overpayment_threshold", config.min_overpayment_threshold);
}

} // namespace overpay
