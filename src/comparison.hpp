#ifndef OVERPAY_COMPARISON_HPP
#define OVERPAY_COMPARISON_HPP

#include "simulation.hpp"

namespace overpay {

// Overpayment scenario against the same household with overpayments disabled
struct ComparisonResult {
    SimulationResult with_overpayments;
    SimulationResult without_overpayments;
    int horizon_months;
    double execution_time_ms;

    ComparisonResult();

    // Months by which overpaying brings payoff forward. When the baseline is
    // not paid off within the horizon the horizon is used as its payoff month.
    int months_saved() const;

    // Interest paid without overpayments minus interest paid with them
    double interest_difference() const;
};

// Run both scenarios. The runs share nothing and execute in parallel when
// built with OpenMP.
ComparisonResult compare_with_baseline(const SimulationConfig& config);

} // namespace overpay

#endif // OVERPAY_COMPARISON_HPP
