#include "overpayment_policy.hpp"
#include <algorithm>
#include <stdexcept>

namespace overpay {

std::string rule_to_string(OverpaymentRule rule) {
    switch (rule) {
        case OverpaymentRule::EndOfFixedPeriod: return "end_of_fixed_period";
        case OverpaymentRule::VariableRateSweep: return "variable_rate_period";
        case OverpaymentRule::AnnualAllowance: return "annual_allowance";
        default: return "unknown";
    }
}

// ============================================================================
// OverpaymentEvent Implementation
// ============================================================================

OverpaymentEvent::OverpaymentEvent()
    : month(0), amount(0.0), rule(OverpaymentRule::EndOfFixedPeriod), ordinal(0) {}

OverpaymentEvent::OverpaymentEvent(int m, double amt, OverpaymentRule r, int ord)
    : month(m), amount(amt), rule(r), ordinal(ord) {}

std::string OverpaymentEvent::label() const {
    switch (rule) {
        case OverpaymentRule::EndOfFixedPeriod:
            return "End of fixed period " + std::to_string(ordinal);
        case OverpaymentRule::VariableRateSweep:
            return "Variable rate period";
        case OverpaymentRule::AnnualAllowance:
            return "Annual overpayment (Year " + std::to_string(ordinal) + ")";
        default:
            return "Unknown";
    }
}

bool OverpaymentEvent::operator==(const OverpaymentEvent& other) const {
    return month == other.month &&
           amount == other.amount &&
           rule == other.rule &&
           ordinal == other.ordinal;
}

// ============================================================================
// OverpaymentPolicy Implementation
// ============================================================================

OverpaymentPolicy::OverpaymentPolicy(double emergency_floor, double min_threshold)
    : emergency_floor_(emergency_floor), min_threshold_(min_threshold) {
    if (emergency_floor < 0.0) {
        throw std::invalid_argument("Emergency floor must be non-negative");
    }
    if (min_threshold < 0.0) {
        throw std::invalid_argument("Minimum overpayment threshold must be non-negative");
    }
}

double OverpaymentPolicy::spare_cash(double savings) const {
    return std::max(0.0, savings - emergency_floor_);
}

double OverpaymentPolicy::end_of_period_sweep(double savings, double balance) const {
    if (balance <= 0.0) {
        return 0.0;
    }
    return std::min(spare_cash(savings), balance);
}

double OverpaymentPolicy::variable_rate_sweep(double savings, double balance) const {
    double candidate = spare_cash(savings);
    if (balance <= 0.0 || candidate < min_threshold_) {
        return 0.0;
    }
    return std::min(candidate, balance);
}

double OverpaymentPolicy::annual_allowance(double savings, double balance,
                                           double allowance_remaining,
                                           bool allowance_used) const {
    if (allowance_used || balance <= 0.0 || savings <= emergency_floor_) {
        return 0.0;
    }

    double spare = savings - emergency_floor_;
    if (spare < min_threshold_) {
        return 0.0;
    }

    double amount = std::min({spare, std::max(0.0, allowance_remaining), balance});
    return amount > 0.0 ? amount : 0.0;
}

} // namespace overpay
