#ifndef OVERPAY_OVERPAYMENT_POLICY_HPP
#define OVERPAY_OVERPAYMENT_POLICY_HPP

#include <cstdint>
#include <string>

namespace overpay {

// Which policy rule moved cash from savings to the mortgage
enum class OverpaymentRule : uint8_t {
    EndOfFixedPeriod = 0,   // Lump sum on the month a fixed deal expires
    VariableRateSweep = 1,  // Sweep of spare cash once on the variable rate
    AnnualAllowance = 2     // Capped once-a-year overpayment
};

std::string rule_to_string(OverpaymentRule rule);

// Append-only log entry for a single overpayment
struct OverpaymentEvent {
    int month;              // Simulation month (0-based)
    double amount;          // Amount moved to principal (> 0)
    OverpaymentRule rule;
    int ordinal;            // Fixed period number (1-based) for EndOfFixedPeriod,
                            // mortgage year (1-based) for AnnualAllowance, 0 otherwise

    OverpaymentEvent();
    OverpaymentEvent(int m, double amt, OverpaymentRule r, int ord = 0);

    // "End of fixed period 1", "Variable rate period", "Annual overpayment (Year 3)"
    std::string label() const;

    bool operator==(const OverpaymentEvent& other) const;
};

// OverpaymentPolicy: decides how much cash each rule moves this month.
// Every method is a pure function of its inputs and returns 0 when the rule
// does not fire. Amounts are always capped at the outstanding balance.
class OverpaymentPolicy {
public:
    // Annual allowance as a fraction of the balance at the year's first month
    static constexpr double ANNUAL_ALLOWANCE_FRACTION = 0.10;

    OverpaymentPolicy(double emergency_floor, double min_threshold);

    // Savings above the emergency floor, never negative
    double spare_cash(double savings) const;

    // Rule 1: everything above the floor, capped at the balance. No threshold.
    double end_of_period_sweep(double savings, double balance) const;

    // Rule 2: everything above the floor if it reaches the threshold, capped at
    // the balance
    double variable_rate_sweep(double savings, double balance) const;

    // Rule 3: min(spare cash, allowance remaining, balance), only when the
    // year's allowance is unused and spare cash reaches the threshold
    double annual_allowance(double savings, double balance,
                            double allowance_remaining, bool allowance_used) const;

    // Allowance for a year starting with the given balance
    static double annual_allowance_for(double year_start_balance) {
        return ANNUAL_ALLOWANCE_FRACTION * year_start_balance;
    }

    double emergency_floor() const { return emergency_floor_; }
    double min_threshold() const { return min_threshold_; }

private:
    double emergency_floor_;
    double min_threshold_;
};

} // namespace overpay

#endif // OVERPAY_OVERPAYMENT_POLICY_HPP
