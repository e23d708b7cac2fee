#ifndef OVERPAY_SIMULATION_HPP
#define OVERPAY_SIMULATION_HPP

#include "config.hpp"
#include "rate_schedule.hpp"
#include "overpayment_policy.hpp"
#include "savings.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace overpay {

// Raised when a policy transfer or payment breaks an arithmetic invariant
// (negative balance, negative savings, overpayment above the balance)
class SimulationInvariantError : public std::logic_error {
public:
    explicit SimulationInvariantError(const std::string& message)
        : std::logic_error(message) {}
};

enum class SimulationStatus : uint8_t {
    Running = 0,
    PaidOff = 1,            // Balance cleared at the top of a month
    HorizonExhausted = 2    // Horizon reached with a balance outstanding
};

std::string status_to_string(SimulationStatus status);

// Balances at or below this are treated as cleared
constexpr double BALANCE_TOLERANCE = 1e-6;

// Split of one regular instalment
struct InstalmentSplit {
    double interest;
    double principal;

    double total() const { return interest + principal; }
};

// Loop-owned mutable state. Mutated once per simulated month through the
// transition methods below and discarded when the result is produced.
struct SimulationState {
    double balance;                     // Outstanding mortgage balance (>= 0)
    double payment;                     // Current standard monthly payment
    double savings;
    double income;                      // Monthly income after growth to date
    double expenses;                    // Monthly expenses after growth to date
    double interest_paid;               // Cumulative
    double cumulative_overpayments;
    double allowance_remaining;         // Annual allowance left this year
    bool allowance_used;                // Annual overpayment already made this year
    int month;                          // Next month to simulate (0-based)
    int year;                           // Mortgage year of month (0-based)
    SimulationStatus status;

    SimulationState();

    // State at month 0: opening balance, first payment at the initial rate
    // amortized over the full term
    static SimulationState initial(const SimulationConfig& config, const RateSchedule& schedule);

    // Year boundary: reset allowance from the current balance, grow income
    // and expenses (except in year 0)
    void begin_year(const SimulationConfig& config);

    // Move amount from savings to principal. Throws SimulationInvariantError
    // if amount exceeds the balance or the savings.
    void apply_overpayment(double amount);

    // Re-amortize the balance over the remaining original term at annual_rate
    void recalculate_payment(double annual_rate, int term_months);

    // Charge a month's interest and repay principal from the standard payment.
    // The principal portion is capped at the balance so the final instalment
    // clears the loan exactly.
    InstalmentSplit apply_regular_payment(double monthly_rate);
};

// One row per simulated month
struct MonthlyRecord {
    int month;
    double mortgage_balance;            // After all payments this month
    double savings_balance;             // After accrual
    double cumulative_overpayments;
    double monthly_income;
    double monthly_expenses;
    double overpayment;                 // Total overpaid this month (all rules)
    double available_cash;              // income - expenses - mortgage_payment
    double mortgage_payment;            // Interest + principal of the regular instalment
    double interest;                    // Interest portion of mortgage_payment

    double years() const { return month / 12.0; }

    bool operator==(const MonthlyRecord& other) const;
};

struct SimulationSummary {
    SimulationStatus status;
    int months_to_payoff;               // -1 when not paid off
    double total_interest_paid;
    double baseline_interest;           // Full-term interest at the first rate, no overpayments
    double interest_saved;              // baseline_interest - total_interest_paid
    double final_savings;
    double total_overpayments;
    double final_balance;
    int deficit_months;                 // Months with negative available cash

    SimulationSummary();

    bool paid_off() const { return status == SimulationStatus::PaidOff; }

    // "12y 4m", or "Not paid off"
    std::string payoff_description() const;

    // Years ahead of the original term (0 when not paid off)
    double years_saved(int term_months) const;
};

struct SimulationResult {
    std::vector<MonthlyRecord> records;     // Chronological, one per month
    std::vector<OverpaymentEvent> events;   // Chronological
    SimulationSummary summary;
    double execution_time_ms;

    SimulationResult();
};

// Simulation: month-by-month loop over a validated configuration.
//
// Each month, in order:
//   1. Terminal check (paid off, or horizon reached)
//   2. Year boundary: allowance reset, income/expense growth
//   3. End-of-fixed-period sweep and payment recalculation
//   4. Otherwise, variable-rate threshold sweep
//   5. Regular payment at the month's rate
//   6. Annual allowance overpayment
//   7. Savings accrual
//   8. Record
//
// run() is const and keeps all state local, so one Simulation may be run
// from several threads.
class Simulation {
public:
    // Throws InvalidConfiguration
    explicit Simulation(const SimulationConfig& config);

    SimulationResult run() const;

    const SimulationConfig& config() const { return config_; }
    const RateSchedule& schedule() const { return schedule_; }
    const OverpaymentPolicy& policy() const { return policy_; }

private:
    SimulationConfig config_;
    RateSchedule schedule_;
    OverpaymentPolicy policy_;
    SavingsTerms savings_terms_;

    bool reached_terminal(SimulationState& state) const;
    double apply_fixed_period_end(SimulationState& state, int period_index,
                                  std::vector<OverpaymentEvent>& events) const;
    double apply_variable_sweep(SimulationState& state,
                                std::vector<OverpaymentEvent>& events) const;
    double apply_annual_allowance(SimulationState& state,
                                  std::vector<OverpaymentEvent>& events) const;
    SimulationSummary summarize(const SimulationState& state, int deficit_months) const;
};

// Convenience wrapper: validate, run, return the result
SimulationResult run_simulation(const SimulationConfig& config);

} // namespace overpay

#endif // OVERPAY_SIMULATION_HPP
