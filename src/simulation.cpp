#include "simulation.hpp"
#include "amortization.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace overpay {

std::string status_to_string(SimulationStatus status) {
    switch (status) {
        case SimulationStatus::Running: return "running";
        case SimulationStatus::PaidOff: return "paid_off";
        case SimulationStatus::HorizonExhausted: return "horizon_exhausted";
        default: return "unknown";
    }
}

// ============================================================================
// SimulationState Implementation
// ============================================================================

SimulationState::SimulationState()
    : balance(0.0),
      payment(0.0),
      savings(0.0),
      income(0.0),
      expenses(0.0),
      interest_paid(0.0),
      cumulative_overpayments(0.0),
      allowance_remaining(0.0),
      allowance_used(false),
      month(0),
      year(0),
      status(SimulationStatus::Running) {}

SimulationState SimulationState::initial(const SimulationConfig& config,
                                         const RateSchedule& schedule) {
    SimulationState state;
    state.balance = config.initial_principal;
    state.savings = config.initial_savings;
    state.income = config.monthly_income;
    state.expenses = config.monthly_expenses;
    state.payment = monthly_payment(schedule.initial_rate() / 12.0, config.term_months,
                                    config.initial_principal);
    return state;
}

void SimulationState::begin_year(const SimulationConfig& config) {
    year = month / 12;
    allowance_remaining = OverpaymentPolicy::annual_allowance_for(balance);
    allowance_used = false;

    if (month > 0) {
        income *= (1.0 + config.income_growth_rate);
        expenses *= (1.0 + config.expense_growth_rate);
    }
}

void SimulationState::apply_overpayment(double amount) {
    if (!(amount > 0.0)) {
        throw SimulationInvariantError("Overpayment amount must be positive at month " +
                                       std::to_string(month));
    }
    if (amount > balance) {
        throw SimulationInvariantError("Overpayment of " + std::to_string(amount) +
                                       " exceeds outstanding balance " + std::to_string(balance) +
                                       " at month " + std::to_string(month));
    }
    if (amount > savings) {
        throw SimulationInvariantError("Overpayment of " + std::to_string(amount) +
                                       " exceeds savings " + std::to_string(savings) +
                                       " at month " + std::to_string(month));
    }

    balance -= amount;
    savings -= amount;
    cumulative_overpayments += amount;

    if (balance < BALANCE_TOLERANCE) {
        balance = 0.0;
    }
}

void SimulationState::recalculate_payment(double annual_rate, int term_months) {
    // A fixed deal running past the original term leaves one month to clear
    int remaining = std::max(1, term_months - month);
    payment = monthly_payment(annual_rate / 12.0, remaining, balance);
}

InstalmentSplit SimulationState::apply_regular_payment(double monthly_rate) {
    InstalmentSplit split;
    split.interest = balance * monthly_rate;
    split.principal = std::min(payment - split.interest, balance);

    balance -= split.principal;
    interest_paid += split.interest;

    if (balance < BALANCE_TOLERANCE) {
        balance = 0.0;
    }
    return split;
}

// ============================================================================
// MonthlyRecord / Summary / Result
// ============================================================================

bool MonthlyRecord::operator==(const MonthlyRecord& other) const {
    return month == other.month &&
           mortgage_balance == other.mortgage_balance &&
           savings_balance == other.savings_balance &&
           cumulative_overpayments == other.cumulative_overpayments &&
           monthly_income == other.monthly_income &&
           monthly_expenses == other.monthly_expenses &&
           overpayment == other.overpayment &&
           available_cash == other.available_cash &&
           mortgage_payment == other.mortgage_payment &&
           interest == other.interest;
}

SimulationSummary::SimulationSummary()
    : status(SimulationStatus::Running),
      months_to_payoff(-1),
      total_interest_paid(0.0),
      baseline_interest(0.0),
      interest_saved(0.0),
      final_savings(0.0),
      total_overpayments(0.0),
      final_balance(0.0),
      deficit_months(0) {}

std::string SimulationSummary::payoff_description() const {
    if (!paid_off()) {
        return "Not paid off";
    }
    std::ostringstream oss;
    oss << (months_to_payoff / 12) << "y " << (months_to_payoff % 12) << "m";
    return oss.str();
}

double SimulationSummary::years_saved(int term_months) const {
    if (!paid_off()) {
        return 0.0;
    }
    return (term_months - months_to_payoff) / 12.0;
}

SimulationResult::SimulationResult() : execution_time_ms(0.0) {}

// ============================================================================
// Simulation Implementation
// ============================================================================

namespace {

const SimulationConfig& validated(const SimulationConfig& config) {
    validate_config(config);
    return config;
}

} // anonymous namespace

Simulation::Simulation(const SimulationConfig& config)
    : config_(validated(config)),
      schedule_(RateSchedule::from_config(config_)),
      policy_(config_.emergency_floor, config_.min_overpayment_threshold),
      savings_terms_(config_.savings_rate, config_.savings_tax_rate) {}

bool Simulation::reached_terminal(SimulationState& state) const {
    if (state.balance <= BALANCE_TOLERANCE) {
        state.balance = 0.0;
        state.payment = 0.0;
        state.status = SimulationStatus::PaidOff;
        return true;
    }
    if (state.month >= config_.horizon_months) {
        state.status = SimulationStatus::HorizonExhausted;
        return true;
    }
    return false;
}

double Simulation::apply_fixed_period_end(SimulationState& state, int period_index,
                                          std::vector<OverpaymentEvent>& events) const {
    double amount = 0.0;

    if (config_.overpayments_enabled) {
        amount = policy_.end_of_period_sweep(state.savings, state.balance);
        if (amount > 0.0) {
            state.apply_overpayment(amount);
            events.emplace_back(state.month, amount, OverpaymentRule::EndOfFixedPeriod,
                                period_index + 1);
            // The annual rule may fire again in the same month
            state.allowance_used = false;
        }
    }

    // New rate regime starts this month
    if (state.balance > 0.0) {
        state.recalculate_payment(schedule_.rate_at(state.month), config_.term_months);
    }
    return amount;
}

double Simulation::apply_variable_sweep(SimulationState& state,
                                        std::vector<OverpaymentEvent>& events) const {
    if (!config_.overpayments_enabled || !schedule_.has_fixed_periods() ||
        state.month <= schedule_.fixed_end()) {
        return 0.0;
    }

    double amount = policy_.variable_rate_sweep(state.savings, state.balance);
    if (amount > 0.0) {
        state.apply_overpayment(amount);
        events.emplace_back(state.month, amount, OverpaymentRule::VariableRateSweep);
    }
    return amount;
}

double Simulation::apply_annual_allowance(SimulationState& state,
                                          std::vector<OverpaymentEvent>& events) const {
    if (!config_.overpayments_enabled) {
        return 0.0;
    }

    double amount = policy_.annual_allowance(state.savings, state.balance,
                                             state.allowance_remaining, state.allowance_used);
    if (amount > 0.0) {
        state.apply_overpayment(amount);
        state.allowance_remaining -= amount;
        state.allowance_used = true;
        events.emplace_back(state.month, amount, OverpaymentRule::AnnualAllowance,
                            state.year + 1);
    }
    return amount;
}

SimulationSummary Simulation::summarize(const SimulationState& state, int deficit_months) const {
    SimulationSummary summary;
    summary.status = state.status;
    summary.months_to_payoff = state.status == SimulationStatus::PaidOff ? state.month : -1;
    summary.total_interest_paid = state.interest_paid;
    summary.baseline_interest = full_term_interest(schedule_.initial_rate(), config_.term_months,
                                                   config_.initial_principal);
    summary.interest_saved = summary.baseline_interest - state.interest_paid;
    summary.final_savings = state.savings;
    summary.total_overpayments = state.cumulative_overpayments;
    summary.final_balance = state.balance;
    summary.deficit_months = deficit_months;
    return summary;
}

SimulationResult Simulation::run() const {
    auto start_time = std::chrono::high_resolution_clock::now();

    SimulationResult result;
    // Payoff never takes longer than the term plus one month
    int expected_months = config_.term_months < config_.horizon_months
        ? config_.term_months + 1
        : config_.horizon_months;
    result.records.reserve(static_cast<size_t>(expected_months));

    SimulationState state = SimulationState::initial(config_, schedule_);
    int deficit_months = 0;

    while (!reached_terminal(state)) {
        double overpaid = 0.0;

        if (state.month % 12 == 0) {
            state.begin_year(config_);
        }

        int period_index = schedule_.period_ending_at(state.month);
        if (period_index >= 0) {
            overpaid += apply_fixed_period_end(state, period_index, result.events);
        } else {
            overpaid += apply_variable_sweep(state, result.events);
        }

        InstalmentSplit instalment = state.apply_regular_payment(schedule_.monthly_rate_at(state.month));

        overpaid += apply_annual_allowance(state, result.events);

        double available_cash = state.income - state.expenses - instalment.total();
        if (available_cash < 0.0) {
            ++deficit_months;
        }
        state.savings = apply_savings_accrual(state.savings, available_cash, savings_terms_).balance;

        MonthlyRecord record;
        record.month = state.month;
        record.mortgage_balance = state.balance;
        record.savings_balance = state.savings;
        record.cumulative_overpayments = state.cumulative_overpayments;
        record.monthly_income = state.income;
        record.monthly_expenses = state.expenses;
        record.overpayment = overpaid;
        record.available_cash = available_cash;
        record.mortgage_payment = instalment.total();
        record.interest = instalment.interest;
        result.records.push_back(record);

        ++state.month;
    }

    result.summary = summarize(state, deficit_months);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

SimulationResult run_simulation(const SimulationConfig& config) {
    Simulation simulation(config);
    return simulation.run();
}

} // namespace overpay
