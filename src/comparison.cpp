#include "comparison.hpp"
#include <chrono>
#include <exception>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace overpay {

ComparisonResult::ComparisonResult() : horizon_months(0), execution_time_ms(0.0) {}

namespace {

int effective_payoff_month(const SimulationResult& result, int horizon_months) {
    return result.summary.paid_off() ? result.summary.months_to_payoff : horizon_months;
}

} // anonymous namespace

int ComparisonResult::months_saved() const {
    return effective_payoff_month(without_overpayments, horizon_months) -
           effective_payoff_month(with_overpayments, horizon_months);
}

double ComparisonResult::interest_difference() const {
    return without_overpayments.summary.total_interest_paid -
           with_overpayments.summary.total_interest_paid;
}

ComparisonResult compare_with_baseline(const SimulationConfig& config) {
    auto start_time = std::chrono::high_resolution_clock::now();

    SimulationConfig enabled = config;
    enabled.overpayments_enabled = true;
    SimulationConfig disabled = config;
    disabled.overpayments_enabled = false;

    // Validate up front so a bad config throws from the calling thread
    Simulation with_sim(enabled);
    Simulation without_sim(disabled);

    ComparisonResult result;
    result.horizon_months = config.horizon_months;

#ifdef HAVE_OPENMP
    // Exceptions must not escape an OpenMP structured block
    std::exception_ptr errors[2] = {nullptr, nullptr};

    #pragma omp parallel sections num_threads(2)
    {
        #pragma omp section
        {
            try {
                result.with_overpayments = with_sim.run();
            } catch (...) {
                errors[0] = std::current_exception();
            }
        }
        #pragma omp section
        {
            try {
                result.without_overpayments = without_sim.run();
            } catch (...) {
                errors[1] = std::current_exception();
            }
        }
    }

    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
#else
    result.with_overpayments = with_sim.run();
    result.without_overpayments = without_sim.run();
#endif

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

} // namespace overpay
