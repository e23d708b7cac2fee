#include "rate_schedule.hpp"
#include <string>
#include <utility>

namespace overpay {

// ============================================================================
// FixedRatePeriod Implementation
// ============================================================================

FixedRatePeriod::FixedRatePeriod() : start_month(0), end_month(0), annual_rate(0.0) {}

FixedRatePeriod::FixedRatePeriod(int start, int end, double rate)
    : start_month(start), end_month(end), annual_rate(rate) {}

// ============================================================================
// RateSchedule Implementation
// ============================================================================

RateSchedule::RateSchedule(std::vector<FixedRatePeriod> periods, double variable_rate)
    : periods_(std::move(periods)), variable_rate_(variable_rate) {
    if (variable_rate_ < 0.0 || variable_rate_ >= 1.0) {
        throw InvalidConfiguration("variable_rate", "rate must be in [0, 1)");
    }

    int expected_start = 0;
    for (size_t i = 0; i < periods_.size(); ++i) {
        const FixedRatePeriod& period = periods_[i];
        const std::string field = "fixed_periods[" + std::to_string(i) + "]";

        if (period.start_month != expected_start) {
            throw InvalidConfiguration(field, "starts at month " + std::to_string(period.start_month) +
                                              ", expected " + std::to_string(expected_start) +
                                              " (periods must be contiguous from month 0)");
        }
        if (period.end_month <= period.start_month) {
            throw InvalidConfiguration(field, "end month must be after start month");
        }
        if (period.annual_rate < 0.0 || period.annual_rate >= 1.0) {
            throw InvalidConfiguration(field, "rate must be in [0, 1)");
        }
        expected_start = period.end_month;
    }
}

RateSchedule RateSchedule::from_config(const SimulationConfig& config) {
    std::vector<FixedRatePeriod> periods;
    periods.reserve(config.fixed_terms.size());

    int start = 0;
    for (const FixedRateTerm& term : config.fixed_terms) {
        periods.emplace_back(start, start + term.months, term.annual_rate);
        start += term.months;
    }

    return RateSchedule(std::move(periods), config.variable_rate);
}

double RateSchedule::rate_at(int month) const {
    for (const FixedRatePeriod& period : periods_) {
        if (period.contains(month)) {
            return period.annual_rate;
        }
    }
    return variable_rate_;
}

double RateSchedule::monthly_rate_at(int month) const {
    return rate_at(month) / 12.0;
}

double RateSchedule::initial_rate() const {
    return periods_.empty() ? variable_rate_ : periods_.front().annual_rate;
}

int RateSchedule::period_ending_at(int month) const {
    for (size_t i = 0; i < periods_.size(); ++i) {
        if (periods_[i].end_month == month) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int RateSchedule::fixed_end() const {
    return periods_.empty() ? 0 : periods_.back().end_month;
}

} // namespace overpay
