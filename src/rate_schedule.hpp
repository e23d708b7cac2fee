#ifndef OVERPAY_RATE_SCHEDULE_HPP
#define OVERPAY_RATE_SCHEDULE_HPP

#include "config.hpp"
#include <vector>

namespace overpay {

// Fixed-rate period covering months [start_month, end_month)
struct FixedRatePeriod {
    int start_month;        // Inclusive
    int end_month;          // Exclusive
    double annual_rate;

    FixedRatePeriod();
    FixedRatePeriod(int start, int end, double rate);

    bool contains(int month) const { return month >= start_month && month < end_month; }
    int length() const { return end_month - start_month; }
};

// RateSchedule: resolves the annual mortgage rate applicable in a given month.
// Fixed periods are contiguous from month 0; after the last one the variable
// rate applies. The table is small (a handful of deals) so lookup is a linear
// scan in declared order.
class RateSchedule {
public:
    // Throws InvalidConfiguration if periods are not contiguous from month 0,
    // are empty, or carry a rate outside [0, 1)
    RateSchedule(std::vector<FixedRatePeriod> periods, double variable_rate);

    // Derive periods by cumulatively summing the declared durations
    static RateSchedule from_config(const SimulationConfig& config);

    // Annual rate applicable in month (0-based)
    double rate_at(int month) const;

    // rate_at(month) / 12
    double monthly_rate_at(int month) const;

    // Rate charged in month 0 (first fixed rate, or variable if none)
    double initial_rate() const;

    // Index of the fixed period whose end boundary equals month, or -1
    int period_ending_at(int month) const;

    // End month of the last fixed period (0 when there are none)
    int fixed_end() const;

    bool has_fixed_periods() const { return !periods_.empty(); }
    const std::vector<FixedRatePeriod>& periods() const { return periods_; }
    double variable_rate() const { return variable_rate_; }

private:
    std::vector<FixedRatePeriod> periods_;
    double variable_rate_;
};

} // namespace overpay

#endif // OVERPAY_RATE_SCHEDULE_HPP
