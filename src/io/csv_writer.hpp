#ifndef OVERPAY_IO_CSV_WRITER_HPP
#define OVERPAY_IO_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include "../config.hpp"
#include "../simulation.hpp"

namespace overpay {
namespace io {

// Monthly schedule, one row per MonthlyRecord:
// Month,Year,Mortgage Balance,Savings Balance,Total Overpayments,Monthly Income,
// Monthly Expenses,Overpayment,Available Cash,Mortgage Payment
void write_schedule_csv(std::ostream& os, const SimulationResult& result);
void write_schedule_csv(const std::string& filepath, const SimulationResult& result);

// Two-column Metric,Value summary of a run
void write_summary_csv(std::ostream& os, const SimulationResult& result,
                       const SimulationConfig& config);
void write_summary_csv(const std::string& filepath, const SimulationResult& result,
                       const SimulationConfig& config);

// Path of the summary file written beside a schedule: "out.csv" -> "out_summary.csv"
std::string summary_path_for(const std::string& schedule_path);

} // namespace io
} // namespace overpay

#endif // OVERPAY_IO_CSV_WRITER_HPP
