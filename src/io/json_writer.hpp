#ifndef OVERPAY_IO_JSON_WRITER_HPP
#define OVERPAY_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../simulation.hpp"
#include "../comparison.hpp"

namespace overpay {
namespace io {

// Write a SimulationResult as JSON: summary, overpayment events and, when
// include_schedule is set, the monthly schedule
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  int term_months, bool include_schedule = true,
                                  bool pretty_print = true);

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  int term_months, bool include_schedule = true,
                                  bool pretty_print = true);

// Write both runs of a comparison (summaries and events only) and the deltas
void write_comparison_json(std::ostream& os, const ComparisonResult& result,
                           int term_months, bool pretty_print = true);

void write_comparison_json(const std::string& filepath, const ComparisonResult& result,
                           int term_months, bool pretty_print = true);

} // namespace io
} // namespace overpay

#endif // OVERPAY_IO_JSON_WRITER_HPP
