#include "csv_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace overpay {
namespace io {

void write_schedule_csv(std::ostream& os, const SimulationResult& result) {
    os << "Month,Year,Mortgage Balance,Savings Balance,Total Overpayments,"
          "Monthly Income,Monthly Expenses,Overpayment,Available Cash,Mortgage Payment\n";

    for (const MonthlyRecord& r : result.records) {
        os << r.month << ","
           << std::fixed << std::setprecision(4) << r.years() << ","
           << std::setprecision(2)
           << r.mortgage_balance << ","
           << r.savings_balance << ","
           << r.cumulative_overpayments << ","
           << r.monthly_income << ","
           << r.monthly_expenses << ","
           << r.overpayment << ","
           << r.available_cash << ","
           << r.mortgage_payment << "\n";
    }
}

void write_schedule_csv(const std::string& filepath, const SimulationResult& result) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_schedule_csv(file, result);
}

void write_summary_csv(std::ostream& os, const SimulationResult& result,
                       const SimulationConfig& config) {
    const SimulationSummary& summary = result.summary;

    os << std::fixed << std::setprecision(2);
    os << "Metric,Value\n";
    os << "Original Mortgage," << config.initial_principal << "\n";
    os << "Mortgage Term (Months)," << config.term_months << "\n";
    os << "Months to Mortgage Free,";
    if (summary.paid_off()) {
        os << summary.months_to_payoff << "\n";
    } else {
        os << summary.payoff_description() << "\n";
    }
    os << "Total Interest Paid," << summary.total_interest_paid << "\n";
    os << "Interest Saved," << summary.interest_saved << "\n";
    os << "Total Overpayments," << summary.total_overpayments << "\n";
    os << "Final Savings Balance," << summary.final_savings << "\n";
}

void write_summary_csv(const std::string& filepath, const SimulationResult& result,
                       const SimulationConfig& config) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_summary_csv(file, result, config);
}

std::string summary_path_for(const std::string& schedule_path) {
    const std::string suffix = ".csv";
    if (schedule_path.size() > suffix.size() &&
        schedule_path.compare(schedule_path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return schedule_path.substr(0, schedule_path.size() - suffix.size()) + "_summary.csv";
    }
    return schedule_path + "_summary.csv";
}

} // namespace io
} // namespace overpay
