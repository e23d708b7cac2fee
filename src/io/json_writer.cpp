#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace overpay {
namespace io {

namespace {

struct Layout {
    bool pretty;

    std::string pad(int level) const { return pretty ? std::string(2 * level, ' ') : ""; }
    const char* newline() const { return pretty ? "\n" : ""; }
    const char* space() const { return pretty ? " " : ""; }
};

std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

void write_summary(std::ostream& os, const SimulationSummary& summary, int term_months,
                   const Layout& f, int level) {
    const std::string in = f.pad(level + 1);
    const char* nl = f.newline();
    const char* sp = f.space();

    os << "{" << nl;
    os << in << "\"status\":" << sp << quoted(status_to_string(summary.status)) << "," << nl;
    os << in << "\"paid_off\":" << sp << (summary.paid_off() ? "true" : "false") << "," << nl;
    os << in << "\"months_to_payoff\":" << sp;
    if (summary.paid_off()) {
        os << summary.months_to_payoff;
    } else {
        os << "null";
    }
    os << "," << nl;
    os << in << "\"payoff\":" << sp << quoted(summary.payoff_description()) << "," << nl;
    os << in << "\"years_saved\":" << sp << summary.years_saved(term_months) << "," << nl;
    os << in << "\"total_interest_paid\":" << sp << summary.total_interest_paid << "," << nl;
    os << in << "\"baseline_interest\":" << sp << summary.baseline_interest << "," << nl;
    os << in << "\"interest_saved\":" << sp << summary.interest_saved << "," << nl;
    os << in << "\"final_savings\":" << sp << summary.final_savings << "," << nl;
    os << in << "\"total_overpayments\":" << sp << summary.total_overpayments << "," << nl;
    os << in << "\"final_balance\":" << sp << summary.final_balance << "," << nl;
    os << in << "\"deficit_months\":" << sp << summary.deficit_months << nl;
    os << f.pad(level) << "}";
}

void write_events(std::ostream& os, const std::vector<OverpaymentEvent>& events,
                  const Layout& f, int level) {
    const char* sp = f.space();

    os << "[";
    for (size_t i = 0; i < events.size(); ++i) {
        const OverpaymentEvent& e = events[i];
        os << (i > 0 ? "," : "") << f.newline() << f.pad(level + 1);
        os << "{\"month\":" << sp << e.month
           << "," << sp << "\"amount\":" << sp << e.amount
           << "," << sp << "\"rule\":" << sp << quoted(rule_to_string(e.rule))
           << "," << sp << "\"label\":" << sp << quoted(e.label()) << "}";
    }
    if (!events.empty()) {
        os << f.newline() << f.pad(level);
    }
    os << "]";
}

void write_schedule(std::ostream& os, const std::vector<MonthlyRecord>& records,
                    const Layout& f, int level) {
    const char* sp = f.space();

    os << "[";
    for (size_t i = 0; i < records.size(); ++i) {
        const MonthlyRecord& r = records[i];
        os << (i > 0 ? "," : "") << f.newline() << f.pad(level + 1);
        os << "{\"month\":" << sp << r.month
           << "," << sp << "\"mortgage_balance\":" << sp << r.mortgage_balance
           << "," << sp << "\"savings_balance\":" << sp << r.savings_balance
           << "," << sp << "\"cumulative_overpayments\":" << sp << r.cumulative_overpayments
           << "," << sp << "\"monthly_income\":" << sp << r.monthly_income
           << "," << sp << "\"monthly_expenses\":" << sp << r.monthly_expenses
           << "," << sp << "\"overpayment\":" << sp << r.overpayment
           << "," << sp << "\"available_cash\":" << sp << r.available_cash
           << "," << sp << "\"mortgage_payment\":" << sp << r.mortgage_payment
           << "," << sp << "\"interest\":" << sp << r.interest << "}";
    }
    if (!records.empty()) {
        os << f.newline() << f.pad(level);
    }
    os << "]";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  int term_months, bool include_schedule,
                                  bool pretty_print) {
    const Layout f{pretty_print};
    const char* nl = f.newline();
    const char* sp = f.space();
    const std::string in = f.pad(1);

    os << std::fixed << std::setprecision(6);

    os << "{" << nl;
    os << in << "\"summary\":" << sp;
    write_summary(os, result.summary, term_months, f, 1);
    os << "," << nl;

    os << in << "\"execution_time_ms\":" << sp << std::setprecision(2)
       << result.execution_time_ms << "," << nl;
    os << std::setprecision(6);

    os << in << "\"months_simulated\":" << sp << result.records.size() << "," << nl;

    os << in << "\"events\":" << sp;
    write_events(os, result.events, f, 1);

    if (include_schedule) {
        os << "," << nl << in << "\"schedule\":" << sp;
        write_schedule(os, result.records, f, 1);
    }
    os << nl << "}" << nl;
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  int term_months, bool include_schedule,
                                  bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_simulation_result_json(file, result, term_months, include_schedule, pretty_print);
}

void write_comparison_json(std::ostream& os, const ComparisonResult& result,
                           int term_months, bool pretty_print) {
    const Layout f{pretty_print};
    const char* nl = f.newline();
    const char* sp = f.space();
    const std::string in = f.pad(1);
    const std::string in2 = f.pad(2);

    os << std::fixed << std::setprecision(6);

    os << "{" << nl;
    os << in << "\"months_saved\":" << sp << result.months_saved() << "," << nl;
    os << in << "\"interest_difference\":" << sp << result.interest_difference() << "," << nl;

    const std::pair<const char*, const SimulationResult*> runs[] = {
        {"with_overpayments", &result.with_overpayments},
        {"without_overpayments", &result.without_overpayments},
    };
    for (size_t i = 0; i < 2; ++i) {
        os << in << "\"" << runs[i].first << "\":" << sp << "{" << nl;
        os << in2 << "\"summary\":" << sp;
        write_summary(os, runs[i].second->summary, term_months, f, 2);
        os << "," << nl << in2 << "\"events\":" << sp;
        write_events(os, runs[i].second->events, f, 2);
        os << nl << in << "}" << (i == 0 ? "," : "") << nl;
    }
    os << "}" << nl;
}

void write_comparison_json(const std::string& filepath, const ComparisonResult& result,
                           int term_months, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_comparison_json(file, result, term_months, pretty_print);
}

} // namespace io
} // namespace overpay
