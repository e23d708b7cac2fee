/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace overpay {

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_simulation_start(const RunContext& ctx, const SimulationConfig& config) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_start";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["principal"] = format_amount(config.initial_principal);
    fields["term_months"] = std::to_string(config.term_months);
    fields["fixed_periods"] = std::to_string(config.fixed_terms.size());
    fields["variable_rate"] = std::to_string(config.variable_rate);
    fields["initial_savings"] = format_amount(config.initial_savings);
    fields["emergency_floor"] = format_amount(config.emergency_floor);
    fields["min_threshold"] = format_amount(config.min_overpayment_threshold);
    fields["horizon_months"] = std::to_string(config.horizon_months);
    fields["overpayments_enabled"] = config.overpayments_enabled ? "true" : "false";

    log(LogLevel::INFO, "Starting simulation", fields);
}

void Logger::log_overpayment(const RunContext& ctx, const OverpaymentEvent& event) {
    std::map<std::string, std::string> fields;
    fields["event"] = "overpayment";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["month"] = std::to_string(event.month);
    fields["amount"] = format_amount(event.amount);
    fields["rule"] = rule_to_string(event.rule);
    fields["label"] = event.label();

    log(LogLevel::DEBUG, "Overpayment applied", fields);
}

void Logger::log_simulation_complete(const RunContext& ctx, const SimulationResult& result) {
    for (const OverpaymentEvent& event : result.events) {
        log_overpayment(ctx, event);
    }

    const SimulationSummary& summary = result.summary;

    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["status"] = status_to_string(summary.status);
    fields["months_simulated"] = std::to_string(result.records.size());
    fields["payoff"] = summary.payoff_description();
    fields["total_interest_paid"] = format_amount(summary.total_interest_paid);
    fields["interest_saved"] = format_amount(summary.interest_saved);
    fields["total_overpayments"] = format_amount(summary.total_overpayments);
    fields["overpayment_events"] = std::to_string(result.events.size());
    fields["final_savings"] = format_amount(summary.final_savings);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);

    log(LogLevel::INFO, "Simulation completed", fields);

    if (summary.deficit_months > 0) {
        log_warning(ctx, std::to_string(summary.deficit_months) +
                         " month(s) with negative available cash; deficits are not drawn from savings");
    }
}

void Logger::log_comparison_complete(const RunContext& ctx, const ComparisonResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_complete";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["payoff_with_overpayments"] = result.with_overpayments.summary.payoff_description();
    fields["payoff_without_overpayments"] = result.without_overpayments.summary.payoff_description();
    fields["months_saved"] = std::to_string(result.months_saved());
    fields["interest_difference"] = format_amount(result.interest_difference());
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);

    log(LogLevel::INFO, "Baseline comparison completed", fields);
}

void Logger::log_config_error(const RunContext& ctx, const std::string& field,
                              const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_error";
    fields["run_id"] = ctx.run_id;
    fields["field"] = field;
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Invalid configuration", fields);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Simulation error", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["run_id"] = ctx.run_id;
    fields["scenario"] = ctx.scenario;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace overpay
