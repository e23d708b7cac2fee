/**
 * @file logger.hpp
 * @brief Structured logging for simulation runs with JSON output
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Run context (run id, scenario label)
 * - Console (stderr) and file sinks
 *
 * The simulation core does no I/O; runners (CLI, comparison) report through
 * this logger before and after each run.
 */

#ifndef OVERPAY_LOGGER_HPP
#define OVERPAY_LOGGER_HPP

#include "config.hpp"
#include "overpayment_policy.hpp"
#include "simulation.hpp"
#include "comparison.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace overpay {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-event detail (individual overpayments)
    INFO,    ///< Run start/end
    WARN,    ///< Non-fatal issues (deficit months)
    ERROR    ///< Failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the run a log line belongs to
 */
struct RunContext {
    std::string run_id;              ///< Caller-chosen identifier
    std::string scenario;            ///< "overpayment", "baseline", ...

    RunContext() : run_id(""), scenario("") {}

    RunContext(const std::string& id, const std::string& label)
        : run_id(id), scenario(label) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("overpay.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger singleton
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   RunContext ctx("cli", "overpayment");
 *   logger.log_simulation_start(ctx, sim_config);
 *   SimulationResult result = run_simulation(sim_config);
 *   logger.log_simulation_complete(ctx, result);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Apply new settings, opening the log file if enabled
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the key inputs of a run before it starts
     */
    void log_simulation_start(const RunContext& ctx, const SimulationConfig& config);

    /**
     * @brief Log one overpayment event (DEBUG)
     */
    void log_overpayment(const RunContext& ctx, const OverpaymentEvent& event);

    /**
     * @brief Log the summary of a finished run, its events at DEBUG, and a
     *        warning when any month ran a cash deficit
     */
    void log_simulation_complete(const RunContext& ctx, const SimulationResult& result);

    /**
     * @brief Log the outcome of a baseline comparison
     */
    void log_comparison_complete(const RunContext& ctx, const ComparisonResult& result);

    /**
     * @brief Log a rejected configuration
     *
     * @param field Name of the offending field
     * @param message Validation message
     */
    void log_config_error(const RunContext& ctx, const std::string& field,
                          const std::string& message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace overpay

#endif // OVERPAY_LOGGER_HPP
