/**
 * @file logger.hpp
 * @brief Structured event log for risk analyses
 *
 * One line per event, either a JSON object or a human readable line. Every
 * event carries its name, the project and analysis it belongs to, a UTC
 * timestamp and a severity. Simulation events add run metadata (seed,
 * iteration count, wall clock, convergence).
 *
 * The engine never logs. The CLI and the project adapter report what the
 * engine did through this logger.
 */

#ifndef RISKCALC_LOGGER_HPP
#define RISKCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace riskcalc {

class SimulationResults;

/**
 * @brief Event severity, ordered
 */
enum class LogLevel {
    DEBUG,
    INFO,    ///< Analysis lifecycle and simulation summaries
    WARN,    ///< Skipped records, degenerate analyses, projected correlation matrices
    ERROR    ///< Failed analyses
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

/**
 * @brief Level by name; unrecognised names mean INFO
 */
inline LogLevel string_to_level(const std::string& name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Which analysis an event belongs to
 */
struct AnalysisContext {
    std::string project_id;          ///< Empty for raw risk-set runs
    std::string analysis_type;       ///< budget, schedule, resource, all or risks

    AnalysisContext() = default;

    AnalysisContext(const std::string& project, const std::string& type)
        : project_id(project), analysis_type(type) {}
};

/**
 * @brief Sinks and threshold
 */
struct LoggerConfig {
    LogLevel min_level = LogLevel::INFO;
    bool enable_console = true;              ///< Write to stderr
    bool enable_file = false;                ///< Append to log_file_path
    std::string log_file_path = "riskcalc.log";
    bool enable_json = true;                 ///< JSON lines; plain text otherwise
};

/**
 * @brief Process-wide event logger
 *
 * Safe to call from concurrent analyses; each event is written as one line.
 *
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::WARN;
 *   Logger::get_instance().configure(config);
 *
 *   AnalysisContext ctx("PRJ-001", "budget");
 *   Logger::get_instance().log_record_skipped(ctx, "R-7", "triangular requires min <= mode");
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration and reopen the file sink
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief analysis_start (INFO)
     *
     * @param iterations Requested iteration count
     */
    void log_analysis_start(const AnalysisContext& ctx, size_t iterations);

    /**
     * @brief analysis_complete (INFO)
     */
    void log_analysis_complete(
        const AnalysisContext& ctx,
        size_t risk_count,
        const std::string& simulation_id
    );

    /**
     * @brief analysis_degenerate (WARN): no qualifying risks, engine not run
     *
     * @param note Explanation also returned to the caller
     */
    void log_analysis_degenerate(const AnalysisContext& ctx, const std::string& note);

    /**
     * @brief simulation_complete (INFO) with run metadata and throughput
     */
    void log_simulation_complete(const AnalysisContext& ctx, const SimulationResults& results);

    /**
     * @brief correlation_adjusted (WARN): the matrix was projected to the nearest PSD matrix
     */
    void log_correlation_adjusted(const AnalysisContext& ctx, const std::string& simulation_id);

    /**
     * @brief record_skipped (WARN): a project record could not become a risk
     *
     * @param reason Validation failure text
     */
    void log_record_skipped(
        const AnalysisContext& ctx,
        const std::string& record_id,
        const std::string& reason
    );

    void log_error(const AnalysisContext& ctx, const std::string& error_message);
    void log_warning(const AnalysisContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    using Fields = std::map<std::string, std::string>;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;           ///< Guards config_, file_ and the sinks
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_;

    Fields event_fields(const AnalysisContext& ctx, const std::string& event) const;
    void emit(LogLevel level, const std::string& message, Fields fields);
    std::string render_json(const Fields& fields) const;
    std::string render_text(LogLevel level, const std::string& message, const Fields& fields) const;
    void write_line(const std::string& line);   // caller holds mutex_
};

/**
 * @brief Current UTC time as ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
 */
std::string utc_timestamp();

} // namespace riskcalc

#endif // RISKCALC_LOGGER_HPP
