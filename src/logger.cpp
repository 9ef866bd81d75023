#include "logger.hpp"
#include "simulation.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace riskcalc {

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// ============================================================================
// Configuration
// ============================================================================

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::out | std::ios::app);
    if (!*file_) {
        std::cerr << "Warning: cannot open log file " << config_.log_file_path
                  << ", file logging disabled" << std::endl;
        file_.reset();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_) {
        file_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

// ============================================================================
// Events
// ============================================================================

Logger::Fields Logger::event_fields(const AnalysisContext& ctx, const std::string& event) const {
    Fields fields{{"event", event}};
    if (!ctx.project_id.empty()) fields["project_id"] = ctx.project_id;
    if (!ctx.analysis_type.empty()) fields["analysis_type"] = ctx.analysis_type;
    return fields;
}

void Logger::log_analysis_start(const AnalysisContext& ctx, size_t iterations) {
    Fields fields = event_fields(ctx, "analysis_start");
    fields["iterations"] = std::to_string(iterations);
    emit(LogLevel::INFO, "Starting analysis", std::move(fields));
}

void Logger::log_analysis_complete(
    const AnalysisContext& ctx,
    size_t risk_count,
    const std::string& simulation_id
) {
    Fields fields = event_fields(ctx, "analysis_complete");
    fields["risk_count"] = std::to_string(risk_count);
    fields["simulation_id"] = simulation_id;
    emit(LogLevel::INFO, "Analysis completed", std::move(fields));
}

void Logger::log_analysis_degenerate(const AnalysisContext& ctx, const std::string& note) {
    Fields fields = event_fields(ctx, "analysis_degenerate");
    fields["note"] = note;
    emit(LogLevel::WARN, note, std::move(fields));
}

void Logger::log_simulation_complete(const AnalysisContext& ctx, const SimulationResults& results) {
    double seconds = results.execution_time();

    Fields fields = event_fields(ctx, "simulation_complete");
    fields["simulation_id"] = results.simulation_id();
    fields["iterations"] = std::to_string(results.iteration_count());
    fields["risk_count"] = std::to_string(results.risk_contributions().size());
    fields["execution_time_ms"] = std::to_string(seconds * 1000.0);
    fields["seed"] = std::to_string(results.seed());
    fields["converged"] = results.convergence().converged ? "true" : "false";
    fields["correlation_adjusted"] = results.correlation_adjusted() ? "true" : "false";
    fields["throughput_iterations_per_sec"] =
        std::to_string(seconds > 0.0 ? static_cast<double>(results.iteration_count()) / seconds : 0.0);

    emit(LogLevel::INFO, "Simulation completed", std::move(fields));
}

void Logger::log_correlation_adjusted(const AnalysisContext& ctx, const std::string& simulation_id) {
    Fields fields = event_fields(ctx, "correlation_adjusted");
    fields["simulation_id"] = simulation_id;
    emit(LogLevel::WARN, "Correlation matrix was not positive semi-definite; projected to nearest PSD matrix",
         std::move(fields));
}

void Logger::log_record_skipped(
    const AnalysisContext& ctx,
    const std::string& record_id,
    const std::string& reason
) {
    Fields fields = event_fields(ctx, "record_skipped");
    fields["record_id"] = record_id;
    fields["reason"] = reason;
    emit(LogLevel::WARN, "Skipping record " + record_id + ": " + reason, std::move(fields));
}

void Logger::log_error(const AnalysisContext& ctx, const std::string& error_message) {
    Fields fields = event_fields(ctx, "error");
    fields["error_message"] = error_message;
    emit(LogLevel::ERROR, "Analysis failed", std::move(fields));
}

void Logger::log_warning(const AnalysisContext& ctx, const std::string& warning_message) {
    Fields fields = event_fields(ctx, "warning");
    fields["warning"] = warning_message;
    emit(LogLevel::WARN, warning_message, std::move(fields));
}

// ============================================================================
// Output
// ============================================================================

void Logger::emit(LogLevel level, const std::string& message, Fields fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    if (config_.enable_json) {
        fields["timestamp"] = utc_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        write_line(render_json(fields));
    } else {
        write_line(render_text(level, message, fields));
    }
}

std::string Logger::render_json(const Fields& fields) const {
    // Invalid UTF-8 in record ids or messages is replaced rather than thrown
    return nlohmann::json(fields).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::render_text(LogLevel level, const std::string& message, const Fields& fields) const {
    std::ostringstream oss;
    oss << utc_timestamp() << ' ' << std::left << std::setw(5) << level_to_string(level) << ' ' << message;

    const char* separator = " (";
    for (const auto& field : fields) {
        if (field.first == "event") continue;
        oss << separator << field.first << '=' << field.second;
        separator = " ";
    }
    if (fields.size() > 1) {
        oss << ')';
    }
    return oss.str();
}

void Logger::write_line(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (config_.enable_file && file_) {
        *file_ << line << '\n';
    }
}

} // namespace riskcalc
