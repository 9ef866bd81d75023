#ifndef RISKCALC_RISK_ADAPTER_HPP
#define RISKCALC_RISK_ADAPTER_HPP

#include "project_data.hpp"
#include "risk.hpp"
#include "simulation.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskcalc {

// Utilization above which an allocation counts as a conflict risk
constexpr double RESOURCE_CONFLICT_THRESHOLD = 0.85;

// ============================================================================
// Record -> Risk translation (pure)
// ============================================================================

// Risks derived from project records plus the records that were rejected
struct TranslationResult {
    std::vector<Risk> risks;
    std::vector<std::pair<std::string, std::string>> skipped;  // (record id, reason)
};

// Distribution heuristic:
//   triangular (default): min <- min_impact or 0, mode <- most_likely_impact or
//                         baseline_impact, max <- max_impact or 2 * mode
//   normal:               mean <- mean_impact or baseline_impact,
//                         std <- std_impact or 20% of |mean|
//   anything else:        triangular at 0.5x / 1x / 1.5x baseline_impact
// Throws ValidationError if the resulting parameters are invalid.
ProbabilityDistribution distribution_from_record(const RiskRecord& record);

// Records with impact_type cost or both, as cost risks
TranslationResult budget_risks_from_records(const std::vector<RiskRecord>& records);

// Records with impact_type schedule or both, as schedule risks
TranslationResult schedule_risks_from_records(const std::vector<RiskRecord>& records);

// Records with category resource, keeping their own impact type
TranslationResult resource_risks_from_records(const std::vector<RiskRecord>& records);

// ============================================================================
// Adapter
// ============================================================================

struct AnalysisOptions {
    int64_t iterations = static_cast<int64_t>(DEFAULT_ITERATIONS);
    double confidence_level = 0.95;
    std::optional<uint64_t> seed;
    size_t top_n = 10;
};

// Notification sent after every analysis
struct AnalysisEvent {
    std::string project_id;
    std::string analysis_type;
    bool simulated;                              // false on the degenerate path
    std::optional<std::string> simulation_id;
    size_t risk_count;
    size_t skipped_records;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record_analysis(const AnalysisEvent& event) = 0;
};

using SimulationRunner = std::function<SimulationResults(
    const std::vector<Risk>&, size_t, const CorrelationMatrix*, std::optional<uint64_t>)>;

// Derives risks from stored project data and shapes simulation output per
// analysis domain. When no record qualifies for a domain the engine is not
// invoked and a pass-through result with probability 1.0 is returned.
class ProjectRiskAdapter {
public:
    // Throws PreconditionError if options.iterations is below MIN_ITERATIONS
    // and ValidationError if options.confidence_level is outside (0, 1) or
    // options.top_n == 0. An empty runner means run_simulation.
    ProjectRiskAdapter(const ProjectRepository& repository,
                       AnalysisOptions options = AnalysisOptions(),
                       AuditSink* audit_sink = nullptr,
                       SimulationRunner runner = SimulationRunner());

    nlohmann::json analyze_budget_variance(const std::string& project_id) const;
    nlohmann::json analyze_schedule_variance(const std::string& project_id) const;
    nlohmann::json analyze_resource_risks(const std::string& project_id) const;

    // All three analyses over a single fetch, plus a summary
    nlohmann::json analyze_project(const std::string& project_id) const;

    const AnalysisOptions& options() const { return options_; }

private:
    const ProjectRepository& repository_;
    AnalysisOptions options_;
    AuditSink* audit_sink_;
    SimulationRunner runner_;

    nlohmann::json budget_analysis(const ProjectData& project) const;
    nlohmann::json schedule_analysis(const ProjectData& project) const;
    nlohmann::json resource_analysis(const ProjectData& project) const;

    SimulationResults simulate(const std::string& project_id, const std::string& analysis_type,
                               const std::vector<Risk>& risks) const;
    void report_skipped(const std::string& project_id, const std::string& analysis_type,
                        const TranslationResult& translation) const;
    void notify(const AnalysisEvent& event) const;
};

} // namespace riskcalc

#endif // RISKCALC_RISK_ADAPTER_HPP
