#include "risk_adapter.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "results_analyzer.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace riskcalc {

// ============================================================================
// Record -> Risk translation
// ============================================================================

ProbabilityDistribution distribution_from_record(const RiskRecord& record) {
    const std::string& type = record.distribution_type;

    if (type.empty() || type == "triangular") {
        double min_val = record.min_impact.value_or(0.0);
        double mode_val = record.most_likely_impact.value_or(record.baseline_impact);
        double max_val = record.max_impact.value_or(mode_val * 2.0);
        return ProbabilityDistribution::triangular(min_val, mode_val, max_val);
    }

    if (type == "normal") {
        double mean = record.mean_impact.value_or(record.baseline_impact);
        double std_dev = record.std_impact.value_or(std::fabs(mean) * 0.2);
        return ProbabilityDistribution::normal(mean, std_dev);
    }

    double baseline = record.baseline_impact;
    return ProbabilityDistribution::triangular(baseline * 0.5, baseline, baseline * 1.5);
}

namespace {

enum class Dimension { Budget, Schedule, Resource };

bool qualifies(const RiskRecord& record, Dimension dimension) {
    switch (dimension) {
        case Dimension::Budget:
            return record.impact_type == "cost" || record.impact_type == "both";
        case Dimension::Schedule:
            return record.impact_type == "schedule" || record.impact_type == "both";
        case Dimension::Resource:
            return record.category == "resource";
    }
    return false;
}

// Stored category labels are free text; unrecognised ones keep the dimension's category
RiskCategory record_category(const std::string& label, RiskCategory fallback) {
    if (label.empty()) {
        return fallback;
    }
    try {
        return parse_risk_category(label);
    } catch (const ValidationError&) {
        return fallback;
    }
}

TranslationResult translate(const std::vector<RiskRecord>& records, Dimension dimension) {
    TranslationResult result;
    std::set<std::string> seen;

    for (const auto& record : records) {
        if (!qualifies(record, dimension)) {
            continue;
        }

        std::string id = record.id.empty() ? "risk_" + std::to_string(result.risks.size()) : record.id;
        std::string name = record.name.empty() ? "Unnamed Risk" : record.name;

        if (seen.count(id) > 0) {
            result.skipped.emplace_back(id, "duplicate risk id");
            continue;
        }

        try {
            ProbabilityDistribution distribution = distribution_from_record(record);

            RiskCategory category;
            ImpactType impact_type;
            double baseline;
            switch (dimension) {
                case Dimension::Budget:
                    category = record_category(record.category, RiskCategory::Cost);
                    impact_type = ImpactType::Cost;
                    baseline = record.cost_impact.value_or(record.baseline_impact);
                    break;
                case Dimension::Schedule:
                    category = record_category(record.category, RiskCategory::Schedule);
                    impact_type = ImpactType::Schedule;
                    baseline = record.schedule_impact.value_or(record.baseline_impact);
                    break;
                case Dimension::Resource:
                default:
                    category = RiskCategory::Resource;
                    impact_type = parse_impact_type(record.impact_type.empty() ? "both" : record.impact_type);
                    baseline = record.resource_impact.value_or(record.baseline_impact);
                    break;
            }

            result.risks.emplace_back(id, name, category, impact_type, std::move(distribution), baseline);
            seen.insert(id);
        } catch (const ValidationError& e) {
            result.skipped.emplace_back(id, e.what());
        }
    }

    return result;
}

// ============================================================================
// Output shaping
// ============================================================================

double share_at_or_below(const std::vector<double>& values, double threshold) {
    if (values.empty()) {
        return 1.0;
    }
    auto count = std::count_if(values.begin(), values.end(),
                               [threshold](double v) { return v <= threshold; });
    return static_cast<double>(count) / static_cast<double>(values.size());
}

json percentiles_to_json(const std::vector<double>& outcomes) {
    PercentileAnalysis analysis = calculate_percentiles(outcomes);
    json j;
    for (int p : {10, 25, 50, 75, 90, 95}) {
        j["p" + std::to_string(p)] = analysis.at(p);
    }
    j["mean"] = analysis.mean;
    j["std"] = analysis.std_dev;
    return j;
}

json interval_to_json(const std::vector<double>& outcomes, OutcomeType outcome, double level) {
    ConfidenceIntervals intervals = generate_confidence_intervals(outcomes, outcome, {level});
    const ConfidenceInterval& interval = intervals.at(level);
    return json{
        {"confidence_level", level},
        {"lower_bound", interval.lower_bound},
        {"upper_bound", interval.upper_bound},
        {"mean", stats::mean(outcomes)}
    };
}

json contributions_to_json(const SimulationResults& results, size_t top_n) {
    json list = json::array();
    for (const auto& contribution : identify_top_risk_contributors(results, top_n)) {
        const auto& impacts = results.contribution(contribution.risk_id).impacts;
        auto range = std::minmax_element(impacts.begin(), impacts.end());
        list.push_back({
            {"risk_id", contribution.risk_id},
            {"risk_name", contribution.risk_name},
            {"mean_impact", contribution.mean_impact},
            {"variance", contribution.variance_contribution},
            {"std_dev", std::sqrt(contribution.variance_contribution)},
            {"contribution_percentage", contribution.contribution_percentage},
            {"min_impact", impacts.empty() ? 0.0 : *range.first},
            {"max_impact", impacts.empty() ? 0.0 : *range.second}
        });
    }
    return list;
}

json skipped_to_json(const TranslationResult& translation) {
    json list = json::array();
    for (const auto& entry : translation.skipped) {
        list.push_back({{"id", entry.first}, {"reason", entry.second}});
    }
    return list;
}

json critical_path_analysis(const ProjectData& project, const std::vector<double>& final_durations) {
    std::vector<const Milestone*> critical;
    for (const auto& milestone : project.milestones) {
        if (milestone.critical_path) {
            critical.push_back(&milestone);
        }
    }

    if (critical.empty()) {
        return json{
            {"critical_path_identified", false},
            {"critical_milestones", 0},
            {"delay_risk", 0.0}
        };
    }

    double mean_duration = stats::mean(final_durations);
    double delay_risk = project.baseline_duration > 0.0
        ? std::max(0.0, (mean_duration - project.baseline_duration) / project.baseline_duration)
        : 0.0;

    json details = json::array();
    for (const Milestone* milestone : critical) {
        details.push_back({
            {"id", milestone->id},
            {"name", milestone->name},
            {"baseline_duration", milestone->baseline_duration}
        });
    }

    return json{
        {"critical_path_identified", true},
        {"critical_milestones", critical.size()},
        {"delay_risk", delay_risk},
        {"milestone_details", details}
    };
}

std::string format_percent(double fraction) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << fraction * 100.0 << "%";
    return oss.str();
}

std::vector<std::string> resource_recommendations(double utilization_rate, double conflict_probability,
                                                  const json& high_risk_resources) {
    std::vector<std::string> recommendations;

    if (utilization_rate > 0.9) {
        recommendations.push_back(
            "High resource utilization detected (>90%). Consider adding buffer capacity or adjusting timeline.");
    }

    if (conflict_probability > 0.3) {
        recommendations.push_back(
            "Resource conflict risk is elevated (" + format_percent(conflict_probability) +
            "). Review resource allocation for " + std::to_string(high_risk_resources.size()) +
            " high-risk resources.");
    }

    if (!high_risk_resources.empty()) {
        std::string names;
        size_t shown = std::min<size_t>(3, high_risk_resources.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) names += ", ";
            names += high_risk_resources[i]["resource_name"].get<std::string>();
        }
        recommendations.push_back("Critical resources requiring attention: " + names);
    }

    if (recommendations.empty()) {
        recommendations.push_back("Resource allocation appears balanced. Continue monitoring utilization trends.");
    }
    return recommendations;
}

std::string probability_level(double probability) {
    if (probability > 0.7) return "low";
    if (probability > 0.5) return "medium";
    return "high";
}

std::string conflict_level(double conflict_probability) {
    if (conflict_probability < 0.3) return "low";
    if (conflict_probability < 0.6) return "medium";
    return "high";
}

int level_rank(const std::string& level) {
    if (level == "high") return 2;
    if (level == "medium") return 1;
    return 0;
}

std::string format_fixed(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << value;
    return oss.str();
}

json analysis_summary(const json& budget, const json& schedule, const json& resource) {
    double within_budget = budget.value("probability_within_budget", 0.0);
    double on_time = schedule.value("probability_on_time", 0.0);
    double conflict = 0.0;
    if (resource.contains("conflict_probability") && resource["conflict_probability"].is_object()) {
        conflict = resource["conflict_probability"].value("conflict_probability", 0.0);
    }

    std::string budget_level = probability_level(within_budget);
    std::string schedule_level = probability_level(on_time);
    std::string resource_level = conflict_level(conflict);

    std::string overall = budget_level;
    for (const std::string& level : {schedule_level, resource_level}) {
        if (level_rank(level) > level_rank(overall)) {
            overall = level;
        }
    }

    std::vector<std::string> insights;
    double budget_variance = budget.value("variance_percentage", 0.0);
    if (budget_variance > 10.0) {
        insights.push_back("Budget variance of " + format_fixed(budget_variance) + "% exceeds threshold");
    }
    double schedule_variance = schedule.value("variance_percentage", 0.0);
    if (schedule_variance > 10.0) {
        insights.push_back("Schedule variance of " + format_fixed(schedule_variance) + "% exceeds threshold");
    }
    if (conflict > 0.5) {
        insights.push_back("High probability of resource conflicts detected");
    }

    return json{
        {"overall_risk_level", overall},
        {"budget_risk_level", budget_level},
        {"schedule_risk_level", schedule_level},
        {"resource_risk_level", resource_level},
        {"key_insights", insights},
        {"probability_of_success", std::min(within_budget, on_time)}
    };
}

} // anonymous namespace

TranslationResult budget_risks_from_records(const std::vector<RiskRecord>& records) {
    return translate(records, Dimension::Budget);
}

TranslationResult schedule_risks_from_records(const std::vector<RiskRecord>& records) {
    return translate(records, Dimension::Schedule);
}

TranslationResult resource_risks_from_records(const std::vector<RiskRecord>& records) {
    return translate(records, Dimension::Resource);
}

// ============================================================================
// ProjectRiskAdapter
// ============================================================================

ProjectRiskAdapter::ProjectRiskAdapter(const ProjectRepository& repository,
                                       AnalysisOptions options,
                                       AuditSink* audit_sink,
                                       SimulationRunner runner)
    : repository_(repository),
      options_(std::move(options)),
      audit_sink_(audit_sink),
      runner_(std::move(runner)) {
    if (options_.iterations < static_cast<int64_t>(MIN_ITERATIONS)) {
        throw PreconditionError("Iteration count must be at least " + std::to_string(MIN_ITERATIONS) +
                                ", got " + std::to_string(options_.iterations));
    }
    if (!(options_.confidence_level > 0.0 && options_.confidence_level < 1.0)) {
        throw ValidationError("Confidence level must lie in (0, 1), got " +
                              std::to_string(options_.confidence_level));
    }
    if (options_.top_n == 0) {
        throw ValidationError("top_n must be positive");
    }
    if (!runner_) {
        runner_ = [](const std::vector<Risk>& risks, size_t iterations,
                     const CorrelationMatrix* correlations, std::optional<uint64_t> seed) {
            return run_simulation(risks, iterations, correlations, seed);
        };
    }
}

json ProjectRiskAdapter::analyze_budget_variance(const std::string& project_id) const {
    return budget_analysis(repository_.fetch_project(project_id));
}

json ProjectRiskAdapter::analyze_schedule_variance(const std::string& project_id) const {
    return schedule_analysis(repository_.fetch_project(project_id));
}

json ProjectRiskAdapter::analyze_resource_risks(const std::string& project_id) const {
    return resource_analysis(repository_.fetch_project(project_id));
}

json ProjectRiskAdapter::analyze_project(const std::string& project_id) const {
    ProjectData project = repository_.fetch_project(project_id);

    json budget = budget_analysis(project);
    json schedule = schedule_analysis(project);
    json resource = resource_analysis(project);
    json summary = analysis_summary(budget, schedule, resource);

    return json{
        {"project_id", project.project_id},
        {"project_name", project.name},
        {"budget_analysis", budget},
        {"schedule_analysis", schedule},
        {"resource_analysis", resource},
        {"summary", summary}
    };
}

SimulationResults ProjectRiskAdapter::simulate(const std::string& project_id,
                                               const std::string& analysis_type,
                                               const std::vector<Risk>& risks) const {
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx(project_id, analysis_type);
    size_t iterations = static_cast<size_t>(options_.iterations);

    logger.log_analysis_start(ctx, iterations);
    try {
        SimulationResults results = runner_(risks, iterations, nullptr, options_.seed);
        logger.log_simulation_complete(ctx, results);
        if (results.correlation_adjusted()) {
            logger.log_correlation_adjusted(ctx, results.simulation_id());
        }
        logger.log_analysis_complete(ctx, risks.size(), results.simulation_id());
        return results;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }
}

void ProjectRiskAdapter::report_skipped(const std::string& project_id,
                                        const std::string& analysis_type,
                                        const TranslationResult& translation) const {
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx(project_id, analysis_type);
    for (const auto& entry : translation.skipped) {
        logger.log_record_skipped(ctx, entry.first, entry.second);
    }
}

void ProjectRiskAdapter::notify(const AnalysisEvent& event) const {
    if (audit_sink_ == nullptr) {
        return;
    }
    try {
        audit_sink_->record_analysis(event);
    } catch (const std::exception& e) {
        Logger::get_instance().log_warning(AnalysisContext(event.project_id, event.analysis_type),
                                           std::string("Audit sink failed: ") + e.what());
    }
}

json ProjectRiskAdapter::budget_analysis(const ProjectData& project) const {
    const std::string type = "budget";
    TranslationResult translation = budget_risks_from_records(project.risks);
    report_skipped(project.project_id, type, translation);

    double baseline = project.baseline_budget;
    double current = project.current_spend;
    double remaining = baseline - current;

    if (translation.risks.empty()) {
        const std::string note = "No budget risks identified for analysis";
        Logger::get_instance().log_analysis_degenerate(AnalysisContext(project.project_id, type), note);
        notify({project.project_id, type, false, std::nullopt, 0, translation.skipped.size()});
        return json{
            {"baseline_budget", baseline},
            {"current_spend", current},
            {"remaining_budget", remaining},
            {"expected_final_cost", baseline},
            {"variance_from_baseline", 0.0},
            {"variance_percentage", 0.0},
            {"probability_within_budget", 1.0},
            {"probability_within_10_percent", 1.0},
            {"percentiles", json::object()},
            {"confidence_intervals", json::object()},
            {"risk_contributions", json::array()},
            {"skipped_records", skipped_to_json(translation)},
            {"simulation_id", nullptr},
            {"note", note}
        };
    }

    SimulationResults results = simulate(project.project_id, type, translation.risks);
    const std::vector<double>& impacts = results.cost_outcomes();

    // Projected final cost = baseline + simulated overrun
    std::vector<double> final_costs;
    final_costs.reserve(impacts.size());
    for (double impact : impacts) {
        final_costs.push_back(baseline + impact);
    }

    double expected_final = stats::mean(final_costs);
    double variance = expected_final - baseline;
    double variance_pct = baseline > 0.0 ? variance / baseline * 100.0 : 0.0;

    json output{
        {"baseline_budget", baseline},
        {"current_spend", current},
        {"remaining_budget", remaining},
        {"expected_final_cost", expected_final},
        {"variance_from_baseline", variance},
        {"variance_percentage", variance_pct},
        {"probability_within_budget", share_at_or_below(impacts, 0.0)},
        {"probability_within_10_percent", share_at_or_below(impacts, 0.1 * std::max(remaining, 0.0))},
        {"percentiles", percentiles_to_json(final_costs)},
        {"confidence_intervals", interval_to_json(final_costs, OutcomeType::Cost, options_.confidence_level)},
        {"risk_contributions", contributions_to_json(results, options_.top_n)},
        {"skipped_records", skipped_to_json(translation)},
        {"simulation_id", results.simulation_id()}
    };

    notify({project.project_id, type, true, results.simulation_id(), translation.risks.size(),
            translation.skipped.size()});
    return output;
}

json ProjectRiskAdapter::schedule_analysis(const ProjectData& project) const {
    const std::string type = "schedule";
    TranslationResult translation = schedule_risks_from_records(project.risks);
    report_skipped(project.project_id, type, translation);

    double baseline = project.baseline_duration;
    double elapsed = project.elapsed_time;

    if (translation.risks.empty()) {
        const std::string note = "No schedule risks identified for analysis";
        Logger::get_instance().log_analysis_degenerate(AnalysisContext(project.project_id, type), note);
        notify({project.project_id, type, false, std::nullopt, 0, translation.skipped.size()});
        return json{
            {"baseline_duration", baseline},
            {"elapsed_time", elapsed},
            {"remaining_duration", baseline - elapsed},
            {"expected_final_duration", baseline},
            {"variance_from_baseline", 0.0},
            {"variance_percentage", 0.0},
            {"probability_on_time", 1.0},
            {"probability_within_1_week", 1.0},
            {"probability_within_1_month", 1.0},
            {"percentiles", json::object()},
            {"confidence_intervals", json::object()},
            {"risk_contributions", json::array()},
            {"critical_path_analysis", json::object()},
            {"skipped_records", skipped_to_json(translation)},
            {"simulation_id", nullptr},
            {"note", note}
        };
    }

    SimulationResults results = simulate(project.project_id, type, translation.risks);
    const std::vector<double>& delays = results.schedule_outcomes();

    std::vector<double> final_durations;
    final_durations.reserve(delays.size());
    for (double delay : delays) {
        final_durations.push_back(baseline + delay);
    }

    double expected_final = stats::mean(final_durations);
    double variance = expected_final - baseline;
    double variance_pct = baseline > 0.0 ? variance / baseline * 100.0 : 0.0;

    json output{
        {"baseline_duration", baseline},
        {"elapsed_time", elapsed},
        {"remaining_duration", baseline - elapsed},
        {"expected_final_duration", expected_final},
        {"variance_from_baseline", variance},
        {"variance_percentage", variance_pct},
        {"probability_on_time", share_at_or_below(delays, 0.0)},
        {"probability_within_1_week", share_at_or_below(delays, 7.0)},
        {"probability_within_1_month", share_at_or_below(delays, 30.0)},
        {"percentiles", percentiles_to_json(final_durations)},
        {"confidence_intervals",
         interval_to_json(final_durations, OutcomeType::Schedule, options_.confidence_level)},
        {"risk_contributions", contributions_to_json(results, options_.top_n)},
        {"critical_path_analysis", critical_path_analysis(project, final_durations)},
        {"skipped_records", skipped_to_json(translation)},
        {"simulation_id", results.simulation_id()}
    };

    notify({project.project_id, type, true, results.simulation_id(), translation.risks.size(),
            translation.skipped.size()});
    return output;
}

json ProjectRiskAdapter::resource_analysis(const ProjectData& project) const {
    const std::string type = "resource";
    TranslationResult translation = resource_risks_from_records(project.risks);
    report_skipped(project.project_id, type, translation);

    const auto& allocations = project.resource_allocations;

    if (translation.risks.empty()) {
        const std::string note = "No resource risks identified for analysis";
        Logger::get_instance().log_analysis_degenerate(AnalysisContext(project.project_id, type), note);
        notify({project.project_id, type, false, std::nullopt, 0, translation.skipped.size()});
        return json{
            {"total_resources", allocations.size()},
            {"resource_utilization", json::object()},
            {"conflict_probability", json::object()},
            {"risk_contributions", json::array()},
            {"recommendations", json::array({"Insufficient resource data for analysis"})},
            {"skipped_records", skipped_to_json(translation)},
            {"simulation_id", nullptr},
            {"note", note}
        };
    }

    SimulationResults results = simulate(project.project_id, type, translation.risks);

    double total_capacity = 0.0;
    double total_allocated = 0.0;
    json high_risk = json::array();
    for (const auto& allocation : allocations) {
        total_capacity += allocation.capacity;
        total_allocated += allocation.allocated;
        if (allocation.capacity > 0.0) {
            double utilization = allocation.allocated / allocation.capacity;
            if (utilization > RESOURCE_CONFLICT_THRESHOLD) {
                high_risk.push_back({
                    {"resource_id", allocation.id},
                    {"resource_name", allocation.name.empty() ? "Unknown" : allocation.name},
                    {"utilization", utilization},
                    {"capacity", allocation.capacity},
                    {"allocated", allocation.allocated}
                });
            }
        }
    }

    double utilization_rate = total_capacity > 0.0 ? total_allocated / total_capacity : 0.0;
    const auto& schedule = results.schedule_outcomes();
    double schedule_variance = stats::variance(schedule, stats::mean(schedule));
    double over_allocation_risk = std::min(1.0, schedule_variance / 100.0);
    double conflict_probability = allocations.empty()
        ? 0.0
        : static_cast<double>(high_risk.size()) / static_cast<double>(allocations.size());

    json utilization{
        {"total_resources", allocations.size()},
        {"total_capacity", total_capacity},
        {"total_allocated", total_allocated},
        {"utilization_rate", utilization_rate},
        {"over_allocation_risk", over_allocation_risk}
    };
    json conflicts{
        {"conflict_probability", conflict_probability},
        {"high_risk_resources", high_risk},
        {"total_resources_analyzed", allocations.size()}
    };

    json output{
        {"total_resources", allocations.size()},
        {"resource_utilization", utilization},
        {"conflict_probability", conflicts},
        {"risk_contributions", contributions_to_json(results, options_.top_n)},
        {"recommendations", resource_recommendations(utilization_rate, conflict_probability, high_risk)},
        {"skipped_records", skipped_to_json(translation)},
        {"simulation_id", results.simulation_id()}
    };

    notify({project.project_id, type, true, results.simulation_id(), translation.risks.size(),
            translation.skipped.size()});
    return output;
}

} // namespace riskcalc
