#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace riskcalc {
namespace io {

namespace {

json number(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

std::string level_key(double level) {
    std::ostringstream oss;
    oss << level;
    return oss.str();
}

json outcome_difference_to_json(const OutcomeDifference& diff) {
    return json{
        {"mean_baseline", diff.mean_baseline},
        {"mean_comparison", diff.mean_comparison},
        {"std_baseline", diff.std_baseline},
        {"std_comparison", diff.std_comparison},
        {"mean_difference", diff.mean_difference},
        {"relative_difference_percent", diff.relative_difference_percent},
        {"t_test", {{"statistic", number(diff.t_statistic)}, {"p_value", diff.t_p_value}}},
        {"mann_whitney", {{"u_statistic", diff.mann_whitney_u}, {"p_value", diff.mann_whitney_p_value}}},
        {"kolmogorov_smirnov", {{"statistic", diff.ks_statistic}, {"p_value", diff.ks_p_value}}},
        {"cohens_d", number(diff.cohens_d)},
        {"confidence_interval_95", {diff.ci95_lower, diff.ci95_upper}},
        {"significant", diff.significant}
    };
}

json assessment_to_json(const DimensionAssessment& assessment) {
    return json{
        {"statistically_significant", assessment.statistically_significant},
        {"effect_size_interpretation", assessment.effect_size_interpretation},
        {"practical_significance", assessment.practical_significance},
        {"recommendation", assessment.recommendation}
    };
}

json describe_to_json(const ExpectedValues& ev) {
    return json{
        {"mean", ev.mean},
        {"std_dev", ev.std_dev},
        {"variance", ev.variance},
        {"coefficient_of_variation", ev.coefficient_of_variation},
        {"skewness", ev.skewness},
        {"excess_kurtosis", ev.excess_kurtosis}
    };
}

} // anonymous namespace

json distribution_to_json(const ProbabilityDistribution& distribution) {
    json j{
        {"type", distribution_type_to_string(distribution.type())},
        {"parameters", distribution.parameters()}
    };
    if (distribution.bounds()) {
        j["bounds"] = {distribution.bounds()->lower, distribution.bounds()->upper};
    }
    return j;
}

json risk_to_json(const Risk& risk) {
    json strategies = json::array();
    for (const auto& s : risk.mitigation_strategies()) {
        strategies.push_back({
            {"id", s.id},
            {"name", s.name},
            {"description", s.description},
            {"cost", s.cost},
            {"effectiveness", s.effectiveness},
            {"implementation_time_days", s.implementation_time_days}
        });
    }
    return json{
        {"id", risk.id()},
        {"name", risk.name()},
        {"category", risk_category_to_string(risk.category())},
        {"impact_type", impact_type_to_string(risk.impact_type())},
        {"baseline_impact", risk.baseline_impact()},
        {"distribution", distribution_to_json(risk.distribution())},
        {"correlation_dependencies", risk.correlation_dependencies()},
        {"mitigation_strategies", strategies}
    };
}

json percentiles_to_json(const PercentileAnalysis& analysis) {
    json markers;
    for (const auto& entry : analysis.percentiles) {
        markers["p" + std::to_string(entry.first)] = entry.second;
    }
    return json{
        {"mean", analysis.mean},
        {"median", analysis.median},
        {"std_dev", analysis.std_dev},
        {"coefficient_of_variation", analysis.coefficient_of_variation},
        {"min", analysis.min},
        {"max", analysis.max},
        {"percentiles", markers}
    };
}

json confidence_intervals_to_json(const ConfidenceIntervals& intervals) {
    json levels = json::object();
    for (const auto& interval : intervals.intervals) {
        levels[level_key(interval.level)] = {
            {"lower_bound", interval.lower_bound},
            {"upper_bound", interval.upper_bound},
            {"width", interval.upper_bound - interval.lower_bound}
        };
    }
    return json{
        {"outcome", outcome_type_to_string(intervals.outcome)},
        {"sample_size", intervals.sample_size},
        {"intervals", levels}
    };
}

json contributions_to_json(const std::vector<RiskContribution>& contributions) {
    json list = json::array();
    for (const auto& c : contributions) {
        list.push_back({
            {"risk_id", c.risk_id},
            {"risk_name", c.risk_name},
            {"impact_type", impact_type_to_string(c.impact_type)},
            {"outcome", outcome_type_to_string(c.outcome)},
            {"contribution_percentage", c.contribution_percentage},
            {"variance_contribution", c.variance_contribution},
            {"mean_impact", c.mean_impact},
            {"correlation_effects", c.correlation_effects}
        });
    }
    return list;
}

json expected_values_to_json(const ExpectedValueSummary& summary) {
    return json{
        {"cost", describe_to_json(summary.cost)},
        {"schedule", describe_to_json(summary.schedule)}
    };
}

json comparison_to_json(const ScenarioComparison& comparison) {
    return json{
        {"baseline_id", comparison.baseline_id},
        {"comparison_id", comparison.comparison_id},
        {"baseline_iterations", comparison.baseline_iterations},
        {"comparison_iterations", comparison.comparison_iterations},
        {"cost", outcome_difference_to_json(comparison.cost)},
        {"schedule", outcome_difference_to_json(comparison.schedule)},
        {"statistical_significance", comparison.statistical_significance}
    };
}

json scenario_difference_to_json(const ScenarioDifferenceAnalysis& analysis) {
    return json{
        {"comparison", comparison_to_json(analysis.comparison)},
        {"cost_assessment", assessment_to_json(analysis.cost)},
        {"schedule_assessment", assessment_to_json(analysis.schedule)},
        {"overall_assessment", {
            {"scenarios_differ_significantly", analysis.scenarios_differ_significantly},
            {"primary_difference_type", analysis.primary_difference_type},
            {"confidence_level", analysis.confidence_level}
        }}
    };
}

json scenario_to_json(const Scenario& scenario) {
    json risks = json::array();
    for (const auto& risk : scenario.risks) {
        risks.push_back(risk_to_json(risk));
    }

    json modifications = json::object();
    for (const auto& entry : scenario.modifications) {
        const RiskModification& mod = entry.second;
        json m{
            {"parameter_changes", mod.parameter_changes},
            {"mitigation_applied", mod.mitigation_applied}
        };
        if (mod.distribution_type_change) {
            m["distribution_type_change"] = distribution_type_to_string(*mod.distribution_type_change);
        }
        if (mod.mitigation_strategy_id) {
            m["mitigation_strategy_id"] = *mod.mitigation_strategy_id;
        }
        modifications[entry.first] = m;
    }

    return json{
        {"id", scenario.id},
        {"name", scenario.name},
        {"description", scenario.description},
        {"risks", risks},
        {"modifications", modifications}
    };
}

json mitigation_to_json(const MitigationAnalysis& analysis) {
    return json{
        {"strategy_id", analysis.strategy_id},
        {"outcome", outcome_type_to_string(analysis.outcome)},
        {"baseline_expected", analysis.baseline_expected},
        {"mitigated_expected", analysis.mitigated_expected},
        {"risk_reduction", analysis.risk_reduction},
        {"p90_reduction", analysis.p90_reduction},
        {"cost_benefit_ratio", number(analysis.cost_benefit_ratio)},
        {"net_value", analysis.net_value},
        {"return_on_investment", number(analysis.return_on_investment)}
    };
}

json simulation_results_to_json(const SimulationResults& results, bool include_distribution) {
    const ConvergenceMetrics& convergence = results.convergence();
    json percentile_stability = json::object();
    for (const auto& entry : convergence.percentile_stability) {
        percentile_stability["p" + std::to_string(static_cast<int>(entry.first))] = entry.second;
    }

    json j{
        {"simulation_id", results.simulation_id()},
        {"timestamp", results.timestamp_string()},
        {"iteration_count", results.iteration_count()},
        {"execution_time_seconds", results.execution_time()},
        {"seed", results.seed()},
        {"correlation_adjusted", results.correlation_adjusted()},
        {"convergence", {
            {"converged", convergence.converged},
            {"mean_stability", convergence.mean_stability},
            {"variance_stability", convergence.variance_stability},
            {"percentile_stability", percentile_stability},
            {"iterations_to_convergence", convergence.iterations_to_convergence
                                              ? json(*convergence.iterations_to_convergence)
                                              : json(nullptr)}
        }}
    };

    if (include_distribution) {
        j["cost_outcomes"] = results.cost_outcomes();
        j["schedule_outcomes"] = results.schedule_outcomes();
    }
    return j;
}

json simulation_report_to_json(const SimulationResults& results,
                               const std::vector<double>& confidence_levels,
                               size_t top_n) {
    json report = simulation_results_to_json(results, false);
    report["cost"] = {
        {"statistics", percentiles_to_json(calculate_percentiles(results, OutcomeType::Cost))},
        {"confidence_intervals",
         confidence_intervals_to_json(generate_confidence_intervals(results, OutcomeType::Cost, confidence_levels))}
    };
    report["schedule"] = {
        {"statistics", percentiles_to_json(calculate_percentiles(results, OutcomeType::Schedule))},
        {"confidence_intervals",
         confidence_intervals_to_json(generate_confidence_intervals(results, OutcomeType::Schedule, confidence_levels))}
    };
    report["expected_values"] = expected_values_to_json(calculate_expected_values(results));
    report["top_contributors"] = contributions_to_json(identify_top_risk_contributors(results, top_n));
    return report;
}

void write_json(std::ostream& os, const json& document, bool pretty_print) {
    if (pretty_print) {
        os << document.dump(2) << "\n";
    } else {
        os << document.dump() << "\n";
    }
}

void write_json(const std::string& filepath, const json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace riskcalc
