#include "results_analyzer.hpp"
#include "correlation.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <boost/math/distributions/students_t.hpp>

namespace riskcalc {

// ============================================================================
// OutcomeType helpers
// ============================================================================

std::string outcome_type_to_string(OutcomeType type) {
    return type == OutcomeType::Cost ? "cost" : "schedule";
}

OutcomeType parse_outcome_type(const std::string& name) {
    if (name == "cost") return OutcomeType::Cost;
    if (name == "schedule") return OutcomeType::Schedule;
    throw ValidationError("Outcome type must be 'cost' or 'schedule', got '" + name + "'");
}

const std::vector<double>& outcomes_of(const SimulationResults& results, OutcomeType type) {
    return type == OutcomeType::Cost ? results.cost_outcomes() : results.schedule_outcomes();
}

double PercentileAnalysis::at(int p) const {
    auto it = percentiles.find(p);
    if (it == percentiles.end()) {
        throw std::out_of_range("Percentile P" + std::to_string(p) + " was not reported");
    }
    return it->second;
}

const ConfidenceInterval& ConfidenceIntervals::at(double level) const {
    for (const auto& interval : intervals) {
        if (std::fabs(interval.level - level) < 1e-12) {
            return interval;
        }
    }
    throw std::out_of_range("Confidence level " + std::to_string(level) + " was not requested");
}

// ============================================================================
// Percentiles and confidence intervals
// ============================================================================

PercentileAnalysis calculate_percentiles(const std::vector<double>& outcomes) {
    PercentileAnalysis analysis;
    analysis.mean = stats::mean(outcomes);
    analysis.std_dev = stats::std_dev(outcomes, analysis.mean);
    analysis.coefficient_of_variation =
        analysis.mean != 0.0 ? analysis.std_dev / std::fabs(analysis.mean) : 0.0;

    std::vector<double> sorted = outcomes;
    std::sort(sorted.begin(), sorted.end());

    analysis.min = sorted.empty() ? 0.0 : sorted.front();
    analysis.max = sorted.empty() ? 0.0 : sorted.back();
    analysis.median = stats::percentile(sorted, 50.0);
    for (int p : REPORTED_PERCENTILES) {
        analysis.percentiles[p] = stats::percentile(sorted, static_cast<double>(p));
    }
    return analysis;
}

PercentileAnalysis calculate_percentiles(const SimulationResults& results, OutcomeType outcome) {
    return calculate_percentiles(outcomes_of(results, outcome));
}

ConfidenceIntervals generate_confidence_intervals(
    const std::vector<double>& outcomes,
    OutcomeType outcome,
    const std::vector<double>& confidence_levels)
{
    for (double level : confidence_levels) {
        if (!(level > 0.0 && level < 1.0)) {
            std::ostringstream oss;
            oss << "Confidence level must lie in (0, 1), got " << level;
            throw ValidationError(oss.str());
        }
    }

    std::vector<double> sorted = outcomes;
    std::sort(sorted.begin(), sorted.end());

    ConfidenceIntervals result;
    result.outcome = outcome;
    result.sample_size = sorted.size();
    for (double level : confidence_levels) {
        double alpha = 1.0 - level;
        ConfidenceInterval interval;
        interval.level = level;
        interval.lower_bound = stats::percentile(sorted, alpha / 2.0 * 100.0);
        interval.upper_bound = stats::percentile(sorted, (1.0 - alpha / 2.0) * 100.0);
        result.intervals.push_back(interval);
    }
    return result;
}

ConfidenceIntervals generate_confidence_intervals(
    const SimulationResults& results,
    OutcomeType outcome,
    const std::vector<double>& confidence_levels)
{
    return generate_confidence_intervals(outcomes_of(results, outcome), outcome, confidence_levels);
}

// ============================================================================
// Contributor ranking
// ============================================================================

std::vector<RiskContribution> identify_top_risk_contributors(const SimulationResults& results,
                                                             size_t top_n) {
    if (top_n == 0) {
        throw ValidationError("top_n must be positive");
    }

    const auto& series = results.risk_contributions();
    double cost_variance = stats::variance(results.cost_outcomes(), stats::mean(results.cost_outcomes()));
    double schedule_variance =
        stats::variance(results.schedule_outcomes(), stats::mean(results.schedule_outcomes()));

    std::vector<RiskContribution> ranking;
    ranking.reserve(series.size());
    for (const auto& risk : series) {
        RiskContribution contribution;
        contribution.risk_id = risk.risk_id;
        contribution.risk_name = risk.risk_name;
        contribution.impact_type = risk.impact_type;
        contribution.outcome = affects_cost(risk.impact_type) ? OutcomeType::Cost : OutcomeType::Schedule;
        contribution.mean_impact = stats::mean(risk.impacts);
        contribution.variance_contribution = stats::variance(risk.impacts, contribution.mean_impact);

        double total = contribution.outcome == OutcomeType::Cost ? cost_variance : schedule_variance;
        contribution.contribution_percentage =
            total > 0.0 ? contribution.variance_contribution / total * 100.0 : 0.0;

        for (const auto& other : series) {
            if (other.risk_id != risk.risk_id) {
                contribution.correlation_effects[other.risk_id] = sample_correlation(risk.impacts, other.impacts);
            }
        }
        ranking.push_back(std::move(contribution));
    }

    // Stable so equal shares keep input order
    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const RiskContribution& a, const RiskContribution& b) {
                         return a.contribution_percentage > b.contribution_percentage;
                     });
    if (ranking.size() > top_n) {
        ranking.resize(top_n);
    }
    return ranking;
}

// ============================================================================
// Expected values
// ============================================================================

namespace {

ExpectedValues describe(const std::vector<double>& values) {
    ExpectedValues ev;
    ev.mean = stats::mean(values);
    ev.variance = stats::variance(values, ev.mean);
    ev.std_dev = std::sqrt(ev.variance);
    ev.coefficient_of_variation = ev.mean != 0.0 ? ev.std_dev / std::fabs(ev.mean) : 0.0;
    ev.skewness = stats::skewness(values, ev.mean, ev.std_dev);
    ev.excess_kurtosis = stats::excess_kurtosis(values, ev.mean, ev.std_dev);
    return ev;
}

OutcomeDifference compare_outcomes(const std::vector<double>& baseline,
                                   const std::vector<double>& comparison) {
    OutcomeDifference diff;
    diff.mean_baseline = stats::mean(baseline);
    diff.mean_comparison = stats::mean(comparison);
    diff.std_baseline = stats::std_dev(baseline, diff.mean_baseline);
    diff.std_comparison = stats::std_dev(comparison, diff.mean_comparison);
    diff.mean_difference = diff.mean_comparison - diff.mean_baseline;
    diff.relative_difference_percent =
        diff.mean_baseline != 0.0 ? diff.mean_difference / diff.mean_baseline * 100.0 : 0.0;

    stats::TestResult t = stats::welch_t_test(baseline, comparison);
    diff.t_statistic = t.statistic;
    diff.t_p_value = t.p_value;

    stats::TestResult u = stats::mann_whitney_u(baseline, comparison);
    diff.mann_whitney_u = u.statistic;
    diff.mann_whitney_p_value = u.p_value;

    stats::TestResult ks = stats::kolmogorov_smirnov(baseline, comparison);
    diff.ks_statistic = ks.statistic;
    diff.ks_p_value = ks.p_value;

    diff.cohens_d = stats::cohens_d(baseline, comparison);

    double se = std::sqrt(diff.std_baseline * diff.std_baseline / static_cast<double>(baseline.size()) +
                          diff.std_comparison * diff.std_comparison / static_cast<double>(comparison.size()));
    boost::math::students_t_distribution<double> t_dist(stats::welch_degrees_of_freedom(baseline, comparison));
    double t_critical = boost::math::quantile(t_dist, 0.975);
    diff.ci95_lower = diff.mean_difference - t_critical * se;
    diff.ci95_upper = diff.mean_difference + t_critical * se;

    diff.significant = diff.t_p_value < SIGNIFICANCE_LEVEL;
    return diff;
}

std::string generate_recommendation(bool is_significant, const std::string& effect_size,
                                    double relative_difference) {
    if (!is_significant) {
        return "No statistically significant difference detected. Scenarios are likely equivalent.";
    }
    std::string direction = relative_difference > 0.0 ? "higher" : "lower";
    if (effect_size == "large") {
        return "Strong evidence of " + direction + " outcomes. Consider this scenario carefully.";
    }
    if (effect_size == "medium") {
        return "Moderate evidence of " + direction + " outcomes. Further analysis may be warranted.";
    }
    if (effect_size == "small") {
        return "Weak evidence of " + direction + " outcomes. Difference may not be practically significant.";
    }
    return "Statistically significant but negligible practical difference.";
}

DimensionAssessment assess(const OutcomeDifference& diff, double significance_level) {
    DimensionAssessment assessment;
    assessment.statistically_significant = diff.t_p_value < significance_level;
    assessment.effect_size_interpretation = interpret_effect_size(diff.cohens_d);
    assessment.practical_significance = std::fabs(diff.relative_difference_percent) > 5.0;
    assessment.recommendation = generate_recommendation(assessment.statistically_significant,
                                                        assessment.effect_size_interpretation,
                                                        diff.relative_difference_percent);
    return assessment;
}

} // anonymous namespace

ExpectedValueSummary calculate_expected_values(const SimulationResults& results) {
    ExpectedValueSummary summary;
    summary.cost = describe(results.cost_outcomes());
    summary.schedule = describe(results.schedule_outcomes());
    return summary;
}

// ============================================================================
// Scenario comparison
// ============================================================================

ScenarioComparison compare_scenarios(const SimulationResults& baseline,
                                     const SimulationResults& comparison) {
    ScenarioComparison result;
    result.baseline_id = baseline.simulation_id();
    result.comparison_id = comparison.simulation_id();
    result.baseline_iterations = baseline.iteration_count();
    result.comparison_iterations = comparison.iteration_count();
    result.cost = compare_outcomes(baseline.cost_outcomes(), comparison.cost_outcomes());
    result.schedule = compare_outcomes(baseline.schedule_outcomes(), comparison.schedule_outcomes());
    result.statistical_significance = result.cost.significant || result.schedule.significant;
    return result;
}

std::string interpret_effect_size(double cohens_d) {
    double abs_d = std::fabs(cohens_d);
    if (abs_d < 0.2) return "negligible";
    if (abs_d < 0.5) return "small";
    if (abs_d < 0.8) return "medium";
    return "large";
}

ScenarioDifferenceAnalysis analyze_scenario_difference(const SimulationResults& baseline,
                                                       const SimulationResults& comparison,
                                                       double significance_level) {
    if (!(significance_level > 0.0 && significance_level < 1.0)) {
        throw ValidationError("Significance level must lie in (0, 1)");
    }

    ScenarioDifferenceAnalysis analysis;
    analysis.comparison = compare_scenarios(baseline, comparison);
    analysis.cost = assess(analysis.comparison.cost, significance_level);
    analysis.schedule = assess(analysis.comparison.schedule, significance_level);
    analysis.scenarios_differ_significantly =
        analysis.cost.statistically_significant || analysis.schedule.statistically_significant;
    if (analysis.cost.statistically_significant) {
        analysis.primary_difference_type = "cost";
    } else if (analysis.schedule.statistically_significant) {
        analysis.primary_difference_type = "schedule";
    } else {
        analysis.primary_difference_type = "none";
    }
    analysis.confidence_level = (1.0 - significance_level) * 100.0;
    return analysis;
}

} // namespace riskcalc
