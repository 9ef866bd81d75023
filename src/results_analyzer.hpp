#ifndef RISKCALC_RESULTS_ANALYZER_HPP
#define RISKCALC_RESULTS_ANALYZER_HPP

#include "simulation.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace riskcalc {

enum class OutcomeType : uint8_t {
    Cost = 0,
    Schedule = 1
};

std::string outcome_type_to_string(OutcomeType type);
OutcomeType parse_outcome_type(const std::string& name);  // throws ValidationError

// Outcome array of the given dimension
const std::vector<double>& outcomes_of(const SimulationResults& results, OutcomeType type);

// Percentile markers reported by calculate_percentiles
constexpr int REPORTED_PERCENTILES[] = {10, 25, 50, 75, 80, 90, 95, 99};

// Significance level of the scenario comparison flag
constexpr double SIGNIFICANCE_LEVEL = 0.05;

struct PercentileAnalysis {
    double mean;
    double median;
    double std_dev;                     // sample standard deviation (n - 1)
    double coefficient_of_variation;    // std_dev / |mean|, 0 when mean == 0
    double min;
    double max;
    std::map<int, double> percentiles;  // keyed by REPORTED_PERCENTILES

    // Throws std::out_of_range if p was not reported
    double at(int p) const;
};

struct ConfidenceInterval {
    double level;
    double lower_bound;
    double upper_bound;
};

struct ConfidenceIntervals {
    OutcomeType outcome;
    size_t sample_size;
    std::vector<ConfidenceInterval> intervals;  // in requested order

    // Throws std::out_of_range if level was not requested
    const ConfidenceInterval& at(double level) const;
};

struct RiskContribution {
    std::string risk_id;
    std::string risk_name;
    ImpactType impact_type;
    OutcomeType outcome;                 // dimension the share is measured against
    double contribution_percentage;      // risk variance / dimension variance * 100
    double variance_contribution;        // sample variance of the risk's impacts
    double mean_impact;
    std::map<std::string, double> correlation_effects;  // Pearson r with other risks
};

struct ExpectedValues {
    double mean;
    double std_dev;
    double variance;
    double coefficient_of_variation;
    double skewness;
    double excess_kurtosis;
};

struct ExpectedValueSummary {
    ExpectedValues cost;
    ExpectedValues schedule;
};

// Comparison of one outcome dimension; differences are comparison - baseline
struct OutcomeDifference {
    double mean_baseline;
    double mean_comparison;
    double std_baseline;
    double std_comparison;
    double mean_difference;
    double relative_difference_percent;  // relative to the baseline mean, 0 if that is 0
    double t_statistic;                  // Welch
    double t_p_value;
    double mann_whitney_u;
    double mann_whitney_p_value;
    double ks_statistic;
    double ks_p_value;
    double cohens_d;
    double ci95_lower;                   // 95% CI of mean_difference
    double ci95_upper;
    bool significant;                    // t_p_value < SIGNIFICANCE_LEVEL
};

struct ScenarioComparison {
    std::string baseline_id;
    std::string comparison_id;
    size_t baseline_iterations;
    size_t comparison_iterations;
    OutcomeDifference cost;
    OutcomeDifference schedule;
    bool statistical_significance;       // either dimension significant
};

struct DimensionAssessment {
    bool statistically_significant;
    std::string effect_size_interpretation;  // negligible, small, medium, large
    bool practical_significance;             // |relative difference| > 5%
    std::string recommendation;
};

struct ScenarioDifferenceAnalysis {
    ScenarioComparison comparison;
    DimensionAssessment cost;
    DimensionAssessment schedule;
    bool scenarios_differ_significantly;
    std::string primary_difference_type;     // cost, schedule or none
    double confidence_level;                 // (1 - alpha) * 100
};

// Summary statistics and percentile markers of one outcome dimension
PercentileAnalysis calculate_percentiles(const SimulationResults& results, OutcomeType outcome);
PercentileAnalysis calculate_percentiles(const std::vector<double>& outcomes);

// Two-sided percentile intervals: [(1 - c)/2, (1 + c)/2] for each level c.
// Throws ValidationError if any level is outside (0, 1).
ConfidenceIntervals generate_confidence_intervals(
    const SimulationResults& results,
    OutcomeType outcome,
    const std::vector<double>& confidence_levels = {0.80, 0.90, 0.95}
);
ConfidenceIntervals generate_confidence_intervals(
    const std::vector<double>& outcomes,
    OutcomeType outcome,
    const std::vector<double>& confidence_levels = {0.80, 0.90, 0.95}
);

// Risks ranked by share of their own outcome dimension's variance, at most
// top_n entries. Throws ValidationError if top_n == 0.
std::vector<RiskContribution> identify_top_risk_contributors(const SimulationResults& results,
                                                             size_t top_n = 10);

ExpectedValueSummary calculate_expected_values(const SimulationResults& results);

// Welch t-test, Mann-Whitney U and Kolmogorov-Smirnov on each dimension.
// Result sets may have different iteration counts.
ScenarioComparison compare_scenarios(const SimulationResults& baseline,
                                     const SimulationResults& comparison);

// Cohen's d thresholds 0.2 / 0.5 / 0.8
std::string interpret_effect_size(double cohens_d);

// Comparison plus rule-based interpretation at the given significance level.
// Throws ValidationError if significance_level is outside (0, 1).
ScenarioDifferenceAnalysis analyze_scenario_difference(const SimulationResults& baseline,
                                                       const SimulationResults& comparison,
                                                       double significance_level = SIGNIFICANCE_LEVEL);

} // namespace riskcalc

#endif // RISKCALC_RESULTS_ANALYZER_HPP
