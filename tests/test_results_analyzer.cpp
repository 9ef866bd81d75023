#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <chrono>
#include <cmath>
#include "errors.hpp"
#include "results_analyzer.hpp"

using namespace riskcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

// Results with hand-picked outcomes for exact assertions
SimulationResults fixed_results(std::vector<double> cost, std::vector<double> schedule,
                                std::vector<RiskImpactSeries> series = {}) {
    size_t n = cost.size();
    return SimulationResults("sim-fixed", std::chrono::system_clock::now(), n, 0.0,
                             std::move(cost), std::move(schedule), std::move(series),
                             ConvergenceMetrics(), 0, false);
}

Risk cost_risk(const std::string& id, ProbabilityDistribution dist) {
    return Risk(id, "Risk " + id, RiskCategory::Cost, ImpactType::Cost, std::move(dist), 0.0);
}

} // anonymous namespace

// ============================================================================
// Percentiles and confidence intervals
// ============================================================================

TEST_CASE("Percentiles of ten evenly spaced outcomes", "[analyzer][percentiles]") {
    std::vector<double> outcomes = {10, 20, 30, 40, 50, 60, 70, 80, 90, 100};
    auto results = fixed_results(outcomes, std::vector<double>(10, 0.0));
    auto analysis = calculate_percentiles(results, OutcomeType::Cost);

    REQUIRE_THAT(analysis.mean, WithinRel(55.0, 1e-12));
    REQUIRE_THAT(analysis.median, WithinRel(55.0, 1e-12));
    REQUIRE(analysis.min == 10.0);
    REQUIRE(analysis.max == 100.0);
    REQUIRE_THAT(analysis.at(10), WithinRel(19.0, 1e-12));
    REQUIRE_THAT(analysis.at(90), WithinRel(91.0, 1e-12));
    REQUIRE_THAT(analysis.coefficient_of_variation, WithinRel(analysis.std_dev / 55.0, 1e-12));
    REQUIRE(analysis.percentiles.size() == 8);
    REQUIRE_THROWS_AS(analysis.at(42), std::out_of_range);
}

TEST_CASE("Percentiles are monotone", "[analyzer][percentiles]") {
    auto results = run_simulation({cost_risk("c1", ProbabilityDistribution::lognormal(2.0, 0.8))},
                                  10000, nullptr, 21);
    auto analysis = calculate_percentiles(results, OutcomeType::Cost);

    double previous = analysis.min;
    for (const auto& entry : analysis.percentiles) {
        REQUIRE(entry.second >= previous);
        previous = entry.second;
    }
    REQUIRE(analysis.max >= previous);
}

TEST_CASE("Confidence intervals nest by level", "[analyzer][intervals]") {
    auto results = run_simulation({cost_risk("c1", ProbabilityDistribution::normal(100.0, 20.0))},
                                  10000, nullptr, 31);
    auto intervals = generate_confidence_intervals(results, OutcomeType::Cost);

    REQUIRE(intervals.intervals.size() == 3);
    REQUIRE(intervals.sample_size == 10000);
    const auto& i80 = intervals.at(0.80);
    const auto& i90 = intervals.at(0.90);
    const auto& i95 = intervals.at(0.95);
    REQUIRE(i95.lower_bound <= i90.lower_bound);
    REQUIRE(i90.lower_bound <= i80.lower_bound);
    REQUIRE(i80.upper_bound <= i90.upper_bound);
    REQUIRE(i90.upper_bound <= i95.upper_bound);
    REQUIRE_THAT(i95.lower_bound, WithinAbs(100.0 - 1.96 * 20.0, 2.0));
    REQUIRE_THAT(i95.upper_bound, WithinAbs(100.0 + 1.96 * 20.0, 2.0));
}

TEST_CASE("Confidence levels outside (0, 1) are rejected", "[analyzer][intervals][error]") {
    auto results = fixed_results({1, 2, 3}, {0, 0, 0});
    REQUIRE_THROWS_AS(generate_confidence_intervals(results, OutcomeType::Cost, {0.0}), ValidationError);
    REQUIRE_THROWS_AS(generate_confidence_intervals(results, OutcomeType::Cost, {1.0}), ValidationError);
    REQUIRE_THROWS_AS(generate_confidence_intervals(results, OutcomeType::Cost, {0.9, 1.2}), ValidationError);
}

// ============================================================================
// Contributors
// ============================================================================

TEST_CASE("Top contributors are ranked and truncated", "[analyzer][contributors]") {
    std::vector<Risk> risks = {
        cost_risk("small", ProbabilityDistribution::normal(0.0, 1.0)),
        cost_risk("large", ProbabilityDistribution::normal(0.0, 10.0)),
        cost_risk("medium", ProbabilityDistribution::normal(0.0, 5.0))
    };
    auto results = run_simulation(risks, 10000, nullptr, 41);

    auto top = identify_top_risk_contributors(results, 2);
    REQUIRE(top.size() == 2);
    REQUIRE(top[0].risk_id == "large");
    REQUIRE(top[1].risk_id == "medium");
    REQUIRE(top[0].contribution_percentage > top[1].contribution_percentage);
    REQUIRE_THAT(top[0].contribution_percentage, WithinAbs(100.0 * 100.0 / 126.0, 3.0));
    REQUIRE(top[0].correlation_effects.size() == 2);
    REQUIRE(top[0].outcome == OutcomeType::Cost);

    auto all = identify_top_risk_contributors(results, 10);
    REQUIRE(all.size() == 3);
    REQUIRE(all[2].risk_id == "small");
}

TEST_CASE("top_n of zero is rejected", "[analyzer][contributors][error]") {
    auto results = fixed_results({1, 2, 3}, {0, 0, 0});
    REQUIRE_THROWS_AS(identify_top_risk_contributors(results, 0), ValidationError);
}

TEST_CASE("Schedule risks are measured against schedule variance", "[analyzer][contributors]") {
    std::vector<Risk> risks = {
        Risk("s1", "Delay", RiskCategory::Schedule, ImpactType::Schedule,
             ProbabilityDistribution::uniform(0.0, 30.0), 0.0)
    };
    auto results = run_simulation(risks, 10000, nullptr, 2);
    auto top = identify_top_risk_contributors(results, 5);

    REQUIRE(top.size() == 1);
    REQUIRE(top[0].outcome == OutcomeType::Schedule);
    REQUIRE_THAT(top[0].contribution_percentage, WithinAbs(100.0, 1e-9));
}

// ============================================================================
// Expected values
// ============================================================================

TEST_CASE("Expected values describe both dimensions", "[analyzer]") {
    auto results = fixed_results({10, 20, 30, 40, 50, 60, 70, 80, 90, 100}, std::vector<double>(10, 5.0));
    auto summary = calculate_expected_values(results);

    REQUIRE_THAT(summary.cost.mean, WithinRel(55.0, 1e-12));
    REQUIRE_THAT(summary.cost.variance, WithinRel(8250.0 / 9.0, 1e-12));
    REQUIRE_THAT(summary.cost.skewness, WithinAbs(0.0, 1e-12));
    REQUIRE(summary.schedule.mean == 5.0);
    REQUIRE(summary.schedule.std_dev == 0.0);
    REQUIRE(summary.schedule.skewness == 0.0);
}

// ============================================================================
// Scenario comparison
// ============================================================================

TEST_CASE("Comparison detects a shifted scenario", "[analyzer][comparison]") {
    auto baseline = run_simulation({cost_risk("c1", ProbabilityDistribution::normal(100.0, 10.0))},
                                   10000, nullptr, 1);
    auto shifted = run_simulation({cost_risk("c1", ProbabilityDistribution::normal(110.0, 10.0))},
                                  15000, nullptr, 2);

    auto comparison = compare_scenarios(baseline, shifted);
    REQUIRE(comparison.baseline_iterations == 10000);
    REQUIRE(comparison.comparison_iterations == 15000);
    REQUIRE(comparison.cost.significant);
    REQUIRE(comparison.statistical_significance);
    REQUIRE_THAT(comparison.cost.mean_difference, WithinAbs(10.0, 0.6));
    REQUIRE_THAT(comparison.cost.relative_difference_percent, WithinAbs(10.0, 0.6));
    REQUIRE(comparison.cost.ci95_lower < comparison.cost.mean_difference);
    REQUIRE(comparison.cost.ci95_upper > comparison.cost.mean_difference);
    REQUIRE(comparison.cost.ci95_lower > 0.0);
    REQUIRE_THAT(comparison.cost.cohens_d, WithinAbs(1.0, 0.1));

    // No schedule risks on either side: identical zero outcomes
    REQUIRE_FALSE(comparison.schedule.significant);
    REQUIRE(comparison.schedule.t_p_value == 1.0);
}

TEST_CASE("Comparison of identical distributions is not significant", "[analyzer][comparison]") {
    std::vector<Risk> risks = {cost_risk("c1", ProbabilityDistribution::triangular(0.0, 10.0, 40.0))};
    auto a = run_simulation(risks, 10000, nullptr, 100);
    auto b = run_simulation(risks, 10000, nullptr, 200);

    auto analysis = analyze_scenario_difference(a, b);
    REQUIRE(analysis.cost.effect_size_interpretation == "negligible");
    REQUIRE_FALSE(analysis.cost.practical_significance);
    REQUIRE_THAT(analysis.confidence_level, WithinRel(95.0, 1e-12));
    REQUIRE(analysis.primary_difference_type == (analysis.scenarios_differ_significantly ? "cost" : "none"));
}

TEST_CASE("Scenario difference interpretation", "[analyzer][comparison]") {
    auto baseline = run_simulation({cost_risk("c1", ProbabilityDistribution::normal(100.0, 10.0))},
                                   10000, nullptr, 3);
    auto mitigated = run_simulation({cost_risk("c1", ProbabilityDistribution::normal(80.0, 10.0))},
                                    10000, nullptr, 4);

    auto analysis = analyze_scenario_difference(baseline, mitigated, 0.01);
    REQUIRE(analysis.scenarios_differ_significantly);
    REQUIRE(analysis.primary_difference_type == "cost");
    REQUIRE(analysis.cost.effect_size_interpretation == "large");
    REQUIRE(analysis.cost.practical_significance);
    REQUIRE(analysis.cost.recommendation.find("lower") != std::string::npos);
    REQUIRE(analysis.schedule.recommendation.find("No statistically significant") != std::string::npos);
    REQUIRE_THAT(analysis.confidence_level, WithinRel(99.0, 1e-12));

    REQUIRE_THROWS_AS(analyze_scenario_difference(baseline, mitigated, 0.0), ValidationError);
    REQUIRE_THROWS_AS(analyze_scenario_difference(baseline, mitigated, 1.0), ValidationError);
}

TEST_CASE("Effect size thresholds", "[analyzer]") {
    REQUIRE(interpret_effect_size(0.1) == "negligible");
    REQUIRE(interpret_effect_size(-0.3) == "small");
    REQUIRE(interpret_effect_size(0.6) == "medium");
    REQUIRE(interpret_effect_size(-1.2) == "large");
}

TEST_CASE("Outcome type names", "[analyzer]") {
    REQUIRE(parse_outcome_type("cost") == OutcomeType::Cost);
    REQUIRE(outcome_type_to_string(OutcomeType::Schedule) == "schedule");
    REQUIRE_THROWS_AS(parse_outcome_type("quality"), ValidationError);
}
