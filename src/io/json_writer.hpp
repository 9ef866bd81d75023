#ifndef RISKCALC_IO_JSON_WRITER_HPP
#define RISKCALC_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../results_analyzer.hpp"
#include "../scenario.hpp"
#include "../simulation.hpp"

namespace riskcalc {
namespace io {

// JSON renderings of engine values. Non-finite numbers (e.g. an infinite
// cost-benefit ratio) are written as null.
nlohmann::json distribution_to_json(const ProbabilityDistribution& distribution);
nlohmann::json risk_to_json(const Risk& risk);
nlohmann::json percentiles_to_json(const PercentileAnalysis& analysis);
nlohmann::json confidence_intervals_to_json(const ConfidenceIntervals& intervals);
nlohmann::json contributions_to_json(const std::vector<RiskContribution>& contributions);
nlohmann::json expected_values_to_json(const ExpectedValueSummary& summary);
nlohmann::json comparison_to_json(const ScenarioComparison& comparison);
nlohmann::json scenario_difference_to_json(const ScenarioDifferenceAnalysis& analysis);
nlohmann::json scenario_to_json(const Scenario& scenario);
nlohmann::json mitigation_to_json(const MitigationAnalysis& analysis);

// Metadata, convergence and (optionally) the raw outcome arrays
nlohmann::json simulation_results_to_json(const SimulationResults& results,
                                          bool include_distribution = false);

// Full report of a raw risk-set run: metadata, percentiles and intervals for
// both dimensions, expected values and the top contributors
nlohmann::json simulation_report_to_json(const SimulationResults& results,
                                         const std::vector<double>& confidence_levels,
                                         size_t top_n);

void write_json(std::ostream& os, const nlohmann::json& document, bool pretty_print = true);

// Throws std::runtime_error if the file cannot be opened
void write_json(const std::string& filepath, const nlohmann::json& document, bool pretty_print = true);

} // namespace io
} // namespace riskcalc

#endif // RISKCALC_IO_JSON_WRITER_HPP
