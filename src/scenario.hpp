#ifndef RISKCALC_SCENARIO_HPP
#define RISKCALC_SCENARIO_HPP

#include "results_analyzer.hpp"
#include "risk.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcalc {

// Partial override applied to one risk of a scenario
struct RiskModification {
    ProbabilityDistribution::Parameters parameter_changes;  // merged over the base parameters
    std::optional<DistributionType> distribution_type_change;
    bool mitigation_applied = false;                         // reporting only
    std::optional<std::string> mitigation_strategy_id;       // applied via scale_by_mitigation
};

using ModificationMap = std::map<std::string, RiskModification>;

struct Scenario {
    std::string id;
    std::string name;
    std::string description;
    std::vector<Risk> risks;          // effective post-modification set, base order
    ModificationMap modifications;

    // Throws std::out_of_range for unknown ids
    const Risk& risk(const std::string& risk_id) const;
};

// Build a scenario from base_risks with modifications applied. base_risks is
// never modified; unmodified risks are copied as-is.
// Throws ValidationError when a modification names an unknown risk or
// strategy, when the merged parameters are invalid, or when name is empty.
Scenario create_scenario(const std::vector<Risk>& base_risks,
                         const ModificationMap& modifications,
                         const std::string& name,
                         const std::string& description = "");

Scenario create_baseline_scenario(const std::vector<Risk>& risks,
                                  const std::string& name = "Baseline");

// risk id -> mitigation strategy id
Scenario create_mitigated_scenario(const std::vector<Risk>& risks,
                                   const std::map<std::string, std::string>& mitigation_plan,
                                   const std::string& name,
                                   const std::string& description = "");

// Risk with baseline impact, and triangular/uniform ranges, multiplied by
// factor. Other families keep their distribution.
Risk scale_risk_impact(const Risk& risk, double factor);

// scale_risk_impact by (1 - effectiveness)
Risk scale_by_mitigation(const Risk& risk, const MitigationStrategy& strategy);

struct MitigationAnalysis {
    std::string strategy_id;
    OutcomeType outcome;
    double baseline_expected;         // mean outcome without mitigation
    double mitigated_expected;        // mean outcome with mitigation
    double risk_reduction;            // baseline_expected - mitigated_expected
    double p90_reduction;
    double cost_benefit_ratio;        // cost / risk_reduction, inf if no reduction
    double net_value;                 // risk_reduction - cost
    double return_on_investment;      // net_value / cost, inf if cost == 0
};

MitigationAnalysis evaluate_mitigation(const SimulationResults& baseline_results,
                                       const SimulationResults& mitigated_results,
                                       const MitigationStrategy& strategy,
                                       OutcomeType outcome = OutcomeType::Cost);

// Every strategy of one risk evaluated against the base scenario, best ROI
// first. The baseline and each mitigated run share one seed, so differences
// come from the mitigation and not from sampling noise.
// Throws ValidationError when risk_id is not in the scenario.
std::vector<MitigationAnalysis> compare_mitigation_strategies(
    const Scenario& base,
    const std::string& risk_id,
    size_t iterations = DEFAULT_ITERATIONS,
    std::optional<uint64_t> seed = std::nullopt,
    OutcomeType outcome = OutcomeType::Cost);

// ============================================================================
// Sensitivity
// ============================================================================

/**
 * One risk's impact moved down and up by variation_range around its baseline.
 * The low and high scenarios scale the risk as a mitigation would, so they
 * can be simulated directly.
 */
struct SensitivityResult {
    std::string risk_id;
    double baseline_value;
    double low_value;                 // baseline * (1 - variation_range)
    double high_value;                // baseline * (1 + variation_range)
    double variation_range;
    double absolute_change;           // high_value - low_value
    double sensitivity_ratio;         // absolute_change / baseline_value, 0 for a zero baseline
    Scenario low_scenario;
    Scenario high_scenario;
};

// Ids that match no risk are skipped. Results follow risk_ids order.
// Throws ValidationError unless 0 < variation_range <= 1.
std::vector<SensitivityResult> perform_sensitivity_analysis(
    const Scenario& base,
    const std::vector<std::string>& risk_ids,
    double variation_range = 0.2);

enum class ImpactLevel { Medium, High };

struct HighImpactParameter {
    std::string risk_id;
    double sensitivity_ratio;
    double baseline_value;
    double absolute_change;
    ImpactLevel impact_level;         // High from |ratio| >= 0.5
};

// Results with |sensitivity_ratio| >= threshold, largest |ratio| first
std::vector<HighImpactParameter> identify_high_impact_parameters(
    const std::vector<SensitivityResult>& results,
    double threshold = 0.1);

// Parallel columns of a tornado chart, widest bar (|absolute_change|) first;
// ties keep sensitivity order
struct TornadoData {
    std::vector<std::string> variables;
    std::vector<double> low_values;
    std::vector<double> high_values;
    std::vector<double> ranges;
    std::vector<double> baseline_values;
};

TornadoData generate_tornado_diagram_data(const std::vector<SensitivityResult>& results);

} // namespace riskcalc

#endif // RISKCALC_SCENARIO_HPP
