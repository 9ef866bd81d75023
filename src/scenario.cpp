#include "scenario.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace riskcalc {

namespace {

std::string generate_scenario_id() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << "scn-" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
    return oss.str();
}

Risk apply_modification(const Risk& risk, const RiskModification& modification) {
    Risk result = risk;

    if (!modification.parameter_changes.empty() || modification.distribution_type_change) {
        result = result.with_distribution(risk.distribution().with_parameters(
            modification.parameter_changes, modification.distribution_type_change));
    }

    if (modification.mitigation_strategy_id) {
        const MitigationStrategy& strategy = risk.mitigation_strategy(*modification.mitigation_strategy_id);
        result = scale_by_mitigation(result, strategy);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Scenario Implementation
// ============================================================================

const Risk& Scenario::risk(const std::string& risk_id) const {
    for (const auto& r : risks) {
        if (r.id() == risk_id) {
            return r;
        }
    }
    throw std::out_of_range("Scenario '" + name + "' has no risk '" + risk_id + "'");
}

Scenario create_scenario(const std::vector<Risk>& base_risks,
                         const ModificationMap& modifications,
                         const std::string& name,
                         const std::string& description)
{
    if (name.empty()) {
        throw ValidationError("Scenario name must not be empty");
    }

    std::set<std::string> ids;
    for (const auto& risk : base_risks) {
        ids.insert(risk.id());
    }
    for (const auto& [risk_id, modification] : modifications) {
        if (ids.count(risk_id) == 0) {
            throw ValidationError("Modification references non-existent risk: " + risk_id);
        }
    }

    Scenario scenario;
    scenario.id = generate_scenario_id();
    scenario.name = name;
    scenario.description = description;
    scenario.modifications = modifications;
    scenario.risks.reserve(base_risks.size());

    for (const auto& risk : base_risks) {
        auto it = modifications.find(risk.id());
        if (it == modifications.end()) {
            scenario.risks.push_back(risk);
        } else {
            scenario.risks.push_back(apply_modification(risk, it->second));
        }
    }
    return scenario;
}

Scenario create_baseline_scenario(const std::vector<Risk>& risks, const std::string& name) {
    return create_scenario(risks, {}, name, "Baseline scenario with original risk parameters");
}

Scenario create_mitigated_scenario(const std::vector<Risk>& risks,
                                   const std::map<std::string, std::string>& mitigation_plan,
                                   const std::string& name,
                                   const std::string& description)
{
    ModificationMap modifications;
    for (const auto& [risk_id, strategy_id] : mitigation_plan) {
        RiskModification modification;
        modification.mitigation_applied = true;
        modification.mitigation_strategy_id = strategy_id;
        modifications.emplace(risk_id, std::move(modification));
    }
    return create_scenario(risks, modifications, name, description);
}

Risk scale_risk_impact(const Risk& risk, double factor) {
    Risk scaled = risk.with_baseline_impact(risk.baseline_impact() * factor);

    const ProbabilityDistribution& dist = risk.distribution();
    switch (dist.type()) {
        case DistributionType::Triangular:
            return scaled.with_distribution(dist.with_parameters({
                {"min", dist.parameter("min") * factor},
                {"mode", dist.parameter("mode") * factor},
                {"max", dist.parameter("max") * factor}}));
        case DistributionType::Uniform:
            return scaled.with_distribution(dist.with_parameters({
                {"min", dist.parameter("min") * factor},
                {"max", dist.parameter("max") * factor}}));
        default:
            return scaled;
    }
}

Risk scale_by_mitigation(const Risk& risk, const MitigationStrategy& strategy) {
    return scale_risk_impact(risk, 1.0 - strategy.effectiveness);
}

// ============================================================================
// Mitigation evaluation
// ============================================================================

MitigationAnalysis evaluate_mitigation(const SimulationResults& baseline_results,
                                       const SimulationResults& mitigated_results,
                                       const MitigationStrategy& strategy,
                                       OutcomeType outcome)
{
    PercentileAnalysis before = calculate_percentiles(baseline_results, outcome);
    PercentileAnalysis after = calculate_percentiles(mitigated_results, outcome);

    MitigationAnalysis analysis;
    analysis.strategy_id = strategy.id;
    analysis.outcome = outcome;
    analysis.baseline_expected = before.mean;
    analysis.mitigated_expected = after.mean;
    analysis.risk_reduction = before.mean - after.mean;
    analysis.p90_reduction = before.at(90) - after.at(90);
    analysis.net_value = analysis.risk_reduction - strategy.cost;
    analysis.cost_benefit_ratio = analysis.risk_reduction > 0.0
        ? strategy.cost / analysis.risk_reduction
        : std::numeric_limits<double>::infinity();
    analysis.return_on_investment = strategy.cost > 0.0
        ? analysis.net_value / strategy.cost
        : std::numeric_limits<double>::infinity();
    return analysis;
}

std::vector<MitigationAnalysis> compare_mitigation_strategies(
    const Scenario& base,
    const std::string& risk_id,
    size_t iterations,
    std::optional<uint64_t> seed,
    OutcomeType outcome)
{
    auto target = std::find_if(base.risks.begin(), base.risks.end(),
                               [&risk_id](const Risk& r) { return r.id() == risk_id; });
    if (target == base.risks.end()) {
        throw ValidationError("Risk " + risk_id + " not found in scenario '" + base.name + "'");
    }

    std::vector<MitigationAnalysis> analyses;
    if (target->mitigation_strategies().empty()) {
        return analyses;
    }

    SimulationResults baseline = run_simulation(base.risks, iterations, nullptr, seed);
    for (const auto& strategy : target->mitigation_strategies()) {
        Scenario mitigated = create_mitigated_scenario(base.risks, {{risk_id, strategy.id}},
                                                       base.name + " + " + strategy.name);
        SimulationResults results = run_simulation(mitigated.risks, iterations, nullptr, baseline.seed());
        analyses.push_back(evaluate_mitigation(baseline, results, strategy, outcome));
    }

    std::stable_sort(analyses.begin(), analyses.end(),
                     [](const MitigationAnalysis& a, const MitigationAnalysis& b) {
                         return a.return_on_investment > b.return_on_investment;
                     });
    return analyses;
}

// ============================================================================
// Sensitivity
// ============================================================================

namespace {

Scenario impact_scaled_scenario(const Scenario& base, const std::string& risk_id,
                                double factor, double new_impact, const std::string& name) {
    Scenario scenario;
    scenario.id = generate_scenario_id();
    scenario.name = name;
    std::ostringstream description;
    description << "Sensitivity scenario with " << risk_id << " impact = " << new_impact;
    scenario.description = description.str();
    scenario.risks.reserve(base.risks.size());
    for (const auto& risk : base.risks) {
        scenario.risks.push_back(risk.id() == risk_id ? scale_risk_impact(risk, factor) : risk);
    }
    return scenario;
}

std::vector<const SensitivityResult*> by_sensitivity(const std::vector<SensitivityResult>& results) {
    std::vector<const SensitivityResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& r : results) {
        ordered.push_back(&r);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SensitivityResult* a, const SensitivityResult* b) {
                         return std::fabs(a->sensitivity_ratio) > std::fabs(b->sensitivity_ratio);
                     });
    return ordered;
}

} // anonymous namespace

std::vector<SensitivityResult> perform_sensitivity_analysis(
    const Scenario& base,
    const std::vector<std::string>& risk_ids,
    double variation_range)
{
    if (!(variation_range > 0.0 && variation_range <= 1.0)) {
        throw ValidationError("Variation range must be in (0, 1], got " + std::to_string(variation_range));
    }

    std::vector<SensitivityResult> results;
    for (const auto& risk_id : risk_ids) {
        auto target = std::find_if(base.risks.begin(), base.risks.end(),
                                   [&risk_id](const Risk& r) { return r.id() == risk_id; });
        if (target == base.risks.end()) {
            continue;
        }

        double baseline = target->baseline_impact();
        double low = baseline * (1.0 - variation_range);
        double high = baseline * (1.0 + variation_range);

        SensitivityResult result{
            risk_id,
            baseline,
            low,
            high,
            variation_range,
            high - low,
            baseline != 0.0 ? (high - low) / baseline : 0.0,
            impact_scaled_scenario(base, risk_id, 1.0 - variation_range, low, risk_id + "_low"),
            impact_scaled_scenario(base, risk_id, 1.0 + variation_range, high, risk_id + "_high")
        };
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<HighImpactParameter> identify_high_impact_parameters(
    const std::vector<SensitivityResult>& results,
    double threshold)
{
    std::vector<HighImpactParameter> high_impact;
    for (const SensitivityResult* r : by_sensitivity(results)) {
        double magnitude = std::fabs(r->sensitivity_ratio);
        if (magnitude < threshold) {
            continue;
        }
        high_impact.push_back({r->risk_id, r->sensitivity_ratio, r->baseline_value, r->absolute_change,
                               magnitude >= 0.5 ? ImpactLevel::High : ImpactLevel::Medium});
    }
    return high_impact;
}

TornadoData generate_tornado_diagram_data(const std::vector<SensitivityResult>& results) {
    std::vector<const SensitivityResult*> ordered = by_sensitivity(results);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SensitivityResult* a, const SensitivityResult* b) {
                         return std::fabs(a->absolute_change) > std::fabs(b->absolute_change);
                     });

    TornadoData data;
    for (const SensitivityResult* r : ordered) {
        data.variables.push_back(r->risk_id);
        data.low_values.push_back(r->low_value);
        data.high_values.push_back(r->high_value);
        data.ranges.push_back(r->absolute_change);
        data.baseline_values.push_back(r->baseline_value);
    }
    return data;
}

} // namespace riskcalc
