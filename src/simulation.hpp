#ifndef RISKCALC_SIMULATION_HPP
#define RISKCALC_SIMULATION_HPP

#include "correlation.hpp"
#include "risk.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcalc {

// Minimum iteration count accepted by run_simulation
constexpr size_t MIN_ITERATIONS = 10000;
constexpr size_t DEFAULT_ITERATIONS = 10000;

// Iterations between convergence checkpoints
constexpr size_t CONVERGENCE_CHECKPOINT_INTERVAL = 1000;

// Per-iteration impact of one risk
struct RiskImpactSeries {
    std::string risk_id;
    std::string risk_name;
    ImpactType impact_type;
    std::vector<double> impacts;
};

// Stability of running statistics over the last checkpoints.
// Each stability is 1 - min(CV of the checkpoint history, 1); higher is better.
struct ConvergenceMetrics {
    double mean_stability;
    double variance_stability;
    std::map<double, double> percentile_stability;  // keyed by percentile (10, 50, 90)
    bool converged;                                  // all stabilities > 0.95
    std::optional<size_t> iterations_to_convergence;

    ConvergenceMetrics();
};

// Output of one simulation run. Immutable after construction.
class SimulationResults {
public:
    SimulationResults(std::string simulation_id,
                      std::chrono::system_clock::time_point timestamp,
                      size_t iteration_count,
                      double execution_time_seconds,
                      std::vector<double> cost_outcomes,
                      std::vector<double> schedule_outcomes,
                      std::vector<RiskImpactSeries> risk_contributions,
                      ConvergenceMetrics convergence,
                      uint64_t seed,
                      bool correlation_adjusted);

    const std::string& simulation_id() const { return simulation_id_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }
    size_t iteration_count() const { return iteration_count_; }
    double execution_time() const { return execution_time_; }
    const std::vector<double>& cost_outcomes() const { return cost_outcomes_; }
    const std::vector<double>& schedule_outcomes() const { return schedule_outcomes_; }
    const std::vector<RiskImpactSeries>& risk_contributions() const { return risk_contributions_; }
    const ConvergenceMetrics& convergence() const { return convergence_; }
    uint64_t seed() const { return seed_; }
    bool correlation_adjusted() const { return correlation_adjusted_; }

    // ISO-8601 UTC rendering of timestamp()
    std::string timestamp_string() const;

    // Throws std::out_of_range for unknown ids
    const RiskImpactSeries& contribution(const std::string& risk_id) const;

private:
    std::string simulation_id_;
    std::chrono::system_clock::time_point timestamp_;
    size_t iteration_count_;
    double execution_time_;
    std::vector<double> cost_outcomes_;
    std::vector<double> schedule_outcomes_;
    std::vector<RiskImpactSeries> risk_contributions_;
    ConvergenceMetrics convergence_;
    uint64_t seed_;
    bool correlation_adjusted_;
};

struct ValidationReport {
    bool is_valid;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> recommendations;
};

// Check simulation inputs without running anything
ValidationReport validate_simulation_parameters(const std::vector<Risk>& risks,
                                                size_t iterations = DEFAULT_ITERATIONS);

// Run a Monte Carlo simulation over the given risks.
//
// Per iteration, one impact is drawn per risk (jointly through the
// correlation structure when one is supplied) and accumulated into the cost
// and/or schedule outcome according to the risk's impact type.
//
// Throws PreconditionError before consuming any randomness when risks is
// empty, ids repeat, iterations < MIN_ITERATIONS, or the correlation matrix
// names an unknown risk. Throws NumericalError if a draw is not finite or the
// correlation matrix cannot be factored even after PSD projection.
SimulationResults run_simulation(
    const std::vector<Risk>& risks,
    size_t iterations = DEFAULT_ITERATIONS,
    const CorrelationMatrix* correlations = nullptr,
    std::optional<uint64_t> random_seed = std::nullopt
);

} // namespace riskcalc

#endif // RISKCALC_SIMULATION_HPP
