#include "simulation.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

namespace riskcalc {

// ============================================================================
// ConvergenceMetrics / SimulationResults Implementation
// ============================================================================

ConvergenceMetrics::ConvergenceMetrics()
    : mean_stability(0.0),
      variance_stability(0.0),
      converged(false) {}

SimulationResults::SimulationResults(std::string simulation_id,
                                     std::chrono::system_clock::time_point timestamp,
                                     size_t iteration_count,
                                     double execution_time_seconds,
                                     std::vector<double> cost_outcomes,
                                     std::vector<double> schedule_outcomes,
                                     std::vector<RiskImpactSeries> risk_contributions,
                                     ConvergenceMetrics convergence,
                                     uint64_t seed,
                                     bool correlation_adjusted)
    : simulation_id_(std::move(simulation_id)),
      timestamp_(timestamp),
      iteration_count_(iteration_count),
      execution_time_(execution_time_seconds),
      cost_outcomes_(std::move(cost_outcomes)),
      schedule_outcomes_(std::move(schedule_outcomes)),
      risk_contributions_(std::move(risk_contributions)),
      convergence_(std::move(convergence)),
      seed_(seed),
      correlation_adjusted_(correlation_adjusted)
{
    if (cost_outcomes_.size() != iteration_count_ || schedule_outcomes_.size() != iteration_count_) {
        throw std::invalid_argument("Outcome arrays must have one entry per iteration");
    }
}

std::string SimulationResults::timestamp_string() const {
    auto time_t_value = std::chrono::system_clock::to_time_t(timestamp_);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

const RiskImpactSeries& SimulationResults::contribution(const std::string& risk_id) const {
    for (const auto& series : risk_contributions_) {
        if (series.risk_id == risk_id) {
            return series;
        }
    }
    throw std::out_of_range("No contribution recorded for risk '" + risk_id + "'");
}

namespace {

constexpr double CONVERGENCE_THRESHOLD = 0.95;
constexpr size_t STABILITY_WINDOW = 10;

// 1 - min(CV, 1) over the last STABILITY_WINDOW entries of history
double window_stability(const std::vector<double>& history) {
    if (history.size() < 2) {
        return 0.0;
    }
    size_t start = history.size() > STABILITY_WINDOW ? history.size() - STABILITY_WINDOW : 0;
    std::vector<double> window(history.begin() + static_cast<std::ptrdiff_t>(start), history.end());
    double m = stats::mean(window);
    double sd = stats::std_dev(window, m);
    if (sd == 0.0) {
        return 1.0;
    }
    if (m == 0.0) {
        return 0.0;
    }
    return 1.0 - std::min(sd / std::fabs(m), 1.0);
}

constexpr size_t PERCENTILE_RESERVOIR_SIZE = 10000;

// Running statistics of one outcome dimension sampled at checkpoints.
// Mean and variance accumulate with Welford's update; percentiles come from a
// uniform reservoir of the prefix, exact while the prefix fits in it.
class ConvergenceTracker {
public:
    explicit ConvergenceTracker(uint64_t seed) : rng_(seed ^ 0x9e3779b97f4a7c15ULL) {
        reservoir_.reserve(PERCENTILE_RESERVOIR_SIZE);
    }

    void update(const std::vector<double>& outcomes, size_t count) {
        for (; seen_ < count; ++seen_) {
            double x = outcomes[seen_];
            double delta = x - running_mean_;
            running_mean_ += delta / static_cast<double>(seen_ + 1);
            m2_ += delta * (x - running_mean_);

            if (reservoir_.size() < PERCENTILE_RESERVOIR_SIZE) {
                reservoir_.push_back(x);
            } else {
                std::uniform_int_distribution<size_t> slot(0, seen_);
                size_t j = slot(rng_);
                if (j < PERCENTILE_RESERVOIR_SIZE) {
                    reservoir_[j] = x;
                }
            }
        }

        means_.push_back(running_mean_);
        variances_.push_back(count > 1 ? m2_ / static_cast<double>(count - 1) : 0.0);

        std::vector<double> sorted(reservoir_);
        std::sort(sorted.begin(), sorted.end());
        for (double p : {10.0, 50.0, 90.0}) {
            percentile_history_[p].push_back(stats::percentile(sorted, p));
        }

        if (!first_stable_checkpoint_ && means_.size() >= 3 &&
            window_stability(means_) > CONVERGENCE_THRESHOLD &&
            window_stability(variances_) > CONVERGENCE_THRESHOLD) {
            first_stable_checkpoint_ = count;
        }
    }

    ConvergenceMetrics finalize() const {
        ConvergenceMetrics metrics;
        metrics.mean_stability = window_stability(means_);
        metrics.variance_stability = window_stability(variances_);

        bool percentiles_stable = true;
        for (const auto& [p, history] : percentile_history_) {
            double stability = window_stability(history);
            metrics.percentile_stability[p] = stability;
            if (stability <= CONVERGENCE_THRESHOLD) {
                percentiles_stable = false;
            }
        }

        metrics.converged = !means_.empty() &&
                            metrics.mean_stability > CONVERGENCE_THRESHOLD &&
                            metrics.variance_stability > CONVERGENCE_THRESHOLD &&
                            percentiles_stable;
        if (metrics.converged) {
            metrics.iterations_to_convergence = first_stable_checkpoint_;
        }
        return metrics;
    }

private:
    std::mt19937_64 rng_;
    size_t seen_ = 0;
    double running_mean_ = 0.0;
    double m2_ = 0.0;
    std::vector<double> reservoir_;

    std::vector<double> means_;
    std::vector<double> variances_;
    std::map<double, std::vector<double>> percentile_history_;
    std::optional<size_t> first_stable_checkpoint_;
};

std::string generate_simulation_id() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << "sim-" << std::hex << std::setfill('0')
        << std::setw(16) << dist(gen) << std::setw(16) << dist(gen);
    return oss.str();
}

void check_preconditions(const std::vector<Risk>& risks, size_t iterations,
                         const CorrelationMatrix* correlations) {
    if (risks.empty()) {
        throw PreconditionError("At least one risk must be provided");
    }
    if (iterations < MIN_ITERATIONS) {
        throw PreconditionError("Minimum " + std::to_string(MIN_ITERATIONS) +
                                " iterations required, got " + std::to_string(iterations));
    }

    std::set<std::string> ids;
    for (const auto& risk : risks) {
        if (!ids.insert(risk.id()).second) {
            throw PreconditionError("Duplicate risk id: " + risk.id());
        }
    }

    if (correlations) {
        for (const auto& id : correlations->risk_ids()) {
            if (ids.count(id) == 0) {
                throw PreconditionError("Correlation matrix references unknown risk: " + id);
            }
        }
    }
}

} // anonymous namespace

// ============================================================================
// Parameter validation
// ============================================================================

ValidationReport validate_simulation_parameters(const std::vector<Risk>& risks, size_t iterations) {
    ValidationReport report;

    if (iterations < MIN_ITERATIONS) {
        report.errors.push_back("Minimum " + std::to_string(MIN_ITERATIONS) +
                                " iterations required, got " + std::to_string(iterations));
    }
    if (risks.empty()) {
        report.errors.push_back("At least one risk must be provided");
    }

    std::set<std::string> ids;
    for (const auto& risk : risks) {
        if (!ids.insert(risk.id()).second) {
            report.errors.push_back("Duplicate risk ID: " + risk.id());
        }
        const auto& dist = risk.distribution();
        if (!std::isfinite(dist.quantile(0.5))) {
            report.errors.push_back("Risk " + risk.id() + " produces non-finite samples");
        }
    }

    if (iterations > 100000) {
        report.warnings.push_back("Large iteration count may impact performance");
    }
    if (risks.size() > 100) {
        report.warnings.push_back("Large number of risks may impact performance");
    }
    if (iterations < 50000) {
        report.recommendations.push_back("Consider using 50,000+ iterations for better statistical accuracy");
    }

    report.is_valid = report.errors.empty();
    return report;
}

// ============================================================================
// Simulation Implementation
// ============================================================================

SimulationResults run_simulation(
    const std::vector<Risk>& risks,
    size_t iterations,
    const CorrelationMatrix* correlations,
    std::optional<uint64_t> random_seed)
{
    check_preconditions(risks, iterations, correlations);

    auto start_time = std::chrono::high_resolution_clock::now();

    // Factor the correlation structure before drawing anything so a
    // NumericalError leaves no partial state behind
    std::optional<CorrelatedSampler> sampler;
    if (correlations && !correlations->empty()) {
        std::vector<std::string> ordered_ids;
        std::vector<ProbabilityDistribution> marginals;
        ordered_ids.reserve(risks.size());
        marginals.reserve(risks.size());
        for (const auto& risk : risks) {
            ordered_ids.push_back(risk.id());
            marginals.push_back(risk.distribution());
        }
        sampler.emplace(std::move(marginals), correlations->to_dense(ordered_ids));
    }

    uint64_t seed = 0;
    if (random_seed) {
        seed = *random_seed;
    } else {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }
    std::mt19937_64 rng(seed);
    ConvergenceTracker tracker(seed);

    std::vector<double> cost_outcomes(iterations, 0.0);
    std::vector<double> schedule_outcomes(iterations, 0.0);
    std::vector<RiskImpactSeries> contributions;
    contributions.reserve(risks.size());
    for (const auto& risk : risks) {
        contributions.push_back({risk.id(), risk.name(), risk.impact_type(),
                                 std::vector<double>(iterations, 0.0)});
    }

    // Convergence is tracked on cost unless no risk touches cost
    bool track_cost = std::any_of(risks.begin(), risks.end(),
                                  [](const Risk& r) { return affects_cost(r.impact_type()); });
    const std::vector<double>& tracked = track_cost ? cost_outcomes : schedule_outcomes;

    std::vector<double> draws(risks.size(), 0.0);
    for (size_t i = 0; i < iterations; ++i) {
        if (sampler) {
            sampler->draw(rng, draws);
        } else {
            for (size_t r = 0; r < risks.size(); ++r) {
                draws[r] = risks[r].distribution().sample(rng);
            }
        }

        double cost = 0.0;
        double schedule = 0.0;
        for (size_t r = 0; r < risks.size(); ++r) {
            double impact = draws[r];
            if (!std::isfinite(impact)) {
                throw NumericalError("Risk '" + risks[r].id() + "' produced a non-finite draw at iteration " +
                                     std::to_string(i));
            }
            contributions[r].impacts[i] = impact;
            ImpactType type = risks[r].impact_type();
            if (affects_cost(type)) {
                cost += impact;
            }
            if (affects_schedule(type)) {
                schedule += impact;
            }
        }
        if (!std::isfinite(cost) || !std::isfinite(schedule)) {
            throw NumericalError("Aggregated outcome overflowed at iteration " + std::to_string(i));
        }
        cost_outcomes[i] = cost;
        schedule_outcomes[i] = schedule;

        if (i > 0 && (i + 1) % CONVERGENCE_CHECKPOINT_INTERVAL == 0) {
            tracker.update(tracked, i + 1);
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double execution_time = std::chrono::duration<double>(end_time - start_time).count();

    return SimulationResults(
        generate_simulation_id(),
        std::chrono::system_clock::now(),
        iterations,
        execution_time,
        std::move(cost_outcomes),
        std::move(schedule_outcomes),
        std::move(contributions),
        tracker.finalize(),
        seed,
        sampler ? sampler->adjusted() : false
    );
}

} // namespace riskcalc
