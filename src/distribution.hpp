#ifndef RISKCALC_DISTRIBUTION_HPP
#define RISKCALC_DISTRIBUTION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace riskcalc {

// Closed set of supported families. Adding a family means adding a case to
// validation, sampling, quantile and mean in distribution.cpp.
enum class DistributionType : uint8_t {
    Normal = 0,      // {mean, std}
    Triangular = 1,  // {min, mode, max}
    Uniform = 2,     // {min, max}
    Lognormal = 3,   // {mu, sigma}
    Beta = 4,        // {alpha, beta}
    Custom = 5       // piecewise-linear quantile curve {p0, ..., p100}
};

std::string distribution_type_to_string(DistributionType type);

// Throws ValidationError for unknown names
DistributionType parse_distribution_type(const std::string& name);

// Hard clip applied to every draw
struct Bounds {
    double lower;
    double upper;

    bool operator==(const Bounds& other) const {
        return lower == other.lower && upper == other.upper;
    }
};

// Parametric probability distribution over a risk impact.
// Parameters are validated once at construction; a constructed object always
// samples successfully. Immutable: with_parameters() returns a new object.
class ProbabilityDistribution {
public:
    using Parameters = std::map<std::string, double>;

    ProbabilityDistribution(DistributionType type, Parameters parameters,
                            std::optional<Bounds> bounds = std::nullopt);

    // Convenience factories
    static ProbabilityDistribution normal(double mean, double std_dev);
    static ProbabilityDistribution triangular(double min, double mode, double max);
    static ProbabilityDistribution uniform(double min, double max);
    static ProbabilityDistribution lognormal(double mu, double sigma);

    DistributionType type() const { return type_; }
    const Parameters& parameters() const { return parameters_; }
    const std::optional<Bounds>& bounds() const { return bounds_; }

    // Throws std::out_of_range if the parameter is not present
    double parameter(const std::string& name) const;

    // Draw one value / count values
    double sample(std::mt19937_64& rng) const;
    std::vector<double> sample(std::mt19937_64& rng, size_t count) const;

    // Inverse CDF. p must lie in [0, 1]; the open tails of unbounded families
    // are evaluated at a tiny offset from 0 and 1 so the result stays finite.
    double quantile(double p) const;

    // Analytical mean (before bounds are applied)
    double mean() const;

    // New distribution with parameter_changes merged over the current
    // parameters, optionally switching family. Re-validated.
    ProbabilityDistribution with_parameters(
        const Parameters& parameter_changes,
        std::optional<DistributionType> new_type = std::nullopt) const;

    bool operator==(const ProbabilityDistribution& other) const;
    bool operator!=(const ProbabilityDistribution& other) const { return !(*this == other); }

private:
    DistributionType type_;
    Parameters parameters_;
    std::optional<Bounds> bounds_;

    // Sorted (probability, value) knots, only populated for Custom
    std::vector<std::pair<double, double>> knots_;

    void validate();
    double require(const std::string& name) const;
    double clip(double value) const;
    double custom_quantile(double p) const;
};

} // namespace riskcalc

#endif // RISKCALC_DISTRIBUTION_HPP
