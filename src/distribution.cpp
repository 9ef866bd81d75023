#include "distribution.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/lognormal.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/triangular.hpp>
#include <boost/math/distributions/uniform.hpp>

namespace riskcalc {

namespace {

// Distance from 0 and 1 at which the unbounded tails are evaluated
constexpr double TAIL_EPSILON = 1e-12;

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Parse a custom knot name "p<k>" into k/100; returns false if not a knot
bool parse_knot_name(const std::string& name, double& probability) {
    if (name.size() < 2 || name[0] != 'p') {
        return false;
    }
    try {
        size_t consumed = 0;
        double percent = std::stod(name.substr(1), &consumed);
        if (consumed != name.size() - 1) {
            return false;
        }
        if (percent < 0.0 || percent > 100.0) {
            return false;
        }
        probability = percent / 100.0;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

// ============================================================================
// DistributionType helpers
// ============================================================================

std::string distribution_type_to_string(DistributionType type) {
    switch (type) {
        case DistributionType::Normal: return "normal";
        case DistributionType::Triangular: return "triangular";
        case DistributionType::Uniform: return "uniform";
        case DistributionType::Lognormal: return "lognormal";
        case DistributionType::Beta: return "beta";
        case DistributionType::Custom: return "custom";
    }
    return "unknown";
}

DistributionType parse_distribution_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), 
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "normal") return DistributionType::Normal;
    if (lower == "triangular") return DistributionType::Triangular;
    if (lower == "uniform") return DistributionType::Uniform;
    if (lower == "lognormal") return DistributionType::Lognormal;
    if (lower == "beta") return DistributionType::Beta;
    if (lower == "custom") return DistributionType::Custom;

    throw ValidationError("Unsupported distribution type: '" + name + "'");
}

// ============================================================================
// ProbabilityDistribution Implementation
// ============================================================================

ProbabilityDistribution::ProbabilityDistribution(DistributionType type,
                                                 Parameters parameters,
                                                 std::optional<Bounds> bounds)
    : type_(type), parameters_(std::move(parameters)), bounds_(bounds) {
    validate();
}

ProbabilityDistribution ProbabilityDistribution::normal(double mean, double std_dev) {
    return ProbabilityDistribution(DistributionType::Normal,
                                   {{"mean", mean}, {"std", std_dev}});
}

ProbabilityDistribution ProbabilityDistribution::triangular(double min, double mode, double max) {
    return ProbabilityDistribution(DistributionType::Triangular,
                                   {{"min", min}, {"mode", mode}, {"max", max}});
}

ProbabilityDistribution ProbabilityDistribution::uniform(double min, double max) {
    return ProbabilityDistribution(DistributionType::Uniform,
                                   {{"min", min}, {"max", max}});
}

ProbabilityDistribution ProbabilityDistribution::lognormal(double mu, double sigma) {
    return ProbabilityDistribution(DistributionType::Lognormal,
                                   {{"mu", mu}, {"sigma", sigma}});
}

double ProbabilityDistribution::parameter(const std::string& name) const {
    auto it = parameters_.find(name);
    if (it == parameters_.end()) {
        throw std::out_of_range("Distribution has no parameter '" + name + "'");
    }
    return it->second;
}

double ProbabilityDistribution::require(const std::string& name) const {
    auto it = parameters_.find(name);
    if (it == parameters_.end()) {
        throw ValidationError(distribution_type_to_string(type_) +
                              " distribution requires '" + name + "' parameter");
    }
    return it->second;
}

void ProbabilityDistribution::validate() {
    const std::string family = distribution_type_to_string(type_);

    for (const auto& [name, value] : parameters_) {
        if (!std::isfinite(value)) {
            throw ValidationError(family + " distribution parameter '" + name +
                                  "' must be finite");
        }
    }

    if (bounds_) {
        if (!std::isfinite(bounds_->lower) || !std::isfinite(bounds_->upper)) {
            throw ValidationError("Distribution bounds must be finite");
        }
        if (bounds_->lower > bounds_->upper) {
            throw ValidationError("Distribution lower bound " + format_value(bounds_->lower) +
                                  " exceeds upper bound " + format_value(bounds_->upper));
        }
    }

    switch (type_) {
        case DistributionType::Normal: {
            require("mean");
            double std_dev = require("std");
            if (std_dev <= 0.0) {
                throw ValidationError("normal distribution parameter 'std' must be positive, got " +
                                      format_value(std_dev));
            }
            break;
        }
        case DistributionType::Triangular: {
            double min = require("min");
            double mode = require("mode");
            double max = require("max");
            if (min > max) {
                throw ValidationError("triangular distribution parameter 'min' (" + format_value(min) +
                                      ") must not exceed 'max' (" + format_value(max) + ")");
            }
            if (mode < min || mode > max) {
                throw ValidationError("triangular distribution parameter 'mode' (" + format_value(mode) +
                                      ") must lie within [min, max]");
            }
            break;
        }
        case DistributionType::Uniform: {
            double min = require("min");
            double max = require("max");
            if (min > max) {
                throw ValidationError("uniform distribution parameter 'min' (" + format_value(min) +
                                      ") must not exceed 'max' (" + format_value(max) + ")");
            }
            break;
        }
        case DistributionType::Lognormal: {
            require("mu");
            double sigma = require("sigma");
            if (sigma <= 0.0) {
                throw ValidationError("lognormal distribution parameter 'sigma' must be positive, got " +
                                      format_value(sigma));
            }
            break;
        }
        case DistributionType::Beta: {
            double alpha = require("alpha");
            double beta = require("beta");
            if (alpha <= 0.0) {
                throw ValidationError("beta distribution parameter 'alpha' must be positive, got " +
                                      format_value(alpha));
            }
            if (beta <= 0.0) {
                throw ValidationError("beta distribution parameter 'beta' must be positive, got " +
                                      format_value(beta));
            }
            break;
        }
        case DistributionType::Custom: {
            knots_.clear();
            for (const auto& [name, value] : parameters_) {
                double probability = 0.0;
                if (!parse_knot_name(name, probability)) {
                    throw ValidationError("custom distribution parameter '" + name +
                                          "' is not a percentile knot (expected p0..p100)");
                }
                knots_.emplace_back(probability, value);
            }
            require("p0");
            require("p100");
            std::sort(knots_.begin(), knots_.end());
            for (size_t i = 1; i < knots_.size(); ++i) {
                if (knots_[i].first == knots_[i - 1].first) {
                    throw ValidationError("custom distribution has duplicate knot at p" +
                                          format_value(knots_[i].first * 100.0));
                }
                if (knots_[i].second < knots_[i - 1].second) {
                    throw ValidationError("custom distribution knot p" +
                                          format_value(knots_[i].first * 100.0) +
                                          " decreases below the previous knot");
                }
            }
            break;
        }
    }
}

double ProbabilityDistribution::clip(double value) const {
    if (!bounds_) {
        return value;
    }
    return std::max(bounds_->lower, std::min(bounds_->upper, value));
}

double ProbabilityDistribution::custom_quantile(double p) const {
    // knots_ spans [0, 1] because p0 and p100 are mandatory
    auto upper = std::lower_bound(
        knots_.begin(), knots_.end(), p,
        [](const std::pair<double, double>& knot, double prob) { return knot.first < prob; });

    if (upper == knots_.begin()) {
        return upper->second;
    }
    if (upper == knots_.end()) {
        return knots_.back().second;
    }
    auto lower = upper - 1;
    double span = upper->first - lower->first;
    double frac = (p - lower->first) / span;
    return lower->second + frac * (upper->second - lower->second);
}

double ProbabilityDistribution::sample(std::mt19937_64& rng) const {
    switch (type_) {
        case DistributionType::Normal: {
            std::normal_distribution<double> dist(parameters_.at("mean"), parameters_.at("std"));
            return clip(dist(rng));
        }
        case DistributionType::Uniform: {
            double min = parameters_.at("min");
            double max = parameters_.at("max");
            if (min == max) {
                return clip(min);
            }
            std::uniform_real_distribution<double> dist(min, max);
            return clip(dist(rng));
        }
        case DistributionType::Lognormal: {
            std::lognormal_distribution<double> dist(parameters_.at("mu"), parameters_.at("sigma"));
            return clip(dist(rng));
        }
        case DistributionType::Beta: {
            // X = G1 / (G1 + G2) with G1 ~ Gamma(alpha), G2 ~ Gamma(beta)
            std::gamma_distribution<double> g1(parameters_.at("alpha"), 1.0);
            std::gamma_distribution<double> g2(parameters_.at("beta"), 1.0);
            double a = g1(rng);
            double b = g2(rng);
            return clip(a / (a + b));
        }
        case DistributionType::Triangular:
        case DistributionType::Custom: {
            std::uniform_real_distribution<double> unit(0.0, 1.0);
            return quantile(unit(rng));
        }
    }
    throw std::logic_error("Unhandled distribution type");
}

std::vector<double> ProbabilityDistribution::sample(std::mt19937_64& rng, size_t count) const {
    std::vector<double> draws;
    draws.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        draws.push_back(sample(rng));
    }
    return draws;
}

double ProbabilityDistribution::quantile(double p) const {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw ValidationError("Quantile probability must lie in [0, 1], got " + format_value(p));
    }

    double tail_p = std::min(1.0 - TAIL_EPSILON, std::max(TAIL_EPSILON, p));

    switch (type_) {
        case DistributionType::Normal: {
            boost::math::normal_distribution<double> dist(parameters_.at("mean"), parameters_.at("std"));
            return clip(boost::math::quantile(dist, tail_p));
        }
        case DistributionType::Triangular: {
            double min = parameters_.at("min");
            double max = parameters_.at("max");
            if (min == max) {
                return clip(min);
            }
            boost::math::triangular_distribution<double> dist(min, parameters_.at("mode"), max);
            return clip(boost::math::quantile(dist, p));
        }
        case DistributionType::Uniform: {
            double min = parameters_.at("min");
            double max = parameters_.at("max");
            if (min == max) {
                return clip(min);
            }
            boost::math::uniform_distribution<double> dist(min, max);
            return clip(boost::math::quantile(dist, p));
        }
        case DistributionType::Lognormal: {
            boost::math::lognormal_distribution<double> dist(parameters_.at("mu"), parameters_.at("sigma"));
            return clip(boost::math::quantile(dist, tail_p));
        }
        case DistributionType::Beta: {
            boost::math::beta_distribution<double> dist(parameters_.at("alpha"), parameters_.at("beta"));
            return clip(boost::math::quantile(dist, p));
        }
        case DistributionType::Custom:
            return clip(custom_quantile(p));
    }
    throw std::logic_error("Unhandled distribution type");
}

double ProbabilityDistribution::mean() const {
    switch (type_) {
        case DistributionType::Normal:
            return parameters_.at("mean");
        case DistributionType::Triangular:
            return (parameters_.at("min") + parameters_.at("mode") + parameters_.at("max")) / 3.0;
        case DistributionType::Uniform:
            return (parameters_.at("min") + parameters_.at("max")) / 2.0;
        case DistributionType::Lognormal: {
            double sigma = parameters_.at("sigma");
            return std::exp(parameters_.at("mu") + 0.5 * sigma * sigma);
        }
        case DistributionType::Beta: {
            double alpha = parameters_.at("alpha");
            return alpha / (alpha + parameters_.at("beta"));
        }
        case DistributionType::Custom: {
            // Integral of the piecewise-linear quantile function over [0, 1]
            double total = 0.0;
            for (size_t i = 1; i < knots_.size(); ++i) {
                double width = knots_[i].first - knots_[i - 1].first;
                total += width * 0.5 * (knots_[i].second + knots_[i - 1].second);
            }
            return total;
        }
    }
    throw std::logic_error("Unhandled distribution type");
}

ProbabilityDistribution ProbabilityDistribution::with_parameters(
    const Parameters& parameter_changes,
    std::optional<DistributionType> new_type) const
{
    Parameters merged = parameters_;
    for (const auto& [name, value] : parameter_changes) {
        merged[name] = value;
    }
    return ProbabilityDistribution(new_type.value_or(type_), std::move(merged), bounds_);
}

bool ProbabilityDistribution::operator==(const ProbabilityDistribution& other) const {
    return type_ == other.type_ &&
           parameters_ == other.parameters_ &&
           bounds_ == other.bounds_;
}

} // namespace riskcalc
