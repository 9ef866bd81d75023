#include "risk.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace riskcalc {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), 
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

// ============================================================================
// Enum helpers
// ============================================================================

std::string risk_category_to_string(RiskCategory category) {
    switch (category) {
        case RiskCategory::Cost: return "cost";
        case RiskCategory::Schedule: return "schedule";
        case RiskCategory::Resource: return "resource";
        case RiskCategory::Other: return "other";
    }
    return "other";
}

std::string impact_type_to_string(ImpactType type) {
    switch (type) {
        case ImpactType::Cost: return "cost";
        case ImpactType::Schedule: return "schedule";
        case ImpactType::Both: return "both";
    }
    return "both";
}

RiskCategory parse_risk_category(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "cost") return RiskCategory::Cost;
    if (lower == "schedule") return RiskCategory::Schedule;
    if (lower == "resource") return RiskCategory::Resource;
    if (lower == "other" || lower == "technical" || lower == "external" ||
        lower == "quality" || lower == "regulatory") {
        return RiskCategory::Other;
    }
    throw ValidationError("Unknown risk category: '" + name + "'");
}

ImpactType parse_impact_type(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "cost") return ImpactType::Cost;
    if (lower == "schedule") return ImpactType::Schedule;
    if (lower == "both") return ImpactType::Both;
    throw ValidationError("Unknown impact type: '" + name + "'");
}

// ============================================================================
// MitigationStrategy Implementation
// ============================================================================

MitigationStrategy::MitigationStrategy(std::string id_, std::string name_, std::string description_,
                                       double cost_, double effectiveness_, int implementation_time_days_)
    : id(std::move(id_)),
      name(std::move(name_)),
      description(std::move(description_)),
      cost(cost_),
      effectiveness(effectiveness_),
      implementation_time_days(implementation_time_days_)
{
    if (id.empty()) {
        throw ValidationError("Mitigation strategy id must not be empty");
    }
    if (!std::isfinite(cost) || cost < 0.0) {
        throw ValidationError("Mitigation strategy '" + id + "' cost must be non-negative");
    }
    if (!(effectiveness >= 0.0 && effectiveness <= 1.0)) {
        throw ValidationError("Mitigation strategy '" + id + "' effectiveness must lie in [0, 1]");
    }
    if (implementation_time_days < 0) {
        throw ValidationError("Mitigation strategy '" + id +
                              "' implementation_time_days must be non-negative");
    }
}

bool MitigationStrategy::operator==(const MitigationStrategy& other) const {
    return id == other.id && name == other.name && description == other.description &&
           cost == other.cost && effectiveness == other.effectiveness &&
           implementation_time_days == other.implementation_time_days;
}

// ============================================================================
// Risk Implementation
// ============================================================================

Risk::Risk(std::string id, std::string name, RiskCategory category, ImpactType impact_type,
           ProbabilityDistribution distribution, double baseline_impact,
           std::vector<std::string> correlation_dependencies,
           std::vector<MitigationStrategy> mitigation_strategies)
    : id_(std::move(id)),
      name_(std::move(name)),
      category_(category),
      impact_type_(impact_type),
      distribution_(std::move(distribution)),
      baseline_impact_(baseline_impact),
      correlation_dependencies_(std::move(correlation_dependencies)),
      mitigation_strategies_(std::move(mitigation_strategies))
{
    if (id_.empty()) {
        throw ValidationError("Risk id must not be empty");
    }
    if (name_.empty()) {
        throw ValidationError("Risk '" + id_ + "' name must not be empty");
    }
    if (!std::isfinite(baseline_impact_)) {
        throw ValidationError("Risk '" + id_ + "' baseline_impact must be finite");
    }
}

const MitigationStrategy& Risk::mitigation_strategy(const std::string& strategy_id) const {
    for (const auto& strategy : mitigation_strategies_) {
        if (strategy.id == strategy_id) {
            return strategy;
        }
    }
    throw ValidationError("Risk '" + id_ + "' has no mitigation strategy '" + strategy_id + "'");
}

Risk Risk::with_distribution(ProbabilityDistribution distribution) const {
    Risk copy = *this;
    copy.distribution_ = std::move(distribution);
    return copy;
}

Risk Risk::with_baseline_impact(double baseline_impact) const {
    return Risk(id_, name_, category_, impact_type_, distribution_, baseline_impact,
                correlation_dependencies_, mitigation_strategies_);
}

bool Risk::operator==(const Risk& other) const {
    return id_ == other.id_ &&
           name_ == other.name_ &&
           category_ == other.category_ &&
           impact_type_ == other.impact_type_ &&
           distribution_ == other.distribution_ &&
           baseline_impact_ == other.baseline_impact_ &&
           correlation_dependencies_ == other.correlation_dependencies_ &&
           mitigation_strategies_ == other.mitigation_strategies_;
}

} // namespace riskcalc
