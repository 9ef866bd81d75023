#ifndef RISKCALC_RISK_HPP
#define RISKCALC_RISK_HPP

#include "distribution.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace riskcalc {

enum class RiskCategory : uint8_t {
    Cost = 0,
    Schedule = 1,
    Resource = 2,
    Other = 3
};

// Which outcome dimension(s) a risk's draws accumulate into
enum class ImpactType : uint8_t {
    Cost = 0,
    Schedule = 1,
    Both = 2
};

std::string risk_category_to_string(RiskCategory category);
std::string impact_type_to_string(ImpactType type);

// Accepts cost/schedule/resource/other; technical, external, quality and
// regulatory fold into Other. Throws ValidationError otherwise.
RiskCategory parse_risk_category(const std::string& name);
ImpactType parse_impact_type(const std::string& name);

inline bool affects_cost(ImpactType type) {
    return type == ImpactType::Cost || type == ImpactType::Both;
}

inline bool affects_schedule(ImpactType type) {
    return type == ImpactType::Schedule || type == ImpactType::Both;
}

struct MitigationStrategy {
    std::string id;
    std::string name;
    std::string description;
    double cost;                      // >= 0
    double effectiveness;             // fraction of impact removed, [0, 1]
    int implementation_time_days;     // >= 0

    MitigationStrategy(std::string id, std::string name, std::string description,
                       double cost, double effectiveness, int implementation_time_days);

    bool operator==(const MitigationStrategy& other) const;
};

// Immutable risk definition. Modifications always produce a new Risk.
class Risk {
public:
    Risk(std::string id, std::string name, RiskCategory category, ImpactType impact_type,
         ProbabilityDistribution distribution, double baseline_impact,
         std::vector<std::string> correlation_dependencies = {},
         std::vector<MitigationStrategy> mitigation_strategies = {});

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    RiskCategory category() const { return category_; }
    ImpactType impact_type() const { return impact_type_; }
    const ProbabilityDistribution& distribution() const { return distribution_; }
    double baseline_impact() const { return baseline_impact_; }
    const std::vector<std::string>& correlation_dependencies() const { return correlation_dependencies_; }
    const std::vector<MitigationStrategy>& mitigation_strategies() const { return mitigation_strategies_; }

    // Throws ValidationError if no strategy has this id
    const MitigationStrategy& mitigation_strategy(const std::string& strategy_id) const;

    Risk with_distribution(ProbabilityDistribution distribution) const;
    Risk with_baseline_impact(double baseline_impact) const;

    bool operator==(const Risk& other) const;
    bool operator!=(const Risk& other) const { return !(*this == other); }

private:
    std::string id_;
    std::string name_;
    RiskCategory category_;
    ImpactType impact_type_;
    ProbabilityDistribution distribution_;
    double baseline_impact_;
    std::vector<std::string> correlation_dependencies_;
    std::vector<MitigationStrategy> mitigation_strategies_;
};

} // namespace riskcalc

#endif // RISKCALC_RISK_HPP
