#ifndef RISKCALC_RISK_READER_HPP
#define RISKCALC_RISK_READER_HPP

#include "../correlation.hpp"
#include "../risk.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskcalc {
namespace io {

// Risk set document:
//   {
//     "risks": [{"id", "name", "category", "impact_type", "baseline_impact",
//                "distribution": {"type", "parameters": {...}, "bounds": [lo, hi]},
//                "correlation_dependencies": [...],
//                "mitigation_strategies": [{"id", "name", "description", "cost",
//                                           "effectiveness", "implementation_time_days"}]}],
//     "correlations": [{"a", "b", "coefficient"}]
//   }
struct RiskSet {
    std::vector<Risk> risks;
    CorrelationMatrix correlations;   // empty when the document has none
};

// Throws ConfigParseError on malformed JSON or missing fields and
// ValidationError on invalid values
RiskSet read_risk_set(const nlohmann::json& document);
RiskSet read_risk_set_from_file(const std::string& filepath);

ProbabilityDistribution read_distribution(const nlohmann::json& j);
Risk read_risk(const nlohmann::json& j);

} // namespace io
} // namespace riskcalc

#endif // RISKCALC_RISK_READER_HPP
