#include "risk_reader.hpp"
#include "../errors.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace riskcalc {
namespace io {

namespace {

const json& require(const json& j, const std::string& key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigParseError("Missing field '" + key + "' in " + where);
    }
    return j.at(key);
}

} // anonymous namespace

ProbabilityDistribution read_distribution(const json& j) {
    DistributionType type = parse_distribution_type(require(j, "type", "distribution").get<std::string>());

    ProbabilityDistribution::Parameters parameters;
    for (const auto& item : require(j, "parameters", "distribution").items()) {
        parameters[item.key()] = item.value().get<double>();
    }

    std::optional<Bounds> bounds;
    if (j.contains("bounds") && !j["bounds"].is_null()) {
        const json& b = j["bounds"];
        if (!b.is_array() || b.size() != 2) {
            throw ConfigParseError("Distribution bounds must be a [lower, upper] pair");
        }
        bounds = Bounds{b[0].get<double>(), b[1].get<double>()};
    }

    return ProbabilityDistribution(type, std::move(parameters), bounds);
}

Risk read_risk(const json& j) {
    std::string id = require(j, "id", "risk").get<std::string>();
    std::string where = "risk '" + id + "'";

    std::vector<std::string> dependencies;
    if (j.contains("correlation_dependencies")) {
        dependencies = j["correlation_dependencies"].get<std::vector<std::string>>();
    }

    std::vector<MitigationStrategy> strategies;
    if (j.contains("mitigation_strategies")) {
        for (const auto& s : j["mitigation_strategies"]) {
            strategies.emplace_back(
                require(s, "id", "mitigation strategy").get<std::string>(),
                s.value("name", ""),
                s.value("description", ""),
                require(s, "cost", "mitigation strategy").get<double>(),
                require(s, "effectiveness", "mitigation strategy").get<double>(),
                s.value("implementation_time_days", 0));
        }
    }

    return Risk(id,
                require(j, "name", where).get<std::string>(),
                parse_risk_category(j.value("category", "other")),
                parse_impact_type(require(j, "impact_type", where).get<std::string>()),
                read_distribution(require(j, "distribution", where)),
                j.value("baseline_impact", 0.0),
                std::move(dependencies),
                std::move(strategies));
}

RiskSet read_risk_set(const json& document) {
    RiskSet set;
    try {
        for (const auto& r : require(document, "risks", "risk set")) {
            set.risks.push_back(read_risk(r));
        }

        if (document.contains("correlations")) {
            std::vector<CorrelationEntry> entries;
            for (const auto& c : document["correlations"]) {
                entries.push_back({
                    require(c, "a", "correlation").get<std::string>(),
                    require(c, "b", "correlation").get<std::string>(),
                    require(c, "coefficient", "correlation").get<double>()
                });
            }
            set.correlations = CorrelationMatrix(entries);
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }
    return set;
}

RiskSet read_risk_set_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open risk file: " + filepath);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return read_risk_set(document);
}

} // namespace io
} // namespace riskcalc
