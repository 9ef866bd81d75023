#ifndef RISKCALC_PROJECT_DATA_HPP
#define RISKCALC_PROJECT_DATA_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskcalc {

// Risk-like record as stored against a project. Only the fields needed to
// derive a distribution are modelled; impact fields are optional.
struct RiskRecord {
    std::string id;
    std::string name;
    std::string category;             // cost, schedule, resource, technical, ...
    std::string impact_type;          // cost, schedule, both
    std::string distribution_type;    // triangular (default), normal, anything else = fallback
    std::optional<double> min_impact;
    std::optional<double> most_likely_impact;
    std::optional<double> max_impact;
    std::optional<double> mean_impact;
    std::optional<double> std_impact;
    double baseline_impact = 0.0;
    std::optional<double> cost_impact;
    std::optional<double> schedule_impact;
    std::optional<double> resource_impact;
};

struct Milestone {
    std::string id;
    std::string name;
    double baseline_duration = 0.0;
    bool critical_path = false;
};

struct ResourceAllocation {
    std::string id;
    std::string name;
    double capacity = 0.0;
    double allocated = 0.0;
};

struct ProjectData {
    std::string project_id;
    std::string name;
    double baseline_budget = 0.0;
    double current_spend = 0.0;
    double baseline_duration = 0.0;   // days
    double elapsed_time = 0.0;        // days
    std::vector<RiskRecord> risks;
    std::vector<Milestone> milestones;
    std::vector<ResourceAllocation> resource_allocations;
};

// JSON mapping of the project model. Missing numeric fields default to 0,
// missing optional impact fields stay unset.
ProjectData project_from_json(const nlohmann::json& j);
nlohmann::json project_to_json(const ProjectData& project);

// Source of project data consumed by the risk adapter
class ProjectRepository {
public:
    virtual ~ProjectRepository() = default;

    // Throws NotFoundError if project_id is unknown
    virtual ProjectData fetch_project(const std::string& project_id) const = 0;
};

class InMemoryProjectRepository : public ProjectRepository {
public:
    void add(ProjectData project);
    ProjectData fetch_project(const std::string& project_id) const override;
    size_t size() const { return projects_.size(); }

private:
    std::map<std::string, ProjectData> projects_;
};

// Projects loaded from a JSON document:
//   {"projects": {"<id>": {...}, ...}}  or  {"projects": [{"project_id": ...}, ...]}
class JsonProjectRepository : public ProjectRepository {
public:
    // Throws ConfigParseError if the file cannot be read or parsed
    static JsonProjectRepository load_from_file(const std::string& path);
    static JsonProjectRepository load_from_json(const nlohmann::json& document);

    ProjectData fetch_project(const std::string& project_id) const override;
    std::vector<std::string> project_ids() const;

    nlohmann::json to_json() const;

private:
    std::map<std::string, ProjectData> projects_;
};

} // namespace riskcalc

#endif // RISKCALC_PROJECT_DATA_HPP
