#include "project_data.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace riskcalc {

namespace {

std::optional<double> optional_number(const json& j, const char* key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

void put_optional(json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    }
}

RiskRecord record_from_json(const json& j) {
    RiskRecord record;
    record.id = j.value("id", "");
    record.name = j.value("name", "");
    record.category = j.value("category", "");
    record.impact_type = j.value("impact_type", "");
    record.distribution_type = j.value("distribution_type", "triangular");
    record.min_impact = optional_number(j, "min_impact");
    record.most_likely_impact = optional_number(j, "most_likely_impact");
    record.max_impact = optional_number(j, "max_impact");
    record.mean_impact = optional_number(j, "mean_impact");
    record.std_impact = optional_number(j, "std_impact");
    record.baseline_impact = j.value("baseline_impact", 0.0);
    record.cost_impact = optional_number(j, "cost_impact");
    record.schedule_impact = optional_number(j, "schedule_impact");
    record.resource_impact = optional_number(j, "resource_impact");
    return record;
}

json record_to_json(const RiskRecord& record) {
    json j;
    j["id"] = record.id;
    j["name"] = record.name;
    j["category"] = record.category;
    j["impact_type"] = record.impact_type;
    j["distribution_type"] = record.distribution_type;
    j["baseline_impact"] = record.baseline_impact;
    put_optional(j, "min_impact", record.min_impact);
    put_optional(j, "most_likely_impact", record.most_likely_impact);
    put_optional(j, "max_impact", record.max_impact);
    put_optional(j, "mean_impact", record.mean_impact);
    put_optional(j, "std_impact", record.std_impact);
    put_optional(j, "cost_impact", record.cost_impact);
    put_optional(j, "schedule_impact", record.schedule_impact);
    put_optional(j, "resource_impact", record.resource_impact);
    return j;
}

} // anonymous namespace

// ============================================================================
// JSON mapping
// ============================================================================

ProjectData project_from_json(const json& j) {
    ProjectData project;
    project.project_id = j.value("project_id", "");
    project.name = j.value("name", "");
    project.baseline_budget = j.value("baseline_budget", 0.0);
    project.current_spend = j.value("current_spend", 0.0);
    project.baseline_duration = j.value("baseline_duration", 0.0);
    project.elapsed_time = j.value("elapsed_time", 0.0);

    if (j.contains("risks")) {
        for (const auto& item : j["risks"]) {
            project.risks.push_back(record_from_json(item));
        }
    }
    if (j.contains("milestones")) {
        for (const auto& item : j["milestones"]) {
            Milestone milestone;
            milestone.id = item.value("id", "");
            milestone.name = item.value("name", "");
            milestone.baseline_duration = item.value("baseline_duration", 0.0);
            milestone.critical_path = item.value("critical_path", false);
            project.milestones.push_back(milestone);
        }
    }
    if (j.contains("resource_allocations")) {
        for (const auto& item : j["resource_allocations"]) {
            ResourceAllocation allocation;
            allocation.id = item.value("id", "");
            allocation.name = item.value("name", "Unknown");
            allocation.capacity = item.value("capacity", 0.0);
            allocation.allocated = item.value("allocated", 0.0);
            project.resource_allocations.push_back(allocation);
        }
    }
    return project;
}

json project_to_json(const ProjectData& project) {
    json j;
    j["project_id"] = project.project_id;
    j["name"] = project.name;
    j["baseline_budget"] = project.baseline_budget;
    j["current_spend"] = project.current_spend;
    j["baseline_duration"] = project.baseline_duration;
    j["elapsed_time"] = project.elapsed_time;

    j["risks"] = json::array();
    for (const auto& record : project.risks) {
        j["risks"].push_back(record_to_json(record));
    }
    j["milestones"] = json::array();
    for (const auto& milestone : project.milestones) {
        j["milestones"].push_back({
            {"id", milestone.id},
            {"name", milestone.name},
            {"baseline_duration", milestone.baseline_duration},
            {"critical_path", milestone.critical_path}
        });
    }
    j["resource_allocations"] = json::array();
    for (const auto& allocation : project.resource_allocations) {
        j["resource_allocations"].push_back({
            {"id", allocation.id},
            {"name", allocation.name},
            {"capacity", allocation.capacity},
            {"allocated", allocation.allocated}
        });
    }
    return j;
}

// ============================================================================
// InMemoryProjectRepository Implementation
// ============================================================================

void InMemoryProjectRepository::add(ProjectData project) {
    std::string id = project.project_id;
    projects_[id] = std::move(project);
}

ProjectData InMemoryProjectRepository::fetch_project(const std::string& project_id) const {
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw NotFoundError("Project " + project_id + " not found");
    }
    return it->second;
}

// ============================================================================
// JsonProjectRepository Implementation
// ============================================================================

JsonProjectRepository JsonProjectRepository::load_from_json(const json& document) {
    JsonProjectRepository repository;
    if (!document.contains("projects")) {
        throw ConfigParseError("Project data is missing required field: projects");
    }

    try {
        const json& projects = document["projects"];
        if (projects.is_object()) {
            for (auto it = projects.begin(); it != projects.end(); ++it) {
                ProjectData project = project_from_json(it.value());
                project.project_id = it.key();
                repository.projects_[it.key()] = std::move(project);
            }
        } else if (projects.is_array()) {
            for (const auto& item : projects) {
                ProjectData project = project_from_json(item);
                if (project.project_id.empty()) {
                    throw ConfigParseError("Project entry missing required field: project_id");
                }
                repository.projects_[project.project_id] = std::move(project);
            }
        } else {
            throw ConfigParseError("Field 'projects' must be an object or an array");
        }
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }
    return repository;
}

JsonProjectRepository JsonProjectRepository::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open project data file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error in ") + path + ": " + e.what());
    }
    return load_from_json(document);
}

ProjectData JsonProjectRepository::fetch_project(const std::string& project_id) const {
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw NotFoundError("Project " + project_id + " not found");
    }
    return it->second;
}

std::vector<std::string> JsonProjectRepository::project_ids() const {
    std::vector<std::string> ids;
    ids.reserve(projects_.size());
    for (const auto& [id, project] : projects_) {
        ids.push_back(id);
    }
    return ids;
}

json JsonProjectRepository::to_json() const {
    json document;
    document["projects"] = json::object();
    for (const auto& [id, project] : projects_) {
        document["projects"][id] = project_to_json(project);
    }
    return document;
}

} // namespace riskcalc
