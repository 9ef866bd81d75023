#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include "errors.hpp"
#include "logger.hpp"
#include "risk_adapter.hpp"

using namespace riskcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

RiskRecord record(const std::string& id, const std::string& category, const std::string& impact_type) {
    RiskRecord r;
    r.id = id;
    r.name = "Record " + id;
    r.category = category;
    r.impact_type = impact_type;
    r.distribution_type = "triangular";
    return r;
}

ProjectData base_project(const std::string& id) {
    ProjectData project;
    project.project_id = id;
    project.name = "Project " + id;
    project.baseline_budget = 100000.0;
    project.current_spend = 40000.0;
    project.baseline_duration = 120.0;
    project.elapsed_time = 30.0;
    return project;
}

// Counts engine calls and forwards to run_simulation
struct SpyRunner {
    int* calls;

    SimulationResults operator()(const std::vector<Risk>& risks, size_t iterations,
                                 const CorrelationMatrix* correlations, std::optional<uint64_t> seed) const {
        ++*calls;
        return run_simulation(risks, iterations, correlations, seed);
    }
};

struct RecordingSink : AuditSink {
    std::vector<AnalysisEvent> events;
    void record_analysis(const AnalysisEvent& event) override { events.push_back(event); }
};

struct FailingSink : AuditSink {
    void record_analysis(const AnalysisEvent&) override { throw std::runtime_error("audit store offline"); }
};

AnalysisOptions seeded_options() {
    AnalysisOptions options;
    options.seed = 2024;
    return options;
}

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

} // anonymous namespace

// ============================================================================
// Record translation
// ============================================================================

TEST_CASE("Distribution heuristic for triangular records", "[adapter][translation]") {
    RiskRecord r = record("r1", "cost", "cost");
    r.baseline_impact = 50.0;

    auto defaults = distribution_from_record(r);
    REQUIRE(defaults.type() == DistributionType::Triangular);
    REQUIRE(defaults.parameter("min") == 0.0);
    REQUIRE(defaults.parameter("mode") == 50.0);
    REQUIRE(defaults.parameter("max") == 100.0);

    r.min_impact = 10.0;
    r.most_likely_impact = 20.0;
    r.max_impact = 80.0;
    auto explicit_range = distribution_from_record(r);
    REQUIRE(explicit_range.parameter("min") == 10.0);
    REQUIRE(explicit_range.parameter("mode") == 20.0);
    REQUIRE(explicit_range.parameter("max") == 80.0);
}

TEST_CASE("Distribution heuristic for normal and unknown records", "[adapter][translation]") {
    RiskRecord normal = record("r1", "cost", "cost");
    normal.distribution_type = "normal";
    normal.baseline_impact = -40.0;
    auto n = distribution_from_record(normal);
    REQUIRE(n.type() == DistributionType::Normal);
    REQUIRE(n.parameter("mean") == -40.0);
    REQUIRE_THAT(n.parameter("std"), WithinRel(8.0, 1e-12));

    RiskRecord beta = record("r2", "cost", "cost");
    beta.distribution_type = "beta";
    beta.baseline_impact = 30.0;
    auto fallback = distribution_from_record(beta);
    REQUIRE(fallback.type() == DistributionType::Triangular);
    REQUIRE(fallback.parameter("min") == 15.0);
    REQUIRE(fallback.parameter("mode") == 30.0);
    REQUIRE(fallback.parameter("max") == 45.0);
}

TEST_CASE("Budget translation filters by impact type", "[adapter][translation]") {
    std::vector<RiskRecord> records = {
        record("c", "cost", "cost"),
        record("s", "schedule", "schedule"),
        record("b", "technical", "both"),
        record("r", "resource", "schedule")
    };
    for (auto& r : records) r.baseline_impact = 10.0;

    auto budget = budget_risks_from_records(records);
    REQUIRE(budget.risks.size() == 2);
    REQUIRE(budget.risks[0].id() == "c");
    REQUIRE(budget.risks[1].impact_type() == ImpactType::Cost);

    auto schedule = schedule_risks_from_records(records);
    REQUIRE(schedule.risks.size() == 3);

    auto resource = resource_risks_from_records(records);
    REQUIRE(resource.risks.size() == 1);
    REQUIRE(resource.risks[0].category() == RiskCategory::Resource);
    REQUIRE(resource.risks[0].impact_type() == ImpactType::Schedule);
}

TEST_CASE("Translation skips invalid records", "[adapter][translation][error]") {
    RiskRecord inverted = record("bad-range", "cost", "cost");
    inverted.min_impact = 50.0;
    inverted.most_likely_impact = 10.0;
    inverted.max_impact = 100.0;

    RiskRecord good = record("good", "cost", "cost");
    good.baseline_impact = 5.0;
    RiskRecord duplicate = good;

    auto result = budget_risks_from_records({inverted, good, duplicate});
    REQUIRE(result.risks.size() == 1);
    REQUIRE(result.risks[0].id() == "good");
    REQUIRE(result.skipped.size() == 2);
    REQUIRE(result.skipped[0].first == "bad-range");
    REQUIRE(result.skipped[1].second == "duplicate risk id");
}

TEST_CASE("Translation keeps records with unrecognised category labels", "[adapter][translation]") {
    RiskRecord financial = record("fin-1", "financial", "cost");
    financial.min_impact = 1000.0;
    financial.most_likely_impact = 5000.0;
    financial.max_impact = 20000.0;

    RiskRecord slippage = record("slip-1", "weather", "schedule");
    slippage.baseline_impact = 4.0;

    auto budget = budget_risks_from_records({financial, slippage});
    REQUIRE(budget.skipped.empty());
    REQUIRE(budget.risks.size() == 1);
    REQUIRE(budget.risks[0].id() == "fin-1");
    REQUIRE(budget.risks[0].category() == RiskCategory::Cost);

    auto schedule = schedule_risks_from_records({financial, slippage});
    REQUIRE(schedule.skipped.empty());
    REQUIRE(schedule.risks.size() == 1);
    REQUIRE(schedule.risks[0].category() == RiskCategory::Schedule);

    RiskRecord regulatory = record("reg-1", "regulatory", "cost");
    regulatory.baseline_impact = 2.0;
    REQUIRE(budget_risks_from_records({regulatory}).risks[0].category() == RiskCategory::Other);
}

TEST_CASE("Translation fills missing ids and names", "[adapter][translation]") {
    RiskRecord anonymous;
    anonymous.impact_type = "cost";
    anonymous.baseline_impact = 1.0;

    auto result = budget_risks_from_records({anonymous});
    REQUIRE(result.risks.size() == 1);
    REQUIRE(result.risks[0].id() == "risk_0");
    REQUIRE(result.risks[0].name() == "Unnamed Risk");
}

// ============================================================================
// Adapter construction
// ============================================================================

TEST_CASE("Adapter rejects invalid options", "[adapter][error]") {
    InMemoryProjectRepository repository;

    AnalysisOptions negative;
    negative.iterations = -5;
    REQUIRE_THROWS_AS(ProjectRiskAdapter(repository, negative), PreconditionError);

    AnalysisOptions few;
    few.iterations = 500;
    REQUIRE_THROWS_AS(ProjectRiskAdapter(repository, few), PreconditionError);

    AnalysisOptions confidence;
    confidence.confidence_level = 1.0;
    REQUIRE_THROWS_AS(ProjectRiskAdapter(repository, confidence), ValidationError);

    AnalysisOptions top;
    top.top_n = 0;
    REQUIRE_THROWS_AS(ProjectRiskAdapter(repository, top), ValidationError);
}

TEST_CASE("Unknown project propagates NotFoundError", "[adapter][error]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectRiskAdapter adapter(repository);

    REQUIRE_THROWS_AS(adapter.analyze_budget_variance("PRJ-404"), NotFoundError);
    REQUIRE_THROWS_AS(adapter.analyze_project("PRJ-404"), NotFoundError);
}

// ============================================================================
// Degenerate path
// ============================================================================

TEST_CASE("No qualifying records skips the engine", "[adapter][degenerate]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-EMPTY");
    project.risks.push_back(record("s", "schedule", "schedule"));
    repository.add(project);

    int calls = 0;
    RecordingSink sink;
    ProjectRiskAdapter adapter(repository, seeded_options(), &sink, SpyRunner{&calls});

    auto budget = adapter.analyze_budget_variance("PRJ-EMPTY");
    REQUIRE(calls == 0);
    REQUIRE(budget["probability_within_budget"] == 1.0);
    REQUIRE(budget["probability_within_10_percent"] == 1.0);
    REQUIRE(budget["expected_final_cost"] == 100000.0);
    REQUIRE(budget["variance_from_baseline"] == 0.0);
    REQUIRE(budget["simulation_id"].is_null());
    REQUIRE(budget["risk_contributions"].empty());
    REQUIRE(budget["note"] == "No budget risks identified for analysis");

    auto resource = adapter.analyze_resource_risks("PRJ-EMPTY");
    REQUIRE(calls == 0);
    REQUIRE(resource["recommendations"][0] == "Insufficient resource data for analysis");

    REQUIRE(sink.events.size() == 2);
    REQUIRE_FALSE(sink.events[0].simulated);
    REQUIRE_FALSE(sink.events[0].simulation_id.has_value());
    REQUIRE(sink.events[1].analysis_type == "resource");
}

// ============================================================================
// Simulated analyses
// ============================================================================

TEST_CASE("Budget analysis shapes the simulated overrun", "[adapter][budget]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-1");
    RiskRecord steel = record("steel", "cost", "cost");
    steel.min_impact = 0.0;
    steel.most_likely_impact = 6000.0;
    steel.max_impact = 12000.0;
    project.risks.push_back(steel);
    repository.add(project);

    int calls = 0;
    RecordingSink sink;
    ProjectRiskAdapter adapter(repository, seeded_options(), &sink, SpyRunner{&calls});
    auto budget = adapter.analyze_budget_variance("PRJ-1");

    REQUIRE(calls == 1);
    REQUIRE(budget["remaining_budget"] == 60000.0);
    REQUIRE_THAT(budget["expected_final_cost"].get<double>(), WithinAbs(106000.0, 150.0));
    REQUIRE_THAT(budget["variance_percentage"].get<double>(), WithinAbs(6.0, 0.15));
    // Overrun is never <= 0 except at the lower bound
    REQUIRE(budget["probability_within_budget"].get<double>() < 0.01);
    // Overrun <= 6000 (10% of remaining) is half the symmetric triangle
    REQUIRE_THAT(budget["probability_within_10_percent"].get<double>(), WithinAbs(0.5, 0.02));

    const auto& percentiles = budget["percentiles"];
    REQUIRE(percentiles["p10"].get<double>() < percentiles["p50"].get<double>());
    REQUIRE(percentiles["p50"].get<double>() < percentiles["p90"].get<double>());

    const auto& interval = budget["confidence_intervals"];
    REQUIRE(interval["confidence_level"] == 0.95);
    REQUIRE(interval["lower_bound"].get<double>() < interval["upper_bound"].get<double>());

    REQUIRE(budget["risk_contributions"].size() == 1);
    REQUIRE(budget["risk_contributions"][0]["risk_id"] == "steel");
    REQUIRE_THAT(budget["risk_contributions"][0]["contribution_percentage"].get<double>(),
                 WithinAbs(100.0, 1e-9));

    REQUIRE(sink.events.size() == 1);
    REQUIRE(sink.events[0].simulated);
    REQUIRE(sink.events[0].simulation_id == budget["simulation_id"].get<std::string>());
}

TEST_CASE("Schedule analysis reports milestone risk", "[adapter][schedule]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-2");
    RiskRecord permit = record("permit", "regulatory", "schedule");
    permit.distribution_type = "normal";
    permit.mean_impact = 10.0;
    permit.std_impact = 2.0;
    project.risks.push_back(permit);
    project.milestones.push_back({"m1", "Foundations", 40.0, true});
    project.milestones.push_back({"m2", "Fit-out", 30.0, false});
    repository.add(project);

    ProjectRiskAdapter adapter(repository, seeded_options());
    auto schedule = adapter.analyze_schedule_variance("PRJ-2");

    REQUIRE_THAT(schedule["expected_final_duration"].get<double>(), WithinAbs(130.0, 0.2));
    REQUIRE(schedule["probability_on_time"].get<double>() < 0.001);
    REQUIRE_THAT(schedule["probability_within_1_week"].get<double>(), WithinAbs(0.0668, 0.01));
    REQUIRE(schedule["probability_within_1_month"].get<double>() > 0.999);

    const auto& critical = schedule["critical_path_analysis"];
    REQUIRE(critical["critical_path_identified"] == true);
    REQUIRE(critical["critical_milestones"] == 1);
    REQUIRE_THAT(critical["delay_risk"].get<double>(), WithinAbs(10.0 / 120.0, 0.002));
    REQUIRE(critical["milestone_details"][0]["id"] == "m1");
}

TEST_CASE("Resource analysis flags over-utilized allocations", "[adapter][resource]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-3");
    RiskRecord crew = record("crew", "resource", "schedule");
    crew.baseline_impact = 5.0;
    project.risks.push_back(crew);
    project.resource_allocations.push_back({"a1", "Crane crew", 100.0, 95.0});
    project.resource_allocations.push_back({"a2", "Welders", 100.0, 50.0});
    repository.add(project);

    ProjectRiskAdapter adapter(repository, seeded_options());
    auto resource = adapter.analyze_resource_risks("PRJ-3");

    REQUIRE(resource["total_resources"] == 2);
    REQUIRE_THAT(resource["resource_utilization"]["utilization_rate"].get<double>(), WithinRel(0.725, 1e-12));

    const auto& conflicts = resource["conflict_probability"];
    REQUIRE_THAT(conflicts["conflict_probability"].get<double>(), WithinRel(0.5, 1e-12));
    REQUIRE(conflicts["high_risk_resources"].size() == 1);
    REQUIRE(conflicts["high_risk_resources"][0]["resource_name"] == "Crane crew");

    const auto& recommendations = resource["recommendations"];
    REQUIRE(recommendations.size() == 2);
    REQUIRE(recommendations[0].get<std::string>().find("50.0%") != std::string::npos);
    REQUIRE(recommendations[1] == "Critical resources requiring attention: Crane crew");
}

TEST_CASE("Skipped records are reported with the analysis", "[adapter][translation]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-4");
    RiskRecord bad = record("bad", "cost", "cost");
    bad.min_impact = 9.0;
    bad.most_likely_impact = 1.0;
    RiskRecord good = record("good", "cost", "cost");
    good.baseline_impact = 500.0;
    project.risks = {bad, good};
    repository.add(project);

    ProjectRiskAdapter adapter(repository, seeded_options());
    auto budget = adapter.analyze_budget_variance("PRJ-4");

    REQUIRE(budget["skipped_records"].size() == 1);
    REQUIRE(budget["skipped_records"][0]["id"] == "bad");
    REQUIRE(budget["risk_contributions"].size() == 1);
    REQUIRE_FALSE(budget["simulation_id"].is_null());
}

TEST_CASE("Failing audit sink does not fail the analysis", "[adapter][audit]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    repository.add(base_project("PRJ-5"));

    FailingSink sink;
    ProjectRiskAdapter adapter(repository, seeded_options(), &sink);
    REQUIRE_NOTHROW(adapter.analyze_budget_variance("PRJ-5"));
}

TEST_CASE("Engine failures propagate to the caller", "[adapter][error]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-6");
    RiskRecord r = record("r", "cost", "cost");
    r.baseline_impact = 10.0;
    project.risks.push_back(r);
    repository.add(project);

    SimulationRunner broken = [](const std::vector<Risk>&, size_t, const CorrelationMatrix*,
                                 std::optional<uint64_t>) -> SimulationResults {
        throw NumericalError("factorization failed");
    };
    RecordingSink sink;
    ProjectRiskAdapter adapter(repository, seeded_options(), &sink, broken);

    REQUIRE_THROWS_AS(adapter.analyze_budget_variance("PRJ-6"), NumericalError);
    REQUIRE(sink.events.empty());
}

TEST_CASE("Seeded analyses are reproducible", "[adapter]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-8");
    RiskRecord r = record("r", "cost", "both");
    r.baseline_impact = 1000.0;
    project.risks.push_back(r);
    repository.add(project);

    ProjectRiskAdapter adapter(repository, seeded_options());
    auto first = adapter.analyze_schedule_variance("PRJ-8");
    auto second = adapter.analyze_schedule_variance("PRJ-8");

    REQUIRE(first["percentiles"] == second["percentiles"]);
    REQUIRE(first["simulation_id"] != second["simulation_id"]);
}

// ============================================================================
// Whole-project analysis
// ============================================================================

TEST_CASE("Project analysis combines the three domains", "[adapter][project]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    ProjectData project = base_project("PRJ-9");
    RiskRecord overrun = record("overrun", "cost", "both");
    overrun.min_impact = 10.0;
    overrun.most_likely_impact = 20.0;
    overrun.max_impact = 30.0;
    project.risks.push_back(overrun);
    repository.add(project);

    int calls = 0;
    ProjectRiskAdapter adapter(repository, seeded_options(), nullptr, SpyRunner{&calls});
    auto analysis = adapter.analyze_project("PRJ-9");

    REQUIRE(calls == 2);
    REQUIRE(analysis["project_id"] == "PRJ-9");
    REQUIRE(analysis["project_name"] == "Project PRJ-9");
    REQUIRE(analysis["resource_analysis"]["simulation_id"].is_null());

    const auto& summary = analysis["summary"];
    // Every iteration overruns both budget and schedule
    REQUIRE(summary["budget_risk_level"] == "high");
    REQUIRE(summary["schedule_risk_level"] == "high");
    REQUIRE(summary["resource_risk_level"] == "low");
    REQUIRE(summary["overall_risk_level"] == "high");
    REQUIRE(summary["probability_of_success"] == 0.0);
    // 20 day delay on a 120 day baseline
    REQUIRE(summary["key_insights"].size() == 1);
    REQUIRE(summary["key_insights"][0].get<std::string>().find("Schedule variance") == 0);
}

TEST_CASE("Project analysis of a risk-free project", "[adapter][project]") {
    quiet_logger();
    InMemoryProjectRepository repository;
    repository.add(base_project("PRJ-10"));

    ProjectRiskAdapter adapter(repository);
    auto summary = adapter.analyze_project("PRJ-10")["summary"];

    REQUIRE(summary["overall_risk_level"] == "low");
    REQUIRE(summary["probability_of_success"] == 1.0);
    REQUIRE(summary["key_insights"].empty());
}
