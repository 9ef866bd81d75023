/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include "project_data.hpp"
#include "risk_adapter.hpp"
#include "simulation.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace riskcalc;
using json = nlohmann::json;

namespace {

// Route logs to a file only, at the given level
void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<json> read_log_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

void reset_logger(const std::string& path) {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Custom configuration") {
        LoggerConfig config;
        config.min_level = LogLevel::DEBUG;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);

        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }
}

TEST_CASE("Logger analysis lifecycle events", "[logger]") {
    const std::string path = "test_logger_lifecycle.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx("PRJ-001", "budget");

    std::vector<Risk> risks = {
        Risk("r1", "Overrun", RiskCategory::Cost, ImpactType::Cost,
             ProbabilityDistribution::normal(100.0, 10.0), 100.0)
    };
    auto results = run_simulation(risks, 10000, nullptr, 11);

    logger.log_analysis_start(ctx, 10000);
    logger.log_simulation_complete(ctx, results);
    logger.log_analysis_complete(ctx, 1, results.simulation_id());

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 3);

    REQUIRE(lines[0]["event"] == "analysis_start");
    REQUIRE(lines[0]["project_id"] == "PRJ-001");
    REQUIRE(lines[0]["analysis_type"] == "budget");
    REQUIRE(lines[0]["iterations"] == "10000");
    REQUIRE(lines[0]["level"] == "INFO");
    REQUIRE(lines[0].contains("timestamp"));

    REQUIRE(lines[1]["event"] == "simulation_complete");
    REQUIRE(lines[1]["simulation_id"] == results.simulation_id());
    REQUIRE(lines[1]["seed"] == "11");
    REQUIRE(lines[1]["risk_count"] == "1");
    REQUIRE(lines[1]["correlation_adjusted"] == "false");
    REQUIRE(std::stod(lines[1]["execution_time_ms"].get<std::string>()) >= 0.0);

    REQUIRE(lines[2]["event"] == "analysis_complete");
    REQUIRE(lines[2]["risk_count"] == "1");

    reset_logger(path);
}

TEST_CASE("Logger warning events", "[logger]") {
    const std::string path = "test_logger_warnings.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx("PRJ-002", "resource");

    logger.log_record_skipped(ctx, "R-9", "triangular requires min <= mode <= max");
    logger.log_analysis_degenerate(ctx, "No resource risks identified for analysis");
    logger.log_correlation_adjusted(ctx, "sim-1");

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 3);

    REQUIRE(lines[0]["event"] == "record_skipped");
    REQUIRE(lines[0]["level"] == "WARN");
    REQUIRE(lines[0]["record_id"] == "R-9");
    REQUIRE(lines[0]["reason"] == "triangular requires min <= mode <= max");

    REQUIRE(lines[1]["event"] == "analysis_degenerate");
    REQUIRE(lines[1]["note"] == "No resource risks identified for analysis");

    REQUIRE(lines[2]["event"] == "correlation_adjusted");
    REQUIRE(lines[2]["simulation_id"] == "sim-1");

    reset_logger(path);
}

TEST_CASE("Logger errors escape special characters", "[logger]") {
    const std::string path = "test_logger_errors.log";
    log_to_file(path);

    Logger::get_instance().log_error(AnalysisContext("", "risks"), "bad \"quote\"\nsecond line");

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["event"] == "error");
    REQUIRE(lines[0]["level"] == "ERROR");
    REQUIRE(lines[0]["error_message"] == "bad \"quote\"\nsecond line");
    REQUIRE_FALSE(lines[0].contains("project_id"));

    reset_logger(path);
}

TEST_CASE("Logger level filtering", "[logger]") {
    const std::string path = "test_logger_filtering.log";
    log_to_file(path, LogLevel::WARN);
    Logger& logger = Logger::get_instance();
    AnalysisContext ctx("PRJ-003", "schedule");

    logger.log_analysis_start(ctx, 10000);
    logger.log_warning(ctx, "kept");
    logger.log_error(ctx, "also kept");

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["warning"] == "kept");
    REQUIRE(lines[1]["error_message"] == "also kept");

    reset_logger(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    const std::string path = "test_logger_text.log";
    std::filesystem::remove(path);
    LoggerConfig config;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = false;
    config.log_file_path = path;
    Logger::get_instance().configure(config);

    Logger::get_instance().log_warning(AnalysisContext("PRJ-004", "budget"), "plain message");
    Logger::get_instance().flush();

    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("WARN  plain message (") != std::string::npos);
    REQUIRE(line.find("project_id=PRJ-004") != std::string::npos);
    REQUIRE(line.find("event=") == std::string::npos);
    REQUIRE(line.back() == ')');
    REQUIRE(line.find('T') == 10);

    reset_logger(path);
}

TEST_CASE("Logger keeps lines intact under concurrent analyses", "[logger][concurrency]") {
    const std::string path = "test_logger_concurrent.log";
    log_to_file(path, LogLevel::INFO);

    InMemoryProjectRepository repository;
    for (const std::string id : {"PRJ-A", "PRJ-B"}) {
        ProjectData project;
        project.project_id = id;
        project.baseline_budget = 50000.0;
        project.baseline_duration = 60.0;
        RiskRecord overrun;
        overrun.id = "overrun";
        overrun.category = "cost";
        overrun.impact_type = "cost";
        overrun.baseline_impact = 2500.0;
        project.risks.push_back(overrun);
        RiskRecord bad;
        bad.id = "inverted";
        bad.impact_type = "cost";
        bad.min_impact = 10.0;
        bad.most_likely_impact = 1.0;
        project.risks.push_back(bad);
        repository.add(project);
    }

    AnalysisOptions options;
    options.seed = 99;
    ProjectRiskAdapter adapter(repository, options);

    const int runs = 5;
    auto analyze = [&](const std::string& id) {
        for (int i = 0; i < runs; ++i) {
            adapter.analyze_budget_variance(id);
        }
    };
    std::thread first(analyze, "PRJ-A");
    std::thread second(analyze, "PRJ-B");
    first.join();
    second.join();

    // Every line must parse on its own
    auto lines = read_log_lines(path);
    std::map<std::string, int> completed;
    std::map<std::string, int> skipped;
    for (const auto& line : lines) {
        if (line["event"] == "analysis_complete") {
            ++completed[line["project_id"].get<std::string>()];
        }
        if (line["event"] == "record_skipped") {
            ++skipped[line["project_id"].get<std::string>()];
        }
    }
    REQUIRE(completed["PRJ-A"] == runs);
    REQUIRE(completed["PRJ-B"] == runs);
    REQUIRE(skipped["PRJ-A"] == runs);
    REQUIRE(skipped["PRJ-B"] == runs);

    reset_logger(path);
}
