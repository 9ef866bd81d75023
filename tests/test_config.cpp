#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config.hpp"
#include "errors.hpp"

using namespace riskcalc;

TEST_CASE("Run config defaults", "[config]") {
    RunConfig config = parse_run_config_from_string("{}");

    REQUIRE(config.iterations == 10000);
    REQUIRE_FALSE(config.seed.has_value());
    REQUIRE(config.confidence_levels == std::vector<double>{0.80, 0.90, 0.95});
    REQUIRE(config.confidence_level == 0.95);
    REQUIRE(config.top_n == 10);
    REQUIRE(config.output_path.empty());
    REQUIRE(config.logging.min_level == LogLevel::INFO);
}

TEST_CASE("Run config reads every section", "[config]") {
    RunConfig config = parse_run_config_from_string(R"({
        "iterations": 25000,
        "seed": 7,
        "confidence_levels": [0.5, 0.99],
        "confidence_level": 0.9,
        "top_n": 3,
        "output": {"json": "/tmp/out.json", "parquet": "/tmp/out.parquet"},
        "logging": {"level": "DEBUG", "json": false, "console": false, "file": "/tmp/riskcalc.log"}
    })");

    REQUIRE(config.iterations == 25000);
    REQUIRE(config.seed == 7u);
    REQUIRE(config.confidence_levels.size() == 2);
    REQUIRE(config.confidence_level == 0.9);
    REQUIRE(config.top_n == 3);
    REQUIRE(config.parquet_path == "/tmp/out.parquet");
    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE_FALSE(config.logging.enable_console);
    REQUIRE(config.logging.enable_file);
    REQUIRE(config.logging.log_file_path == "/tmp/riskcalc.log");
}

TEST_CASE("Environment variable expansion", "[config][env]") {
    setenv("RISKCALC_TEST_DIR", "/data/runs", 1);
    setenv("RISKCALC_TEST_SEED", "1234", 1);

    SECTION("Braced and bare references") {
        REQUIRE(expand_environment_variables("${RISKCALC_TEST_DIR}/out.json") == "/data/runs/out.json");
        REQUIRE(expand_environment_variables("$RISKCALC_TEST_DIR/out.json") == "/data/runs/out.json");
    }

    SECTION("Unset variables expand to empty") {
        unsetenv("RISKCALC_TEST_UNSET");
        REQUIRE(expand_environment_variables("a${RISKCALC_TEST_UNSET}b") == "ab");
    }

    SECTION("Lone dollar is kept") {
        REQUIRE(expand_environment_variables("cost in $") == "cost in $");
        REQUIRE(expand_environment_variables("$ 5") == "$ 5");
    }

    SECTION("Numbers given as strings") {
        RunConfig config = parse_run_config_from_string(
            R"({"seed": "${RISKCALC_TEST_SEED}", "output": {"json": "${RISKCALC_TEST_DIR}/r.json"}})");
        REQUIRE(config.seed == 1234u);
        REQUIRE(config.output_path == "/data/runs/r.json");
    }

    unsetenv("RISKCALC_TEST_DIR");
    unsetenv("RISKCALC_TEST_SEED");
}

TEST_CASE("Run config parse errors", "[config][error]") {
    REQUIRE_THROWS_AS(parse_run_config_from_string("{ not json"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"iterations": "lots"})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"iterations": 10000.5})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"logging": {"json": "yes"}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_run_config_from_file("/nonexistent/config.json"), ConfigParseError);
}

TEST_CASE("Run config range errors", "[config][error]") {
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"iterations": 0})"), ValidationError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"iterations": -10})"), ValidationError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"seed": -1})"), ValidationError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"confidence_levels": [0.9, 1.0]})"), ValidationError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"confidence_level": 0})"), ValidationError);
    REQUIRE_THROWS_AS(parse_run_config_from_string(R"({"top_n": 0})"), ValidationError);
}

TEST_CASE("Relative paths resolve against the config file", "[config][paths]") {
    REQUIRE(resolve_relative_path("out.json", "/etc/riskcalc/run.json") == "/etc/riskcalc/out.json");
    REQUIRE(resolve_relative_path("/var/out.json", "/etc/riskcalc/run.json") == "/var/out.json");

    std::filesystem::path dir = std::filesystem::temp_directory_path() / "riskcalc_config_test";
    std::filesystem::create_directories(dir);
    std::string config_path = (dir / "run.json").string();
    {
        std::ofstream file(config_path);
        file << R"({"output": {"json": "report.json"}, "logging": {"file": "logs/run.log"}})";
    }

    RunConfig config = parse_run_config_from_file(config_path);
    REQUIRE(config.output_path == (dir / "report.json").string());
    REQUIRE(config.logging.log_file_path == (dir / "logs/run.log").string());

    std::filesystem::remove_all(dir);
}
