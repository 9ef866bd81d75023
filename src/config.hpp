#ifndef RISKCALC_CONFIG_HPP
#define RISKCALC_CONFIG_HPP

#include "logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskcalc {

/**
 * @brief Settings for one CLI or adapter run
 */
struct RunConfig {
    int64_t iterations;                       ///< Signed so negative input can be rejected
    std::optional<uint64_t> seed;             ///< Unset = seeded from std::random_device
    std::vector<double> confidence_levels;    ///< Levels for generate_confidence_intervals
    double confidence_level;                  ///< Level used by adapter outputs
    size_t top_n;                             ///< Contributors reported
    std::string output_path;                  ///< JSON output (empty = stdout)
    std::string parquet_path;                 ///< Parquet export of outcome arrays (empty = none)
    LoggerConfig logging;

    RunConfig();
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative output paths are resolved against the config file's directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed and validated configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ValidationError if a value is out of range
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Fields not present keep their defaults. String values, including numbers
 * given as strings, undergo environment variable expansion.
 *
 * @throws ConfigParseError if JSON is invalid
 * @throws ValidationError if a value is out of range
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Checks ranges of a configuration
 *
 * @throws ValidationError on iterations <= 0, confidence levels outside
 *         (0, 1) or top_n == 0
 */
void validate_run_config(const RunConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory containing config_file_path
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace riskcalc

#endif // RISKCALC_CONFIG_HPP
