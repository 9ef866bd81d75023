#include "config.hpp"
#include "errors.hpp"
#include "simulation.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace riskcalc {

RunConfig::RunConfig()
    : iterations(static_cast<int64_t>(DEFAULT_ITERATIONS)),
      confidence_levels{0.80, 0.90, 0.95},
      confidence_level(0.95),
      top_n(10) {}

namespace {

// Numbers may be written literally or as strings such as "${SEED}"
double read_number(const json& value, const std::string& field) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        std::string expanded = expand_environment_variables(value.get<std::string>());
        try {
            size_t consumed = 0;
            double parsed = std::stod(expanded, &consumed);
            if (consumed == expanded.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // fall through to the error below
        }
        throw ConfigParseError("Field '" + field + "' is not a number: '" + expanded + "'");
    }
    throw ConfigParseError("Field '" + field + "' must be a number");
}

int64_t read_integer(const json& value, const std::string& field) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    double number = read_number(value, field);
    if (number != static_cast<double>(static_cast<int64_t>(number))) {
        throw ConfigParseError("Field '" + field + "' must be an integer");
    }
    return static_cast<int64_t>(number);
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    auto is_name_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$') {
            out += value[i++];
            continue;
        }

        bool braced = i + 1 < value.size() && value[i + 1] == '{';
        size_t first = i + (braced ? 2 : 1);
        size_t last = first;
        while (last < value.size() && is_name_char(value[last])) {
            ++last;
        }

        if (last == first) {
            out += '$';
            ++i;
            continue;
        }

        const char* env = std::getenv(value.substr(first, last - first).c_str());
        if (env) {
            out += env;
        }
        i = (braced && last < value.size() && value[last] == '}') ? last + 1 : last;
    }
    return out;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (fs::path(path).is_absolute()) {
        return path;
    }
    return (fs::path(config_file_path).parent_path() / path).string();
}

void validate_run_config(const RunConfig& config) {
    if (config.iterations <= 0) {
        throw ValidationError("iterations must be positive, got " + std::to_string(config.iterations));
    }
    for (double level : config.confidence_levels) {
        if (!(level > 0.0 && level < 1.0)) {
            throw ValidationError("confidence_levels entries must lie in (0, 1)");
        }
    }
    if (!(config.confidence_level > 0.0 && config.confidence_level < 1.0)) {
        throw ValidationError("confidence_level must lie in (0, 1)");
    }
    if (config.top_n == 0) {
        throw ValidationError("top_n must be positive");
    }
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("iterations")) {
            config.iterations = read_integer(j["iterations"], "iterations");
        }

        if (j.contains("seed") && !j["seed"].is_null()) {
            int64_t seed = read_integer(j["seed"], "seed");
            if (seed < 0) {
                throw ValidationError("seed must be non-negative");
            }
            config.seed = static_cast<uint64_t>(seed);
        }

        if (j.contains("confidence_levels")) {
            config.confidence_levels.clear();
            for (const auto& level : j["confidence_levels"]) {
                config.confidence_levels.push_back(read_number(level, "confidence_levels"));
            }
        }

        if (j.contains("confidence_level")) {
            config.confidence_level = read_number(j["confidence_level"], "confidence_level");
        }

        if (j.contains("top_n")) {
            int64_t top_n = read_integer(j["top_n"], "top_n");
            if (top_n <= 0) {
                throw ValidationError("top_n must be positive");
            }
            config.top_n = static_cast<size_t>(top_n);
        }

        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("json")) {
                config.output_path = expand_environment_variables(output["json"].get<std::string>());
            }
            if (output.contains("parquet")) {
                config.parquet_path = expand_environment_variables(output["parquet"].get<std::string>());
            }
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(
                    expand_environment_variables(logging["level"].get<std::string>()));
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = expand_environment_variables(logging["file"].get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_run_config(config);

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    if (!config.output_path.empty()) {
        config.output_path = resolve_relative_path(config.output_path, file_path);
    }
    if (!config.parquet_path.empty()) {
        config.parquet_path = resolve_relative_path(config.parquet_path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace riskcalc
