#include <iostream>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "project_data.hpp"
#include "risk_adapter.hpp"
#include "simulation.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/risk_reader.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string project_data_path;
    std::string project_id;
    std::string analysis = "all";
    std::string risks_path;
    std::string config_path;
    std::string output_path;
    std::string parquet_path;
    std::optional<int64_t> iterations;
    std::optional<uint64_t> seed;
    std::optional<double> confidence;
    std::optional<std::string> log_level;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "riskcalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Project analysis:\n";
    std::cerr << "  --project-data <path>       JSON document of projects\n";
    std::cerr << "  --project-id <id>           Project to analyze\n";
    std::cerr << "  --analysis <kind>           budget, schedule, resource or all (default: all)\n\n";
    std::cerr << "Risk set simulation (alternative to --project-data):\n";
    std::cerr << "  --risks <path>              JSON risk set with optional correlations\n";
    std::cerr << "  --parquet <path>            Export outcome arrays to Parquet\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --iterations <count>        Iterations, at least " << riskcalc::MIN_ITERATIONS
              << " (default: " << riskcalc::DEFAULT_ITERATIONS << ")\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: random)\n";
    std::cerr << "  --confidence <level>        Confidence level in (0, 1); replaces the\n"
              << "                              configured interval levels (default: 0.95)\n";
    std::cerr << "  --config <path>             JSON run configuration\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Budget analysis of a stored project:\n";
    std::cerr << "     " << program_name << " --project-data data/sample_project.json \\\n";
    std::cerr << "         --project-id PRJ-001 --analysis budget --seed 42\n\n";
    std::cerr << "  2. Correlated risk set with Parquet export:\n";
    std::cerr << "     " << program_name << " --risks data/sample_risks.json \\\n";
    std::cerr << "         --iterations 20000 --seed 7 \\\n";
    std::cerr << "         --output results.json --parquet outcomes.parquet\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--project-data" && i + 1 < argc) {
                args.project_data_path = argv[++i];
            } else if (arg == "--project-id" && i + 1 < argc) {
                args.project_id = argv[++i];
            } else if (arg == "--analysis" && i + 1 < argc) {
                args.analysis = argv[++i];
            } else if (arg == "--risks" && i + 1 < argc) {
                args.risks_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--iterations" && i + 1 < argc) {
                args.iterations = std::stoll(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
            } else if (arg == "--confidence" && i + 1 < argc) {
                args.confidence = std::stod(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    bool has_project = !args.project_data_path.empty();
    bool has_risks = !args.risks_path.empty();

    if (!has_project && !has_risks) {
        std::cerr << "Error: Must provide either --project-data with --project-id OR --risks\n";
        valid = false;
    } else if (has_project && has_risks) {
        std::cerr << "Error: --project-data and --risks are mutually exclusive\n";
        valid = false;
    }

    if (has_project) {
        if (!file_exists(args.project_data_path)) {
            std::cerr << "Error: Project data file not found: " << args.project_data_path << "\n";
            valid = false;
        }
        if (args.project_id.empty()) {
            std::cerr << "Error: --project-id is required with --project-data\n";
            valid = false;
        }
        if (args.analysis != "budget" && args.analysis != "schedule" &&
            args.analysis != "resource" && args.analysis != "all") {
            std::cerr << "Error: --analysis must be budget, schedule, resource or all\n";
            valid = false;
        }
        if (!args.parquet_path.empty()) {
            std::cerr << "Error: --parquet is only supported with --risks\n";
            valid = false;
        }
    }

    if (has_risks && !file_exists(args.risks_path)) {
        std::cerr << "Error: Risk set file not found: " << args.risks_path << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.iterations && *args.iterations < static_cast<int64_t>(riskcalc::MIN_ITERATIONS)) {
        std::cerr << "Error: --iterations must be at least " << riskcalc::MIN_ITERATIONS << "\n";
        valid = false;
    }

    if (args.confidence && !(*args.confidence > 0.0 && *args.confidence < 1.0)) {
        std::cerr << "Error: --confidence must lie in (0, 1)\n";
        valid = false;
    }

    if (args.log_level && *args.log_level != "DEBUG" && *args.log_level != "INFO" &&
        *args.log_level != "WARN" && *args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Command line values take precedence over the config file
riskcalc::RunConfig merge_config(const CLIArgs& args) {
    riskcalc::RunConfig config;
    if (!args.config_path.empty()) {
        config = riskcalc::parse_run_config_from_file(args.config_path);
    }

    if (args.iterations) config.iterations = *args.iterations;
    if (args.seed) config.seed = args.seed;
    if (args.confidence) {
        config.confidence_level = *args.confidence;
        config.confidence_levels = {*args.confidence};
    }
    if (!args.output_path.empty()) config.output_path = args.output_path;
    if (!args.parquet_path.empty()) config.parquet_path = args.parquet_path;
    if (args.log_level) config.logging.min_level = riskcalc::string_to_level(*args.log_level);

    riskcalc::validate_run_config(config);
    if (config.iterations < static_cast<int64_t>(riskcalc::MIN_ITERATIONS)) {
        throw riskcalc::PreconditionError("Iteration count must be at least " +
                                          std::to_string(riskcalc::MIN_ITERATIONS) + ", got " +
                                          std::to_string(config.iterations));
    }
    return config;
}

json run_project_analysis(const CLIArgs& args, const riskcalc::RunConfig& config) {
    std::cerr << "Loading projects from " << args.project_data_path << "..." << std::flush;
    riskcalc::JsonProjectRepository repository =
        riskcalc::JsonProjectRepository::load_from_file(args.project_data_path);
    std::cerr << " loaded " << repository.project_ids().size() << " projects\n";

    riskcalc::AnalysisOptions options;
    options.iterations = config.iterations;
    options.confidence_level = config.confidence_level;
    options.seed = config.seed;
    options.top_n = config.top_n;

    riskcalc::ProjectRiskAdapter adapter(repository, options);

    std::cerr << "Running " << args.analysis << " analysis for project " << args.project_id << "...\n";
    if (args.analysis == "budget") return adapter.analyze_budget_variance(args.project_id);
    if (args.analysis == "schedule") return adapter.analyze_schedule_variance(args.project_id);
    if (args.analysis == "resource") return adapter.analyze_resource_risks(args.project_id);
    return adapter.analyze_project(args.project_id);
}

json run_risk_set(const CLIArgs& args, const riskcalc::RunConfig& config) {
    std::cerr << "Loading risk set from " << args.risks_path << "..." << std::flush;
    riskcalc::io::RiskSet set = riskcalc::io::read_risk_set_from_file(args.risks_path);
    std::cerr << " loaded " << set.risks.size() << " risks, "
              << set.correlations.size() << " correlation pairs\n";

    riskcalc::Logger& logger = riskcalc::Logger::get_instance();
    riskcalc::AnalysisContext ctx("", "risks");

    riskcalc::ValidationReport report =
        riskcalc::validate_simulation_parameters(set.risks, static_cast<size_t>(config.iterations));
    for (const auto& warning : report.warnings) {
        logger.log_warning(ctx, warning);
    }

    logger.log_analysis_start(ctx, static_cast<size_t>(config.iterations));
    riskcalc::SimulationResults results = riskcalc::run_simulation(
        set.risks,
        static_cast<size_t>(config.iterations),
        set.correlations.empty() ? nullptr : &set.correlations,
        config.seed);
    logger.log_simulation_complete(ctx, results);
    if (results.correlation_adjusted()) {
        logger.log_correlation_adjusted(ctx, results.simulation_id());
    }
    logger.log_analysis_complete(ctx, set.risks.size(), results.simulation_id());

    std::cerr << "\nResults:\n";
    std::cerr << "  Simulation: " << results.simulation_id() << "\n";
    std::cerr << "  Iterations: " << results.iteration_count() << "\n";
    std::cerr << "  Seed:       " << results.seed() << "\n";
    std::cerr << "  Converged:  " << (results.convergence().converged ? "yes" : "no") << "\n";
    std::cerr << "  Execution:  " << results.execution_time() * 1000.0 << " ms\n";

    if (!config.parquet_path.empty()) {
        riskcalc::ParquetWriter::write_results(results, config.parquet_path);
        std::cerr << "  Parquet:    " << config.parquet_path << "\n";
    }

    return riskcalc::io::simulation_report_to_json(results, config.confidence_levels, config.top_n);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 1;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        riskcalc::RunConfig config = merge_config(args);
        riskcalc::Logger::get_instance().configure(config.logging);

        json output = args.risks_path.empty() ? run_project_analysis(args, config)
                                              : run_risk_set(args, config);

        if (config.output_path.empty()) {
            riskcalc::io::write_json(std::cout, output);
        } else {
            riskcalc::io::write_json(config.output_path, output);
            std::cerr << "\nOutput written to: " << config.output_path << "\n";
        }

        riskcalc::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        riskcalc::Logger::get_instance().log_error(riskcalc::AnalysisContext(args.project_id, args.analysis),
                                                   e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
