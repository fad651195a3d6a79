#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "config_parser.hpp"
#include "financial_model.hpp"
#include "input_validator.hpp"
#include "invariants.hpp"
#include "logger.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_INVARIANT_FAILURE = 2;

struct CLIArgs {
    std::string inputs_path;
    std::string config_path;
    std::string output_path;
    std::string csv_dir;
    std::string parquet_dir;
    std::string log_level;
    std::string log_file;
    bool log_text = false;
    bool compact = false;
    bool strict = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "CarbonCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --inputs <model.json> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --inputs <path>             JSON file with the model inputs\n";
    std::cerr << "  --config <path>             JSON run configuration (inputs, outputs, logging)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON result file (default: stdout)\n";
    std::cerr << "  --csv-dir <dir>             Also write one CSV per statement into <dir>\n";
    std::cerr << "  --parquet-dir <dir>         Also write one Parquet file per statement (requires Arrow)\n";
    std::cerr << "  --compact                   Write the JSON result on a single line\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Append log lines to <path> as well as stderr\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --strict                    Exit with status 2 if an accounting identity fails\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Command-line flags override values from --config.\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Compute a model and print the result:\n";
    std::cerr << "     " << program_name << " --inputs data/scenario_simple.json\n\n";
    std::cerr << "  2. Write JSON and CSV outputs, failing on broken identities:\n";
    std::cerr << "     " << program_name << " --inputs data/scenario_simple.json \\\n";
    std::cerr << "         --output out/result.json --csv-dir out/csv --strict\n\n";
    std::cerr << "  3. Drive everything from a run configuration:\n";
    std::cerr << "     " << program_name << " --config data/run_config.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--inputs" && i + 1 < argc) {
            args.inputs_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--csv-dir" && i + 1 < argc) {
            args.csv_dir = argv[++i];
        } else if (arg == "--parquet-dir" && i + 1 < argc) {
            args.parquet_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "--strict") {
            args.strict = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Merge the run configuration (if any) with the command line; flags win
carboncalc::RunConfig build_run_config(const CLIArgs& args) {
    carboncalc::RunConfig config;
    if (!args.config_path.empty()) {
        config = carboncalc::parse_run_config_from_file(args.config_path);
    }

    if (!args.inputs_path.empty()) config.inputs_path = args.inputs_path;
    if (!args.output_path.empty()) config.output.json_path = args.output_path;
    if (!args.csv_dir.empty()) config.output.csv_dir = args.csv_dir;
    if (!args.parquet_dir.empty()) config.output.parquet_dir = args.parquet_dir;
    if (args.compact) config.output.pretty_print = false;
    if (args.strict) config.strict = true;

    if (!args.log_level.empty()) {
        config.logging.min_level = carboncalc::string_to_level(args.log_level);
    }
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }
    if (args.log_text) {
        config.logging.enable_json = false;
    }

    if (config.inputs_path.empty()) {
        throw std::invalid_argument("--inputs is required (or set \"inputs\" in --config)");
    }
    return config;
}

std::string model_id_for(const std::string& inputs_path) {
    return fs::path(inputs_path).stem().string();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }

    // Handle help
    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    carboncalc::RunConfig config;
    try {
        config = build_run_config(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_ERROR;
    }

    carboncalc::Logger& logger = carboncalc::Logger::get_instance();
    logger.configure(config.logging);

    carboncalc::LogContext ctx(model_id_for(config.inputs_path), "parse");

    try {
        carboncalc::ModelInputs inputs = carboncalc::load_model_inputs(config.inputs_path);

        ctx.phase = "validate";
        carboncalc::FinancialModel model(std::move(inputs), ctx);

        ctx.phase = "compute";
        logger.log_run_start(ctx, model.inputs().num_years());
        carboncalc::ModelResult result = model.calculate();
        logger.log_debug(ctx, "Statements computed", {
            {"event", "phase_complete"},
            {"execution_time_ms", std::to_string(result.execution_time_ms)},
            {"implied_purchase_price", std::to_string(model.revenue_allocation().implied_purchase_price)},
            {"advisories", std::to_string(result.advisories.size())},
        });

        ctx.phase = "check";
        std::vector<carboncalc::InvariantResult> checks = carboncalc::check_invariants(result);
        for (const carboncalc::InvariantResult& check : checks) {
            if (!check.pass) {
                logger.log_invariant_failure(ctx, check.name, check.details);
            }
        }

        logger.log_debug(ctx, "Accounting identities checked", {
            {"event", "phase_complete"},
            {"checks", std::to_string(checks.size())},
        });

        carboncalc::RunSummary summary;
        summary.num_years = result.income_statements.size();
        summary.npv = result.metrics.npv;
        summary.ending_cash = result.metrics.ending_cash;
        for (const carboncalc::BalanceSheetRow& bs : result.balance_sheets) {
            summary.max_abs_balance_check =
                std::max(summary.max_abs_balance_check, std::fabs(bs.balance_check));
        }
        summary.invariant_failures = carboncalc::count_failures(checks);
        summary.execution_time_ms = result.execution_time_ms;
        logger.log_run_complete(ctx, summary);
        if (!config.strict && summary.invariant_failures > 0) {
            logger.log_warning(ctx, std::to_string(summary.invariant_failures) +
                                    " accounting identity check(s) failed; results were still written");
        }

        // Write outputs
        ctx.phase = "write";
        if (config.output.json_path.empty()) {
            carboncalc::io::write_result_json(std::cout, result, config.output.pretty_print);
        } else {
            fs::path parent = fs::path(config.output.json_path).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent);
            }
            carboncalc::io::write_result_json(config.output.json_path, result,
                                              config.output.pretty_print);
            logger.log_output_written(ctx, "json", config.output.json_path);
        }

        if (!config.output.csv_dir.empty()) {
            for (const std::string& path : carboncalc::io::write_result_csv(config.output.csv_dir, result)) {
                logger.log_output_written(ctx, "csv", path);
            }
        }

        if (!config.output.parquet_dir.empty()) {
            for (const std::string& path :
                 carboncalc::io::ParquetWriter::write_result(result, config.output.parquet_dir)) {
                logger.log_output_written(ctx, "parquet", path);
            }
        }

        logger.flush();

        if (config.strict && summary.invariant_failures > 0) {
            std::cerr << "Error: " << summary.invariant_failures << " accounting identity check(s) failed\n";
            return EXIT_INVARIANT_FAILURE;
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_ERROR;
    }
}
