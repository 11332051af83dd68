#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include "errors.hpp"
#include "logger.hpp"
#include "mortality.hpp"
#include "params.hpp"
#include "simulation.hpp"
#include "io/json_writer.hpp"
#include "io/params_reader.hpp"
#include "io/parquet_writer.hpp"

namespace {

constexpr int EXIT_INVALID_INPUT = 1;
constexpr int EXIT_INFRASTRUCTURE = 2;
constexpr int EXIT_UNSUPPORTED = 3;

struct CLIArgs {
    std::string params_path;
    std::string output_path;
    std::string mortality_path;
    std::string cashflows_parquet_path;
    std::string log_level = "INFO";
    std::string log_file;
    // Overrides of the profile's simulation section
    std::optional<size_t> iterations;
    std::optional<uint64_t> seed;
    int workers = 0;
    bool swr = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RetireCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --params <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --params <path>             JSON household profile (required)\n";
    std::cerr << "  --mortality <path>          CSV mortality table (age,male_qx,female_qx)\n";
    std::cerr << "                              overriding the built-in SSA 2021 table\n\n";
    std::cerr << "Simulation options (override the profile):\n";
    std::cerr << "  --iterations <count>        Number of scenarios\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility\n";
    std::cerr << "  --workers <count>           Worker threads (default: hardware concurrency)\n";
    std::cerr << "  --swr                       Search for the safe withdrawal rate\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --cashflows-parquet <path>  Representative scenario cash flows as Parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append JSON log lines to this file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 invalid input, 2 infrastructure failure (retry),\n";
    std::cerr << "            3 feature not supported by this build\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --params data/sample_household.json \\\n";
    std::cerr << "      --iterations 5000 --seed 7 --swr --output results.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--params" && i + 1 < argc) {
                args.params_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--mortality" && i + 1 < argc) {
                args.mortality_path = argv[++i];
            } else if (arg == "--cashflows-parquet" && i + 1 < argc) {
                args.cashflows_parquet_path = argv[++i];
            } else if (arg == "--iterations" && i + 1 < argc) {
                long long value = std::stoll(argv[++i]);
                if (value <= 0) {
                    std::cerr << "Error: --iterations must be positive\n";
                    return false;
                }
                args.iterations = static_cast<size_t>(value);
            } else if (arg == "--seed" && i + 1 < argc) {
                // stoull accepts "-5" and wraps it modulo 2^64
                std::string value = argv[++i];
                size_t first = value.find_first_not_of(" \t");
                if (first != std::string::npos && value[first] == '-') {
                    std::cerr << "Error: --seed must not be negative\n";
                    return false;
                }
                args.seed = std::stoull(value);
            } else if (arg == "--workers" && i + 1 < argc) {
                args.workers = std::stoi(argv[++i]);
            } else if (arg == "--swr") {
                args.swr = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.params_path.empty()) {
        std::cerr << "Error: --params is required\n";
        valid = false;
    } else if (!file_exists(args.params_path)) {
        std::cerr << "Error: Parameters file not found: " << args.params_path << "\n";
        valid = false;
    }

    if (!args.mortality_path.empty() && !file_exists(args.mortality_path)) {
        std::cerr << "Error: Mortality file not found: " << args.mortality_path << "\n";
        valid = false;
    }

    if (args.workers < 0) {
        std::cerr << "Error: --workers must not be negative\n";
        valid = false;
    }

    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_INVALID_INPUT;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_INVALID_INPUT;
    }

    // Refuse before running rather than after minutes of simulation
    if (!args.cashflows_parquet_path.empty() && !retirecalc::ParquetWriter::available()) {
        std::cerr << "Error: --cashflows-parquet is not supported by this build "
                  << "(rebuild with Apache Arrow and Parquet)\n";
        return EXIT_UNSUPPORTED;
    }

    retirecalc::LoggerConfig log_config;
    log_config.min_level = retirecalc::string_to_level(args.log_level);
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    retirecalc::Logger::get_instance().configure(log_config);

    try {
        retirecalc::SimulationParameters params =
            retirecalc::io::load_parameters_json(args.params_path);

        if (args.iterations) params.simulation.iterations = *args.iterations;
        if (args.seed) params.simulation.seed = *args.seed;
        if (args.swr) params.simulation.compute_safe_withdrawal_rate = true;

        std::optional<retirecalc::MortalityTable> mortality;
        if (!args.mortality_path.empty()) {
            mortality = retirecalc::MortalityTable::load_from_csv(args.mortality_path);
        }

        retirecalc::SimulationOptions options;
        options.worker_threads = args.workers;
        options.mortality = mortality ? &*mortality : nullptr;
        options.include_representative = true;

        retirecalc::SimulationResult result = retirecalc::run_simulation(params, options);

        std::cerr << "Results:\n";
        std::cerr << "  Success probability: " << result.success_probability;
        if (result.control_variate_applied) {
            std::cerr << " (control-variate estimate " << result.adjusted_success_probability << ")";
        }
        std::cerr << "\n";
        std::cerr << "  P10/P50/P90 ending:  " << result.p10_ending_balance << " / "
                  << result.p50_ending_balance << " / " << result.p90_ending_balance << "\n";
        std::cerr << "  Scenarios:           " << result.successful_scenarios << " ok, "
                  << result.failed_scenarios << " failed, "
                  << result.excluded_scenarios << " excluded\n";
        if (result.safe_withdrawal.computed) {
            std::cerr << "  Safe withdrawal:     " << result.safe_withdrawal.rate
                      << (result.safe_withdrawal.low_confidence ? " (low confidence)" : "") << "\n";
        }
        std::cerr << "  CVaR 95 ending:      " << result.risk.cvar_95 << "\n";
        std::cerr << "  Execution:           " << result.execution_time_ms << " ms\n";

        if (!args.cashflows_parquet_path.empty()) {
            retirecalc::ParquetWriter::write_cashflows(result.representative_cashflows,
                                                       args.cashflows_parquet_path);
            std::cerr << "Cash flows written to: " << args.cashflows_parquet_path << "\n";
        }

        if (args.output_path.empty()) {
            retirecalc::io::write_simulation_result_json(std::cout, result);
        } else {
            retirecalc::io::write_simulation_result_json(args.output_path, result);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }

        retirecalc::Logger::get_instance().flush();
        return 0;
    } catch (const retirecalc::InfrastructureError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_INFRASTRUCTURE;
    } catch (const retirecalc::RunCancelledError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_INFRASTRUCTURE;
    } catch (const std::exception& e) {
        // Invalid parameters, malformed profiles and unreadable files
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_INVALID_INPUT;
    }
}
