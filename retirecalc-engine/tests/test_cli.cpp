#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef RETIRECALC_BINARY
#define RETIRECALC_BINARY "./retirecalc"
#endif

#ifndef RETIRECALC_DATA_DIR
#define RETIRECALC_DATA_DIR "../retirecalc-engine/data"
#endif

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    if (in) {
        ss << in.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/retirecalc_test_stdout.txt";
    std::string stderr_file = "/tmp/retirecalc_test_stderr.txt";

    std::string full_cmd = std::string(RETIRECALC_BINARY) + " " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns the raw wait status)
    result.exit_code = WEXITSTATUS(status);

    return result;
}

std::string sample_profile() {
    return std::string(RETIRECALC_DATA_DIR) + "/sample_household.json";
}

std::string sample_mortality() {
    return std::string(RETIRECALC_DATA_DIR) + "/sample_mortality.csv";
}

} // anonymous namespace

using Catch::Approx;

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--params") != std::string::npos);
    REQUIRE(result.stderr_output.find("--mortality") != std::string::npos);
    REQUIRE(result.stderr_output.find("--iterations") != std::string::npos);
    REQUIRE(result.stderr_output.find("--seed") != std::string::npos);
    REQUIRE(result.stderr_output.find("--swr") != std::string::npos);
    REQUIRE(result.stderr_output.find("--output") != std::string::npos);
    REQUIRE(result.stderr_output.find("--cashflows-parquet") != std::string::npos);
    REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
}

TEST_CASE("CLI requires a parameters file", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("--params is required") != std::string::npos);
}

TEST_CASE("CLI rejects bad arguments", "[cli]") {
    SECTION("Missing parameters file") {
        auto result = run_command("--params /nonexistent/profile.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Parameters file not found") != std::string::npos);
    }

    SECTION("Unknown option") {
        auto result = run_command("--params " + sample_profile() + " --frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    }

    SECTION("Non-positive iteration count") {
        auto result = run_command("--params " + sample_profile() + " --iterations 0");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Negative seed") {
        auto result = run_command("--params " + sample_profile() + " --seed -5");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--seed must not be negative") != std::string::npos);
        REQUIRE(result.stdout_output.empty());
    }

    SECTION("Non-numeric seed") {
        auto result = run_command("--params " + sample_profile() + " --seed abc");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid numeric argument") != std::string::npos);
    }

    SECTION("Invalid profile") {
        std::string bad_profile = "/tmp/retirecalc_test_bad_profile.json";
        {
            std::ofstream out(bad_profile);
            out << R"({ "household": { "person": { "age": 65 } },
                        "allocation": { "stocks": 0.9, "bonds": 0.9, "cash": 0.0 } })";
        }
        auto result = run_command("--params " + bad_profile);
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("allocation.weights") != std::string::npos);
        std::filesystem::remove(bad_profile);
    }
}

TEST_CASE("CLI runs the sample household", "[cli][integration]") {
    SECTION("JSON to stdout") {
        auto result = run_command("--params " + sample_profile() +
                                  " --iterations 200 --seed 7 --workers 2 --log-level WARN");
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_output.find("success_probability") != std::string::npos);
        REQUIRE(result.stderr_output.find("Results:") != std::string::npos);

        auto j = nlohmann::json::parse(result.stdout_output);
        REQUIRE(j["scenarios"]["total"].get<int>() == 200);
        double p = j["statistics"]["success_probability"].get<double>();
        REQUIRE(p >= 0.0);
        REQUIRE(p <= 1.0);
    }

    SECTION("JSON to a file with a custom mortality table") {
        std::string output = "/tmp/retirecalc_test_result.json";
        std::filesystem::remove(output);

        auto result = run_command("--params " + sample_profile() + " --mortality " +
                                  sample_mortality() + " --iterations 100 --output " + output);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stderr_output.find("Output written to:") != std::string::npos);
        REQUIRE(std::filesystem::exists(output));

        auto j = nlohmann::json::parse(read_file(output));
        REQUIRE(j.contains("balance_bands"));
        std::filesystem::remove(output);
    }

    SECTION("Same seed gives the same answer") {
        auto a = run_command("--params " + sample_profile() + " --iterations 100 --seed 11");
        auto b = run_command("--params " + sample_profile() + " --iterations 100 --seed 11");
        REQUIRE(a.exit_code == 0);
        REQUIRE(b.exit_code == 0);
        auto ja = nlohmann::json::parse(a.stdout_output);
        auto jb = nlohmann::json::parse(b.stdout_output);
        REQUIRE(ja["statistics"] == jb["statistics"]);
    }
}

#ifndef HAVE_ARROW
TEST_CASE("CLI reports Parquet export as unsupported without Arrow", "[cli][parquet]") {
    std::string output = "/tmp/retirecalc_test_cashflows.parquet";
    std::filesystem::remove(output);

    auto result = run_command("--params " + sample_profile() +
                              " --iterations 50 --cashflows-parquet " + output);
    REQUIRE(result.exit_code == 3);
    REQUIRE(result.stderr_output.find("not supported by this build") != std::string::npos);
    // Refused before any scenario ran
    REQUIRE(result.stderr_output.find("Results:") == std::string::npos);
    REQUIRE(result.stdout_output.empty());
    REQUIRE_FALSE(std::filesystem::exists(output));
}
#else
TEST_CASE("CLI writes representative cash flows as Parquet", "[cli][parquet]") {
    std::string output = "/tmp/retirecalc_test_cashflows.parquet";
    std::filesystem::remove(output);

    auto result = run_command("--params " + sample_profile() +
                              " --iterations 50 --cashflows-parquet " + output);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Cash flows written to:") != std::string::npos);
    REQUIRE(std::filesystem::file_size(output) > 0);
    std::filesystem::remove(output);
}
#endif // HAVE_ARROW

TEST_CASE("CLI reports the control-variate estimate separately", "[cli][integration]") {
    auto result = run_command("--params " + sample_profile() + " --iterations 200 --seed 3");
    REQUIRE(result.exit_code == 0);

    auto j = nlohmann::json::parse(result.stdout_output);
    const auto& stats = j["statistics"];
    const double valid = j["scenarios"]["total"].get<double>() - j["scenarios"]["excluded"].get<double>();
    REQUIRE(stats["success_probability"].get<double>() * valid ==
            Approx(j["scenarios"]["successful"].get<double>()).margin(1e-3));
    REQUIRE(stats.contains("adjusted_success_probability"));
    REQUIRE(j.contains("risk"));
    REQUIRE(j["risk"]["danger_zones"].is_array());
}
