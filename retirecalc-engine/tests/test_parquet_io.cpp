#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "simulation.hpp"
#include "logger.hpp"
#include "io/parquet_writer.hpp"
#include <filesystem>

using namespace retirecalc;

#ifdef HAVE_ARROW

TEST_CASE("Parquet I/O - cash flow export", "[parquet][io]") {
    SECTION("write_cashflows requires rows") {
        std::vector<YearlyCashFlow> empty;

        REQUIRE_THROWS_WITH(
            ParquetWriter::write_cashflows(empty, "cashflows.parquet"),
            Catch::Matchers::ContainsSubstring("No cash flows")
        );
    }

    SECTION("write_cashflows creates a Parquet file") {
        std::vector<YearlyCashFlow> cashflows(3);
        for (int i = 0; i < 3; ++i) {
            cashflows[i].year = i;
            cashflows[i].age = 65 + i;
            cashflows[i].end_balance = 1000000.0 - 40000.0 * i;
        }

        std::string test_output = "test_cashflows.parquet";
        if (std::filesystem::exists(test_output)) {
            std::filesystem::remove(test_output);
        }

        REQUIRE(ParquetWriter::available());
        REQUIRE_NOTHROW(ParquetWriter::write_cashflows(cashflows, test_output));
        REQUIRE(std::filesystem::exists(test_output));
        REQUIRE(std::filesystem::file_size(test_output) > 0);

        std::filesystem::remove(test_output);
    }
}

TEST_CASE("Parquet I/O - representative scenario export", "[parquet][io][integration]") {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    SimulationParameters params;
    params.simulation.iterations = 50;
    SimulationOptions options;
    options.worker_threads = 1;

    SimulationResult result = run_simulation(params, options);
    REQUIRE_FALSE(result.representative_cashflows.empty());

    std::string test_output = "test_representative.parquet";
    if (std::filesystem::exists(test_output)) {
        std::filesystem::remove(test_output);
    }

    REQUIRE_NOTHROW(ParquetWriter::write_cashflows(result.representative_cashflows, test_output));
    REQUIRE(std::filesystem::file_size(test_output) > 100);

    std::filesystem::remove(test_output);
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - Not available without Arrow", "[parquet]") {
    REQUIRE_FALSE(ParquetWriter::available());

    std::vector<YearlyCashFlow> cashflows(1);
    REQUIRE_THROWS_WITH(
        ParquetWriter::write_cashflows(cashflows, "test.parquet"),
        Catch::Matchers::ContainsSubstring("Arrow not available")
    );
}

#endif // HAVE_ARROW
