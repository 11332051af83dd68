#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mortality.hpp"
#include <sstream>
#include <string>

using namespace retirecalc;
using Catch::Approx;

namespace {

MortalityTable make_flat_mortality(double qx) {
    MortalityTable table;
    for (int age = 0; age <= MortalityTable::MAX_AGE; ++age) {
        table.set_qx(age, Gender::Male, qx);
        table.set_qx(age, Gender::Female, qx * 0.8);
    }
    return table;
}

Person make_person(int age, Gender gender, int life_expectancy = 90) {
    Person p;
    p.age = age;
    p.retirement_age = age;
    p.gender = gender;
    p.life_expectancy = life_expectancy;
    return p;
}

} // anonymous namespace

// ============================================================================
// MortalityTable
// ============================================================================

TEST_CASE("MortalityTable get and set", "[mortality]") {
    MortalityTable table;

    SECTION("Default values are zero") {
        REQUIRE(table.get_qx(0, Gender::Male) == 0.0);
        REQUIRE(table.get_qx(120, Gender::Female) == 0.0);
    }

    SECTION("Set and get") {
        table.set_qx(70, Gender::Male, 0.025);
        table.set_qx(70, Gender::Female, 0.018);
        REQUIRE(table.get_qx(70, Gender::Male) == Approx(0.025));
        REQUIRE(table.get_qx(70, Gender::Female) == Approx(0.018));
    }

    SECTION("Out of range age throws") {
        REQUIRE_THROWS_AS(table.set_qx(121, Gender::Male, 0.5), std::out_of_range);
        REQUIRE_THROWS_AS(table.get_qx(-1, Gender::Male), std::out_of_range);
    }

    SECTION("Invalid qx throws") {
        REQUIRE_THROWS_AS(table.set_qx(50, Gender::Male, 1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(table.set_qx(50, Gender::Male, -0.1), std::invalid_argument);
    }
}

TEST_CASE("Hazard applies the multiplier and caps at one", "[mortality]") {
    MortalityTable table = make_flat_mortality(0.4);
    REQUIRE(table.hazard(70, Gender::Male, 1.0) == Approx(0.4));
    REQUIRE(table.hazard(70, Gender::Male, 1.6) == Approx(0.64));
    REQUIRE(table.hazard(70, Gender::Male, 3.0) == 1.0);
    REQUIRE(table.hazard(120, Gender::Male, 0.5) == 1.0);
    REQUIRE(table.hazard(150, Gender::Female, 0.5) == 1.0);
}

TEST_CASE("Built-in SSA table", "[mortality]") {
    const MortalityTable& table = MortalityTable::ssa_2021();

    REQUIRE(table.get_qx(65, Gender::Male) > table.get_qx(65, Gender::Female));
    REQUIRE(table.get_qx(90, Gender::Male) > table.get_qx(70, Gender::Male));
    REQUIRE(table.get_qx(30, Gender::Male) == table.get_qx(50, Gender::Male));
    REQUIRE(table.get_qx(120, Gender::Female) == 1.0);

    double male = life_expectancy(table, 65, Gender::Male, HealthStatus::Good);
    double female = life_expectancy(table, 65, Gender::Female, HealthStatus::Good);
    REQUIRE(male > 80.0);
    REQUIRE(male < 86.0);
    REQUIRE(female > male);
    REQUIRE(life_expectancy(table, 65, Gender::Male, HealthStatus::Poor) < male);
    REQUIRE(life_expectancy(table, 65, Gender::Male, HealthStatus::Excellent) > male);
}

TEST_CASE("Load mortality from CSV", "[mortality][io]") {
    std::istringstream csv(
        "# test rows\n"
        "age,male_qx,female_qx\n"
        "70,0.030000,0.020000\n"
        "\n"
        "71,0.033000,0.022000\n");

    MortalityTable table = MortalityTable::load_from_csv(csv);
    REQUIRE(table.get_qx(70, Gender::Male) == Approx(0.03));
    REQUIRE(table.get_qx(71, Gender::Female) == Approx(0.022));
    // Rows not in the file keep the built-in rates
    REQUIRE(table.get_qx(80, Gender::Male) == MortalityTable::ssa_2021().get_qx(80, Gender::Male));
}

TEST_CASE("Malformed mortality CSV is rejected", "[mortality][io]") {
    std::istringstream missing_column("age,male_qx,female_qx\n70,0.03\n");
    REQUIRE_THROWS_AS(MortalityTable::load_from_csv(missing_column), std::runtime_error);

    std::istringstream bad_rate("age,male_qx,female_qx\n70,1.5,0.02\n");
    REQUIRE_THROWS_AS(MortalityTable::load_from_csv(bad_rate), std::invalid_argument);

    REQUIRE_THROWS_AS(MortalityTable::load_from_csv("/nonexistent/mortality.csv"),
                      std::runtime_error);
}

#ifdef RETIRECALC_DATA_DIR
TEST_CASE("Sample mortality table loads", "[mortality][io]") {
    MortalityTable table =
        MortalityTable::load_from_csv(std::string(RETIRECALC_DATA_DIR) + "/sample_mortality.csv");
    REQUIRE(table.get_qx(50, Gender::Male) == Approx(0.0045));
    REQUIRE(table.get_qx(50, Gender::Female) == Approx(0.0028));
    REQUIRE(table.get_qx(119, Gender::Male) == Approx(1.0));
}
#endif

// ============================================================================
// Survival and horizons
// ============================================================================

TEST_CASE("Survival probability", "[mortality]") {
    MortalityTable table = make_flat_mortality(0.1);

    REQUIRE(survival_probability(table, 70, 70, Gender::Male, HealthStatus::Good) == 1.0);
    REQUIRE(survival_probability(table, 70, 72, Gender::Male, HealthStatus::Good) ==
            Approx(0.81));
    REQUIRE(survival_probability(table, 70, 71, Gender::Male, HealthStatus::Fair) ==
            Approx(0.87));
    REQUIRE(survival_probability(table, 70, 125, Gender::Male, HealthStatus::Good) == 0.0);
}

TEST_CASE("Fixed horizon uses life expectancy", "[mortality]") {
    const MortalityTable& table = MortalityTable::ssa_2021();
    RandomStream stream(1);

    SECTION("Single") {
        Household household = SingleHousehold(make_person(65, Gender::Male, 85));
        Horizon horizon = sample_horizon(table, household, false, stream);
        REQUIRE(horizon.primary_final_age == 85);
        REQUIRE(horizon.spouse_final_age == -1);
        REQUIRE(horizon.years == 21);
        REQUIRE(horizon.primary_alive(20, 65));
        REQUIRE_FALSE(horizon.primary_alive(21, 65));
        REQUIRE_FALSE(horizon.spouse_alive(0, 60));
    }

    SECTION("Couple ends with the later death") {
        Household household = CoupleHousehold(make_person(70, Gender::Male, 80),
                                              make_person(60, Gender::Female, 90));
        Horizon horizon = sample_horizon(table, household, false, stream);
        REQUIRE(horizon.years == 31);
        REQUIRE_FALSE(horizon.primary_alive(11, 70));
        REQUIRE(horizon.spouse_alive(30, 60));
    }

    SECTION("Life expectancy already reached") {
        Household household = SingleHousehold(make_person(92, Gender::Male, 90));
        Horizon horizon = sample_horizon(table, household, false, stream);
        REQUIRE(horizon.years == 0);
    }
}

TEST_CASE("Sampled horizons follow the table", "[mortality]") {
    const MortalityTable& table = MortalityTable::ssa_2021();
    Person person = make_person(65, Gender::Female);

    double total = 0.0;
    const int n = 4000;
    for (int i = 0; i < n; ++i) {
        RandomStream stream(static_cast<uint64_t>(i) * 7919 + 1);
        int age = final_age(table, person, true, stream);
        REQUIRE(age >= 65);
        REQUIRE(age <= MortalityTable::MAX_AGE);
        total += age;
    }

    // Sampled final age is curtate, half a year below the expectation
    double expected = life_expectancy(table, 65, Gender::Female, HealthStatus::Good) - 0.5;
    REQUIRE(total / n == Approx(expected).margin(0.6));
}

TEST_CASE("Certain death ends the horizon in the first year", "[mortality]") {
    MortalityTable table = make_flat_mortality(1.0);
    RandomStream stream(5);
    Person person = make_person(70, Gender::Male);
    REQUIRE(final_age(table, person, true, stream) == 70);
}
