#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "params.hpp"
#include "errors.hpp"
#include <string>

using namespace retirecalc;
using Catch::Approx;

namespace {

// Expects validation to fail on the named field
void require_invalid(const SimulationParameters& params, const std::string& field) {
    try {
        validate_parameters(params);
        FAIL("validate_parameters accepted an invalid '" << field << "'");
    } catch (const InvalidParameterError& e) {
        REQUIRE(e.field() == field);
        REQUIRE(std::string(e.what()).find(field) != std::string::npos);
    }
}

SimulationParameters make_couple_params() {
    Person primary;
    primary.age = 62;
    primary.retirement_age = 65;
    Person spouse;
    spouse.age = 60;
    spouse.gender = Gender::Female;

    SimulationParameters params;
    params.household = CoupleHousehold(primary, spouse);
    params.assets = AssetBuckets(500000.0, 100000.0, 200000.0, 20000.0, 150000.0);
    return params;
}

} // anonymous namespace

// ============================================================================
// Defaults and helpers
// ============================================================================

TEST_CASE("Default parameters validate", "[params]") {
    SimulationParameters params;
    REQUIRE_NOTHROW(validate_parameters(params));
    REQUIRE_NOTHROW(validate_parameters(make_couple_params()));
}

TEST_CASE("Household helpers", "[params]") {
    SECTION("Single household") {
        SimulationParameters params;
        REQUIRE_FALSE(is_couple(params.household));
        REQUIRE(household_filing_status(params.household) == FilingStatus::Single);
        REQUIRE(primary_person(params.household).age == 65);
    }

    SECTION("Couple files jointly") {
        SimulationParameters params = make_couple_params();
        REQUIRE(is_couple(params.household));
        REQUIRE(household_filing_status(params.household) == FilingStatus::MarriedJoint);
        REQUIRE(primary_person(params.household).age == 62);
    }
}

TEST_CASE("Asset bucket totals", "[params]") {
    AssetBuckets assets(100.0, 200.0, 300.0, 50.0, 100.0);
    REQUIRE(assets.total() == Approx(650.0));
    REQUIRE(assets.invested() == Approx(600.0));
}

TEST_CASE("Expense profile split", "[params]") {
    ExpenseProfile expenses;
    expenses.annual_expenses = 80000.0;
    expenses.essential_fraction = 0.75;
    REQUIRE(expenses.essential() == Approx(60000.0));
    REQUIRE(expenses.discretionary() == Approx(20000.0));
}

TEST_CASE("Glide path moves stocks into bonds", "[params]") {
    AllocationPolicy allocation;
    allocation.weights = {0.60, 0.35, 0.05};
    allocation.glide_path = true;
    allocation.glide_end_stocks = 0.30;
    allocation.glide_years = 10;

    SECTION("Start of the path") {
        AssetVector w = allocation.weights_for_year(0);
        REQUIRE(w[0] == Approx(0.60));
        REQUIRE(w[1] == Approx(0.35));
    }

    SECTION("Halfway") {
        AssetVector w = allocation.weights_for_year(5);
        REQUIRE(w[0] == Approx(0.45));
        REQUIRE(w[1] == Approx(0.50));
        REQUIRE(w[2] == Approx(0.05));
    }

    SECTION("Holds the end weight after glide_years") {
        AssetVector w = allocation.weights_for_year(25);
        REQUIRE(w[0] == Approx(0.30));
        REQUIRE(w[1] == Approx(0.65));
        REQUIRE(w[0] + w[1] + w[2] == Approx(1.0));
    }

    SECTION("Static weights without a glide path") {
        allocation.glide_path = false;
        AssetVector w = allocation.weights_for_year(5);
        REQUIRE(w[0] == Approx(0.60));
    }
}

TEST_CASE("Enum names parse at ingestion", "[params]") {
    REQUIRE(parse_gender("female", "g") == Gender::Female);
    REQUIRE(parse_gender("M", "g") == Gender::Male);
    REQUIRE(parse_health("poor", "h") == HealthStatus::Poor);
    REQUIRE(parse_filing_status("married", "f") == FilingStatus::MarriedJoint);
    REQUIRE(parse_filing_status("head_of_household", "f") == FilingStatus::HeadOfHousehold);

    REQUIRE(filing_status_to_string(FilingStatus::HeadOfHousehold) == "head_of_household");
    REQUIRE(care_type_to_string(CareType::MemoryCare) == "memory_care");

    try {
        parse_health("great", "household.person.health");
        FAIL("unknown health status accepted");
    } catch (const InvalidParameterError& e) {
        REQUIRE(e.field() == "household.person.health");
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Validation names the offending field", "[params][validation]") {
    SimulationParameters params;

    SECTION("Claim age outside 62-70") {
        std::get<SingleHousehold>(params.household).person.social_security.claim_age = 61;
        require_invalid(params, "household.person.social_security.claim_age");
    }

    SECTION("Single household filing jointly") {
        std::get<SingleHousehold>(params.household).filing_status = FilingStatus::MarriedJoint;
        require_invalid(params, "household.filing_status");
    }

    SECTION("Negative balance") {
        params.assets.tax_free = -1.0;
        require_invalid(params, "assets.tax_free");
    }

    SECTION("Basis above the taxable balance") {
        params.assets.capital_gains = 1000.0;
        params.assets.capital_gains_basis = 2000.0;
        require_invalid(params, "assets.capital_gains_basis");
    }

    SECTION("Weights must sum to one") {
        params.allocation.weights = {0.6, 0.3, 0.05};
        require_invalid(params, "allocation.weights");
    }

    SECTION("Correlation not positive definite") {
        params.market.correlation = {{{1.0, 0.9, -0.9},
                                      {0.9, 1.0, 0.9},
                                      {-0.9, 0.9, 1.0}}};
        require_invalid(params, "market.correlation");
    }

    SECTION("Asymmetric correlation") {
        params.market.correlation[0][1] = 0.3;
        require_invalid(params, "market.correlation");
    }

    SECTION("Guardrail floor") {
        params.guardrails.floor = 0.0;
        require_invalid(params, "guardrails.floor");
    }

    SECTION("Guardrail ceiling below one") {
        params.guardrails.ceiling = 0.9;
        require_invalid(params, "guardrails.ceiling");
    }

    SECTION("Zero iterations") {
        params.simulation.iterations = 0;
        require_invalid(params, "simulation.iterations");
    }

    SECTION("Control horizon") {
        params.simulation.variance_reduction.control_years = 0;
        require_invalid(params, "simulation.control_years");
    }

    SECTION("Stratified years") {
        params.simulation.variance_reduction.lhs_years = 121;
        require_invalid(params, "simulation.lhs_years");
    }

    SECTION("Search target") {
        params.simulation.swr_target_success = 1.0;
        require_invalid(params, "simulation.swr_target_success");
    }

    SECTION("LTC onset range") {
        params.ltc.onset_age_min = 90;
        params.ltc.onset_age_max = 80;
        require_invalid(params, "ltc.onset_age");
    }

    SECTION("Survivor expense ratio") {
        SimulationParameters couple = make_couple_params();
        std::get<CoupleHousehold>(couple.household).survivor_expense_ratio = 0.0;
        require_invalid(couple, "household.survivor_expense_ratio");
    }

    SECTION("Spouse fields are prefixed") {
        SimulationParameters couple = make_couple_params();
        std::get<CoupleHousehold>(couple.household).spouse.age = 130;
        require_invalid(couple, "household.spouse.age");
    }
}
