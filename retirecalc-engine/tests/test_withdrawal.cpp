#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "withdrawal.hpp"

using namespace retirecalc;
using Catch::Approx;

namespace {

AssetBuckets make_buckets() {
    // deferred, free, taxable, cash, basis
    return AssetBuckets(100000.0, 50000.0, 40000.0, 10000.0, 30000.0);
}

GuardrailPolicy make_policy() {
    GuardrailPolicy policy;
    policy.enabled = true;
    policy.upper_threshold = 1.2;
    policy.lower_threshold = 0.8;
    policy.cut_percent = 0.10;
    policy.raise_percent = 0.10;
    policy.floor = 0.7;
    policy.ceiling = 1.3;
    return policy;
}

} // anonymous namespace

// ============================================================================
// Guardrails
// ============================================================================

TEST_CASE("First evaluation fixes the initial rate", "[withdrawal][guardrails]") {
    GuardrailController controller(make_policy());
    REQUIRE_FALSE(controller.initialized());

    REQUIRE(controller.evaluate(40000.0, 1000000.0) == GuardrailAdjustment::None);
    REQUIRE(controller.initialized());
    REQUIRE(controller.initial_rate() == Approx(0.04));
    REQUIRE(controller.multiplier() == 1.0);
    REQUIRE(controller.state() == GuardrailState::Normal);
}

TEST_CASE("No withdrawal in the first year uses the policy rate", "[withdrawal][guardrails]") {
    GuardrailPolicy policy = make_policy();
    policy.withdrawal_rate = 0.05;
    GuardrailController controller(policy);
    controller.evaluate(0.0, 1000000.0);
    REQUIRE(controller.initial_rate() == Approx(0.05));
}

TEST_CASE("Guardrail cuts and raises", "[withdrawal][guardrails]") {
    GuardrailController controller(make_policy());
    controller.evaluate(40000.0, 1000000.0);

    SECTION("Rate above the upper guardrail cuts") {
        REQUIRE(controller.evaluate(50000.0, 1000000.0) == GuardrailAdjustment::Cut);
        REQUIRE(controller.state() == GuardrailState::CapitalPreservation);
        REQUIRE(controller.multiplier() == Approx(0.9));
    }

    SECTION("Rate below the lower guardrail raises") {
        REQUIRE(controller.evaluate(30000.0, 1000000.0) == GuardrailAdjustment::Raise);
        REQUIRE(controller.state() == GuardrailState::Prosperity);
        REQUIRE(controller.multiplier() == Approx(1.1));
    }

    SECTION("Inside the band nothing changes") {
        REQUIRE(controller.evaluate(44000.0, 1000000.0) == GuardrailAdjustment::None);
        REQUIRE(controller.state() == GuardrailState::Normal);
        REQUIRE(controller.multiplier() == 1.0);
    }

    SECTION("Empty portfolio") {
        REQUIRE(controller.evaluate(40000.0, 0.0) == GuardrailAdjustment::None);
    }
}

TEST_CASE("Multiplier stays within floor and ceiling", "[withdrawal][guardrails]") {
    GuardrailPolicy policy = make_policy();

    SECTION("Repeated cuts stop at the floor") {
        GuardrailController controller(policy);
        controller.evaluate(40000.0, 1000000.0);
        int cuts = 0;
        for (int i = 0; i < 20; ++i) {
            if (controller.evaluate(80000.0, 1000000.0) == GuardrailAdjustment::Cut) {
                ++cuts;
            }
            REQUIRE(controller.multiplier() >= policy.floor);
            REQUIRE(controller.multiplier() <= policy.ceiling);
        }
        REQUIRE(controller.multiplier() == Approx(policy.floor));
        // 1.0 -> 0.9 -> 0.81 -> 0.729 -> 0.7
        REQUIRE(cuts == 4);
    }

    SECTION("Repeated raises stop at the ceiling") {
        GuardrailController controller(policy);
        controller.evaluate(40000.0, 1000000.0);
        for (int i = 0; i < 20; ++i) {
            controller.evaluate(10000.0, 1000000.0);
            REQUIRE(controller.multiplier() >= policy.floor);
            REQUIRE(controller.multiplier() <= policy.ceiling);
        }
        REQUIRE(controller.multiplier() == Approx(policy.ceiling));
    }

    SECTION("Disabled guardrails never adjust") {
        policy.enabled = false;
        GuardrailController controller(policy);
        controller.evaluate(40000.0, 1000000.0);
        REQUIRE(controller.evaluate(90000.0, 1000000.0) == GuardrailAdjustment::None);
        REQUIRE(controller.multiplier() == 1.0);
    }
}

// ============================================================================
// Withdrawal sequencing
// ============================================================================

TEST_CASE("Withdrawal order", "[withdrawal]") {
    AssetBuckets buckets = make_buckets();

    SECTION("Cash first") {
        WithdrawalPlan plan = plan_withdrawal(buckets, 8000.0, 0.0);
        REQUIRE(plan.cash == Approx(8000.0));
        REQUIRE(plan.taxable == 0.0);
        REQUIRE(plan.total() == Approx(8000.0));
    }

    SECTION("Then taxable, tax-deferred and tax-free") {
        WithdrawalPlan plan = plan_withdrawal(buckets, 170000.0, 0.0);
        REQUIRE(plan.cash == Approx(10000.0));
        REQUIRE(plan.taxable == Approx(40000.0));
        REQUIRE(plan.tax_deferred == Approx(100000.0));
        REQUIRE(plan.tax_free == Approx(20000.0));
    }

    SECTION("RMD comes out of tax-deferred before cash") {
        WithdrawalPlan plan = plan_withdrawal(buckets, 12000.0, 5000.0);
        REQUIRE(plan.rmd == Approx(5000.0));
        REQUIRE(plan.tax_deferred == Approx(5000.0));
        REQUIRE(plan.cash == Approx(7000.0));
    }

    SECTION("Request above the total is capped") {
        WithdrawalPlan plan = plan_withdrawal(buckets, 1e9, 0.0);
        REQUIRE(plan.total() == Approx(buckets.total()));
    }
}

TEST_CASE("Realized gains use average cost basis", "[withdrawal]") {
    AssetBuckets buckets = make_buckets();
    WithdrawalPlan plan = plan_withdrawal(buckets, 30000.0, 0.0);

    // 20000 from taxable at 75 % basis
    REQUIRE(plan.taxable == Approx(20000.0));
    REQUIRE(plan.basis_used == Approx(15000.0));
    REQUIRE(plan.realized_gains == Approx(5000.0));

    apply_withdrawal(buckets, plan);
    REQUIRE(buckets.cash_equivalents == Approx(0.0));
    REQUIRE(buckets.capital_gains == Approx(20000.0));
    REQUIRE(buckets.capital_gains_basis == Approx(15000.0));
}

TEST_CASE("Sale below basis realizes no gain", "[withdrawal]") {
    AssetBuckets buckets(0.0, 0.0, 10000.0, 0.0, 10000.0);
    buckets.capital_gains = 8000.0;
    WithdrawalPlan plan = plan_withdrawal(buckets, 4000.0, 0.0);
    REQUIRE(plan.realized_gains == 0.0);
}

TEST_CASE("Growth and reinvestment", "[withdrawal]") {
    AssetBuckets buckets = make_buckets();
    ReturnDraw draw({0.10, 0.0, 0.02}, MarketRegime::Normal);
    AssetVector weights = {0.5, 0.5, 0.0};

    apply_growth(buckets, draw, weights);
    REQUIRE(buckets.tax_deferred == Approx(105000.0));
    REQUIRE(buckets.tax_free == Approx(52500.0));
    REQUIRE(buckets.capital_gains == Approx(42000.0));
    REQUIRE(buckets.cash_equivalents == Approx(10200.0));
    // Basis does not grow
    REQUIRE(buckets.capital_gains_basis == Approx(30000.0));

    reinvest(buckets, 1000.0);
    REQUIRE(buckets.capital_gains == Approx(43000.0));
    REQUIRE(buckets.capital_gains_basis == Approx(31000.0));

    reinvest(buckets, -50.0);
    REQUIRE(buckets.capital_gains == Approx(43000.0));
}

TEST_CASE("Guardrail state names", "[withdrawal]") {
    REQUIRE(guardrail_state_to_string(GuardrailState::Normal) == "normal");
    REQUIRE(guardrail_state_to_string(GuardrailState::CapitalPreservation) == "capital_preservation");
    REQUIRE(guardrail_state_to_string(GuardrailState::Prosperity) == "prosperity");
}
