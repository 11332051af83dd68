#ifndef RETIRECALC_SCENARIO_HPP
#define RETIRECALC_SCENARIO_HPP

#include "income.hpp"
#include "ltc.hpp"
#include "mortality.hpp"
#include "params.hpp"
#include "return_generator.hpp"
#include "rng.hpp"
#include "tax.hpp"
#include "withdrawal.hpp"
#include <cstddef>
#include <vector>

namespace retirecalc {

// Shortfalls and surpluses below one cent are treated as zero
constexpr double CASH_EPSILON = 0.01;

// Retired years inspected for sequence-of-returns losses
constexpr int SEQUENCE_RISK_YEARS = 5;

// One simulated year, nominal dollars, balances at year end
struct YearlyCashFlow {
    int year;
    int age;
    int spouse_age;                 // -1 for a single household
    bool primary_alive;
    bool spouse_alive;
    bool retired;

    double end_balance;
    double tax_deferred_balance;
    double tax_free_balance;
    double taxable_balance;
    double cash_balance;

    double social_security;
    double pension;
    double part_time;
    double contributions;

    double withdrawal_cash;
    double withdrawal_taxable;
    double withdrawal_tax_deferred;
    double withdrawal_tax_free;
    double rmd;
    double realized_gains;

    double federal_tax;
    double capital_gains_tax;       // Includes NIIT
    double state_tax;
    double irmaa;
    double total_tax;
    double magi;

    double essential_expenses;
    double discretionary_expenses;
    double healthcare_expenses;
    double ltc_expenses;            // Net of insurance
    double ltc_gross;
    double ltc_insurance;

    double net_cash_flow;           // Income + withdrawals - taxes - expenses
    GuardrailState guardrail_state;
    double discretionary_multiplier;
    MarketRegime regime;
    double portfolio_return;

    YearlyCashFlow();

    double total_withdrawal() const {
        return withdrawal_cash + withdrawal_taxable + withdrawal_tax_deferred + withdrawal_tax_free;
    }
    double total_income() const { return social_security + pension + part_time; }
    double total_expenses() const {
        return essential_expenses + discretionary_expenses + healthcare_expenses + ltc_expenses;
    }
};

struct ScenarioOutcome {
    bool success;
    int years_simulated;
    int depletion_year;             // First year with unmet need, -1 if none
    double ending_balance;
    double control_statistic;       // Compound growth of the target portfolio
    int guardrail_cuts;
    int guardrail_raises;
    int retired_years;
    int early_losing_years;         // Negative portfolio returns in the first retired years
    bool ltc_occurred;
    double total_ltc_cost;          // Gross, before insurance
    std::vector<double> balance_path;
    std::vector<YearlyCashFlow> cashflows;

    ScenarioOutcome();
};

struct ScenarioConfig {
    bool detailed_cashflows;
    bool record_balance_path;

    ScenarioConfig();
};

// Runs one scenario end to end. All mutable state lives on the stack of
// run(), so one runner can be shared by every worker thread.
class ScenarioRunner {
public:
    ScenarioRunner(const SimulationParameters& params,
                   const MortalityTable& table,
                   const ReturnGenerator& generator,
                   const RngContext& rng,
                   const ScenarioConfig& config);

    // Throws NumericInstabilityError if a balance or tax becomes non-finite
    ScenarioOutcome run(size_t scenario) const;

    // Analytical expectation of the control statistic
    double expected_control_statistic() const;

    const ScenarioConfig& config() const { return config_; }

private:
    const SimulationParameters& params_;
    const MortalityTable& table_;
    const ReturnGenerator& generator_;
    const RngContext& rng_;
    ScenarioConfig config_;
    IncomeProjector projector_;
    TaxCalculator tax_;
};

} // namespace retirecalc

#endif // RETIRECALC_SCENARIO_HPP
