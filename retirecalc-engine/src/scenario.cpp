#include "scenario.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace retirecalc {

// ============================================================================
// Record types
// ============================================================================

YearlyCashFlow::YearlyCashFlow()
    : year(0), age(0), spouse_age(-1),
      primary_alive(false), spouse_alive(false), retired(false),
      end_balance(0.0), tax_deferred_balance(0.0), tax_free_balance(0.0),
      taxable_balance(0.0), cash_balance(0.0),
      social_security(0.0), pension(0.0), part_time(0.0), contributions(0.0),
      withdrawal_cash(0.0), withdrawal_taxable(0.0), withdrawal_tax_deferred(0.0),
      withdrawal_tax_free(0.0), rmd(0.0), realized_gains(0.0),
      federal_tax(0.0), capital_gains_tax(0.0), state_tax(0.0), irmaa(0.0),
      total_tax(0.0), magi(0.0),
      essential_expenses(0.0), discretionary_expenses(0.0), healthcare_expenses(0.0),
      ltc_expenses(0.0), ltc_gross(0.0), ltc_insurance(0.0),
      net_cash_flow(0.0),
      guardrail_state(GuardrailState::Normal),
      discretionary_multiplier(1.0),
      regime(MarketRegime::Normal),
      portfolio_return(0.0) {}

ScenarioOutcome::ScenarioOutcome()
    : success(true),
      years_simulated(0),
      depletion_year(-1),
      ending_balance(0.0),
      control_statistic(1.0),
      guardrail_cuts(0),
      guardrail_raises(0),
      retired_years(0),
      early_losing_years(0),
      ltc_occurred(false),
      total_ltc_cost(0.0) {}

ScenarioConfig::ScenarioConfig()
    : detailed_cashflows(false),
      record_balance_path(false) {}

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct Members {
    const Person* primary;
    const Person* spouse;           // nullptr for a single household
};

Members members(const Household& household) {
    if (const auto* couple = std::get_if<CoupleHousehold>(&household)) {
        return {&couple->primary, &couple->spouse};
    }
    return {&std::get<SingleHousehold>(household).person, nullptr};
}

bool finite_buckets(const AssetBuckets& buckets) {
    return std::isfinite(buckets.tax_deferred) && std::isfinite(buckets.tax_free) &&
           std::isfinite(buckets.capital_gains) && std::isfinite(buckets.cash_equivalents) &&
           std::isfinite(buckets.capital_gains_basis);
}

void record_balances(YearlyCashFlow& flow, const AssetBuckets& buckets) {
    flow.end_balance = buckets.total();
    flow.tax_deferred_balance = buckets.tax_deferred;
    flow.tax_free_balance = buckets.tax_free;
    flow.taxable_balance = buckets.capital_gains;
    flow.cash_balance = buckets.cash_equivalents;
}

} // anonymous namespace

// ============================================================================
// ScenarioRunner Implementation
// ============================================================================

ScenarioRunner::ScenarioRunner(const SimulationParameters& params,
                               const MortalityTable& table,
                               const ReturnGenerator& generator,
                               const RngContext& rng,
                               const ScenarioConfig& config)
    : params_(params),
      table_(table),
      generator_(generator),
      rng_(rng),
      config_(config),
      projector_(params),
      tax_(params.tax, params.market.inflation) {}

double ScenarioRunner::expected_control_statistic() const {
    const double expected = generator_.expected_portfolio_return(params_.allocation.weights);
    return std::pow(1.0 + expected, params_.simulation.variance_reduction.control_years);
}

ScenarioOutcome ScenarioRunner::run(size_t scenario) const {
    ScenarioOutcome outcome;

    const Members people = members(params_.household);
    const Person& primary = *people.primary;
    const bool couple = people.spouse != nullptr;

    // Mortality and LTC draws follow the sampling unit so antithetic pairs share them
    const size_t unit = generator_.sampling_unit(scenario);
    RandomStream mortality_stream = rng_.stream(unit, StreamId::Mortality);
    const Horizon horizon = sample_horizon(table_, params_.household,
                                           params_.simulation.dynamic_mortality, mortality_stream);

    LtcEpisode primary_ltc;
    LtcEpisode spouse_ltc;
    if (params_.ltc.enabled) {
        RandomStream ltc_stream = rng_.stream(unit, StreamId::LongTermCare);
        primary_ltc = sample_ltc_episode(params_.ltc, primary, params_.tax.state, ltc_stream);
        if (couple) {
            spouse_ltc = sample_ltc_episode(params_.ltc, *people.spouse, params_.tax.state,
                                            ltc_stream);
        }
    }

    const int control_years = std::max(0, params_.simulation.variance_reduction.control_years);
    const size_t draw_years = static_cast<size_t>(std::max(horizon.years, control_years));
    const std::vector<ReturnDraw> draws = generator_.generate(scenario, draw_years);

    for (int year = 0; year < control_years; ++year) {
        outcome.control_statistic *= 1.0 + draws[year].portfolio(params_.allocation.weights);
    }

    AssetBuckets buckets = params_.assets;
    GuardrailController guardrails(params_.guardrails);
    std::vector<double> magi_history;
    magi_history.reserve(horizon.years);

    if (config_.record_balance_path) {
        outcome.balance_path.reserve(horizon.years);
    }
    if (config_.detailed_cashflows) {
        outcome.cashflows.reserve(horizon.years);
    }

    for (int year = 0; year < horizon.years; ++year) {
        const bool primary_alive = horizon.primary_alive(year, primary.age);
        const bool spouse_alive = couple && horizon.spouse_alive(year, people.spouse->age);
        const int age = primary.age + year;
        const int spouse_age = couple ? people.spouse->age + year : -1;
        const ReturnDraw& draw = draws[year];
        const AssetVector weights = params_.allocation.weights_for_year(year);

        YearlyCashFlow flow;
        flow.year = year;
        flow.age = age;
        flow.spouse_age = spouse_age;
        flow.primary_alive = primary_alive;
        flow.spouse_alive = spouse_alive;
        flow.regime = draw.regime;
        flow.portfolio_return = draw.portfolio(weights);

        // RMDs are based on the balance at the end of the prior year
        const double prior_deferred = buckets.tax_deferred;

        apply_growth(buckets, draw, weights);

        if (!projector_.retired(year)) {
            double contribution = projector_.savings(year, primary_alive, spouse_alive);
            buckets.tax_deferred += contribution;
            magi_history.push_back(params_.tax.prior_magi);

            if (!finite_buckets(buckets)) {
                throw NumericInstabilityError(scenario, year, "non-finite balance before retirement");
            }

            flow.contributions = contribution;
            flow.guardrail_state = guardrails.state();
            flow.discretionary_multiplier = guardrails.multiplier();
            record_balances(flow, buckets);
            flow.net_cash_flow = contribution;
            if (config_.record_balance_path) {
                outcome.balance_path.push_back(buckets.total());
            }
            if (config_.detailed_cashflows) {
                outcome.cashflows.push_back(flow);
            }
            outcome.years_simulated = year + 1;
            continue;
        }

        flow.retired = true;
        if (outcome.retired_years < SEQUENCE_RISK_YEARS && flow.portfolio_return < 0.0) {
            ++outcome.early_losing_years;
        }
        ++outcome.retired_years;

        // ====================================================================
        // Need: guaranteed income, expenses and LTC
        // ====================================================================

        const GuaranteedIncome income = projector_.income(year, primary_alive, spouse_alive);

        LtcYearCost ltc_cost;
        if (params_.ltc.enabled) {
            if (primary_alive) {
                LtcYearCost c = ltc_cost_for_year(primary_ltc, params_.ltc, age, year);
                ltc_cost.gross += c.gross;
                ltc_cost.insurance_benefit += c.insurance_benefit;
            }
            if (spouse_alive) {
                LtcYearCost c = ltc_cost_for_year(spouse_ltc, params_.ltc, spouse_age, year);
                ltc_cost.gross += c.gross;
                ltc_cost.insurance_benefit += c.insurance_benefit;
            }
        }
        if (ltc_cost.gross > 0.0) {
            outcome.ltc_occurred = true;
            outcome.total_ltc_cost += ltc_cost.gross;
        }

        ExpenseBreakdown expenses = projector_.expenses(year, primary_alive, spouse_alive,
                                                        guardrails.multiplier());
        expenses.ltc = ltc_cost.net();

        const double planned = std::max(0.0, expenses.total() - income.total());
        const GuardrailAdjustment adjustment = guardrails.evaluate(planned, buckets.total());
        if (adjustment == GuardrailAdjustment::Cut) {
            ++outcome.guardrail_cuts;
        } else if (adjustment == GuardrailAdjustment::Raise) {
            ++outcome.guardrail_raises;
        }
        if (adjustment != GuardrailAdjustment::None) {
            expenses = projector_.expenses(year, primary_alive, spouse_alive, guardrails.multiplier());
            expenses.ltc = ltc_cost.net();
        }

        // ====================================================================
        // Taxes and gross-up
        // ====================================================================

        // Required distribution from the primary's account while alive, else the spouse's
        double rmd = 0.0;
        const Person* owner = primary_alive ? &primary : (spouse_alive ? people.spouse : nullptr);
        if (owner != nullptr) {
            rmd = required_minimum_distribution(prior_deferred, owner->age + year,
                                                params_.tax.start_year - owner->age);
            rmd = std::min(rmd, buckets.tax_deferred);
        }

        TaxableIncome taxable;
        taxable.filing_status = (couple && !(primary_alive && spouse_alive))
                                    ? FilingStatus::Single
                                    : household_filing_status(params_.household);
        taxable.social_security = income.social_security;
        taxable.year_index = year;
        taxable.lookback_magi = year >= 2 ? magi_history[year - 2] : params_.tax.prior_magi;
        int seniors = 0;
        if (primary_alive && age >= 65) ++seniors;
        if (spouse_alive && spouse_age >= 65) ++seniors;
        taxable.seniors = seniors;
        taxable.medicare_enrollees = seniors;

        auto evaluate = [&](double gross, WithdrawalPlan& plan, TaxBreakdown& taxes) {
            plan = plan_withdrawal(buckets, gross, rmd);
            TaxableIncome t = taxable;
            t.ordinary = income.ordinary() + plan.tax_deferred;
            t.retirement_income = income.pension + plan.tax_deferred;
            t.realized_gains = plan.realized_gains;
            taxes = tax_.compute(t);
            return income.total() + plan.total() - taxes.total() - expenses.total();
        };

        const GrossUpResult search = gross_up(
            [&](double gross) {
                WithdrawalPlan plan;
                TaxBreakdown taxes;
                return evaluate(gross, plan, taxes);
            },
            rmd, buckets.total(), CASH_EPSILON);

        WithdrawalPlan plan;
        TaxBreakdown taxes;
        const double surplus = evaluate(search.gross, plan, taxes);

        apply_withdrawal(buckets, plan);
        if (surplus > CASH_EPSILON) {
            reinvest(buckets, surplus);
        }
        magi_history.push_back(taxes.magi);

        if (!finite_buckets(buckets) || !std::isfinite(taxes.total()) || !std::isfinite(surplus)) {
            throw NumericInstabilityError(scenario, year, "non-finite balance or tax");
        }

        flow.social_security = income.social_security;
        flow.pension = income.pension;
        flow.part_time = income.part_time;
        flow.withdrawal_cash = plan.cash;
        flow.withdrawal_taxable = plan.taxable;
        flow.withdrawal_tax_deferred = plan.tax_deferred;
        flow.withdrawal_tax_free = plan.tax_free;
        flow.rmd = plan.rmd;
        flow.realized_gains = plan.realized_gains;
        flow.federal_tax = taxes.federal;
        flow.capital_gains_tax = taxes.capital_gains + taxes.niit;
        flow.state_tax = taxes.state;
        flow.irmaa = taxes.irmaa;
        flow.total_tax = taxes.total();
        flow.magi = taxes.magi;
        flow.essential_expenses = expenses.essential;
        flow.discretionary_expenses = expenses.discretionary;
        flow.healthcare_expenses = expenses.healthcare;
        flow.ltc_expenses = expenses.ltc;
        flow.ltc_gross = ltc_cost.gross;
        flow.ltc_insurance = ltc_cost.insurance_benefit;
        flow.net_cash_flow = surplus;
        flow.guardrail_state = guardrails.state();
        flow.discretionary_multiplier = guardrails.multiplier();
        record_balances(flow, buckets);

        if (config_.record_balance_path) {
            outcome.balance_path.push_back(buckets.total());
        }
        if (config_.detailed_cashflows) {
            outcome.cashflows.push_back(flow);
        }
        outcome.years_simulated = year + 1;

        if (surplus < -CASH_EPSILON) {
            outcome.success = false;
            outcome.depletion_year = year;
            break;
        }
    }

    outcome.ending_balance = buckets.total();
    return outcome;
}

} // namespace retirecalc
