#include "params.hpp"
#include "errors.hpp"
#include "return_generator.hpp"
#include <algorithm>
#include <cmath>

namespace retirecalc {

// ============================================================================
// Enum conversions
// ============================================================================

std::string gender_to_string(Gender gender) {
    return gender == Gender::Female ? "female" : "male";
}

std::string health_to_string(HealthStatus health) {
    switch (health) {
        case HealthStatus::Excellent: return "excellent";
        case HealthStatus::Good: return "good";
        case HealthStatus::Fair: return "fair";
        case HealthStatus::Poor: return "poor";
    }
    return "good";
}

std::string filing_status_to_string(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single: return "single";
        case FilingStatus::MarriedJoint: return "married";
        case FilingStatus::HeadOfHousehold: return "head_of_household";
    }
    return "single";
}

std::string care_type_to_string(CareType type) {
    switch (type) {
        case CareType::HomeCare: return "home_care";
        case CareType::AssistedLiving: return "assisted_living";
        case CareType::NursingHome: return "nursing_home";
        case CareType::MemoryCare: return "memory_care";
    }
    return "home_care";
}

Gender parse_gender(const std::string& value, const std::string& field) {
    if (value == "male" || value == "M" || value == "m") return Gender::Male;
    if (value == "female" || value == "F" || value == "f") return Gender::Female;
    throw InvalidParameterError(field, "unknown gender '" + value + "'");
}

std::string distribution_to_string(ReturnDistribution distribution) {
    return distribution == ReturnDistribution::StudentT ? "student_t" : "normal";
}

ReturnDistribution parse_distribution(const std::string& value, const std::string& field) {
    if (value == "normal") return ReturnDistribution::Normal;
    if (value == "student_t" || value == "fat_tail") return ReturnDistribution::StudentT;
    throw InvalidParameterError(field, "unknown return distribution '" + value + "'");
}

HealthStatus parse_health(const std::string& value, const std::string& field) {
    if (value == "excellent") return HealthStatus::Excellent;
    if (value == "good") return HealthStatus::Good;
    if (value == "fair") return HealthStatus::Fair;
    if (value == "poor") return HealthStatus::Poor;
    throw InvalidParameterError(field, "unknown health status '" + value + "'");
}

FilingStatus parse_filing_status(const std::string& value, const std::string& field) {
    if (value == "single") return FilingStatus::Single;
    if (value == "married" || value == "married_joint") return FilingStatus::MarriedJoint;
    if (value == "head_of_household") return FilingStatus::HeadOfHousehold;
    throw InvalidParameterError(field, "unknown filing status '" + value + "'");
}

// ============================================================================
// Household
// ============================================================================

SocialSecurityBenefit::SocialSecurityBenefit()
    : annual_benefit_at_fra(0.0), claim_age(67) {}

SocialSecurityBenefit::SocialSecurityBenefit(double benefit, int claim)
    : annual_benefit_at_fra(benefit), claim_age(claim) {}

Pension::Pension()
    : annual_benefit(0.0), survivor_fraction(0.5), cola(0.0), start_age(0) {}

PartTimeWork::PartTimeWork()
    : annual_income(0.0), end_age(70) {}

Person::Person()
    : age(65),
      retirement_age(65),
      gender(Gender::Male),
      health(HealthStatus::Good),
      life_expectancy(90),
      annual_savings(0.0) {}

SingleHousehold::SingleHousehold()
    : filing_status(FilingStatus::Single) {}

SingleHousehold::SingleHousehold(const Person& p)
    : person(p), filing_status(FilingStatus::Single) {}

CoupleHousehold::CoupleHousehold()
    : survivor_expense_ratio(0.75) {}

CoupleHousehold::CoupleHousehold(const Person& first, const Person& second)
    : primary(first), spouse(second), survivor_expense_ratio(0.75) {}

const Person& primary_person(const Household& household) {
    if (const auto* single = std::get_if<SingleHousehold>(&household)) {
        return single->person;
    }
    return std::get<CoupleHousehold>(household).primary;
}

bool is_couple(const Household& household) {
    return std::holds_alternative<CoupleHousehold>(household);
}

FilingStatus household_filing_status(const Household& household) {
    if (const auto* single = std::get_if<SingleHousehold>(&household)) {
        return single->filing_status;
    }
    return FilingStatus::MarriedJoint;
}

// ============================================================================
// Assets, expenses and market assumptions
// ============================================================================

AssetBuckets::AssetBuckets()
    : tax_deferred(0.0),
      tax_free(0.0),
      capital_gains(0.0),
      cash_equivalents(0.0),
      capital_gains_basis(0.0) {}

AssetBuckets::AssetBuckets(double deferred, double free, double taxable, double cash, double basis)
    : tax_deferred(deferred),
      tax_free(free),
      capital_gains(taxable),
      cash_equivalents(cash),
      capital_gains_basis(basis) {}

ExpenseProfile::ExpenseProfile()
    : annual_expenses(60000.0), essential_fraction(0.7), annual_healthcare(0.0) {}

AssetClassAssumption::AssetClassAssumption()
    : cagr(0.0), volatility(0.0) {}

AssetClassAssumption::AssetClassAssumption(double growth, double vol)
    : cagr(growth), volatility(vol) {}

MarketAssumptions::MarketAssumptions()
    : classes{AssetClassAssumption(0.07, 0.17),
              AssetClassAssumption(0.04, 0.06),
              AssetClassAssumption(0.025, 0.01)},
      correlation{{{1.0, 0.1, 0.0},
                   {0.1, 1.0, 0.2},
                   {0.0, 0.2, 1.0}}},
      inflation(0.025),
      healthcare_inflation(0.0269),
      social_security_cola(0.025),
      distribution(ReturnDistribution::Normal),
      degrees_of_freedom(5) {}

AllocationPolicy::AllocationPolicy()
    : weights{0.60, 0.35, 0.05},
      glide_path(false),
      glide_end_stocks(0.30),
      glide_years(20) {}

AssetVector AllocationPolicy::weights_for_year(int year_index) const {
    if (!glide_path) {
        return weights;
    }
    double progress = 1.0;
    if (glide_years > 0) {
        progress = std::min(1.0, static_cast<double>(std::max(year_index, 0)) / glide_years);
    }
    AssetVector result = weights;
    double stocks = weights[0] + (glide_end_stocks - weights[0]) * progress;
    result[0] = stocks;
    result[1] = weights[1] + (weights[0] - stocks);
    return result;
}

GuardrailPolicy::GuardrailPolicy()
    : enabled(true),
      withdrawal_rate(0.04),
      upper_threshold(1.2),
      lower_threshold(0.8),
      cut_percent(0.10),
      raise_percent(0.10),
      floor(0.7),
      ceiling(1.3) {}

TaxProfile::TaxProfile()
    : state(""), state_tax_rate(0.0), prior_magi(0.0), start_year(2024) {}

LtcInsurance::LtcInsurance()
    : daily_benefit(150.0), benefit_years(3.0), elimination_days(90), inflation_rider(0.0) {}

LtcAssumptions::LtcAssumptions()
    : enabled(false),
      lifetime_probability(0.35),
      onset_age_min(75),
      onset_age_max(85),
      average_duration_years(2.5),
      average_annual_cost(75000.0),
      inflation(0.045) {}

VarianceReduction::VarianceReduction()
    : antithetic(true),
      control_variates(true),
      control_years(10),
      latin_hypercube(false),
      lhs_years(30) {}

RegimeSwitching::RegimeSwitching()
    : enabled(false),
      normal_to_stress(0.10),
      stress_to_normal(0.50),
      stress_mean_shift{-0.10, 0.01, 0.0},
      stress_volatility_multiplier(1.5) {}

SimulationSettings::SimulationSettings()
    : iterations(1000),
      seed(42),
      dynamic_mortality(true),
      compute_safe_withdrawal_rate(false),
      swr_target_success(0.90),
      swr_max_iterations(20),
      swr_iterations(500) {}

SimulationParameters::SimulationParameters()
    : household(SingleHousehold()),
      legacy_goal(0.0) {}

// ============================================================================
// Validation
// ============================================================================

namespace {

void require(bool condition, const std::string& field, const std::string& message) {
    if (!condition) {
        throw InvalidParameterError(field, message);
    }
}

// NaN fails every comparison, so these reject it as well
void require_non_negative(double value, const std::string& field) {
    require(value >= 0.0 && std::isfinite(value), field, "must be a non-negative number");
}

void require_probability(double value, const std::string& field) {
    require(value >= 0.0 && value <= 1.0, field, "must be between 0 and 1");
}

void require_rate(double value, const std::string& field) {
    require(value > -1.0 && value < 1.0, field, "must be a rate between -1 and 1");
}

void validate_person(const Person& p, const std::string& prefix) {
    require(p.age >= 0 && p.age <= 120, prefix + ".age", "must be between 0 and 120");
    require(p.retirement_age >= 0 && p.retirement_age <= 120, prefix + ".retirement_age",
            "must be between 0 and 120");
    require(p.life_expectancy >= 0 && p.life_expectancy <= 120, prefix + ".life_expectancy",
            "must be between 0 and 120");
    require_non_negative(p.annual_savings, prefix + ".annual_savings");
    require_non_negative(p.social_security.annual_benefit_at_fra,
                         prefix + ".social_security.benefit");
    require(p.social_security.claim_age >= 62 && p.social_security.claim_age <= 70,
            prefix + ".social_security.claim_age", "must be between 62 and 70");

    if (p.pension) {
        require_non_negative(p.pension->annual_benefit, prefix + ".pension.annual_benefit");
        require_probability(p.pension->survivor_fraction, prefix + ".pension.survivor_fraction");
        require_rate(p.pension->cola, prefix + ".pension.cola");
        require(p.pension->start_age >= 0 && p.pension->start_age <= 120,
                prefix + ".pension.start_age", "must be between 0 and 120");
    }
    if (p.part_time) {
        require_non_negative(p.part_time->annual_income, prefix + ".part_time.annual_income");
        require(p.part_time->end_age >= 0 && p.part_time->end_age <= 120,
                prefix + ".part_time.end_age", "must be between 0 and 120");
    }
}

void validate_household(const Household& household) {
    if (const auto* single = std::get_if<SingleHousehold>(&household)) {
        validate_person(single->person, "household.person");
        require(single->filing_status != FilingStatus::MarriedJoint, "household.filing_status",
                "a single household cannot file jointly");
        return;
    }
    const auto& couple = std::get<CoupleHousehold>(household);
    validate_person(couple.primary, "household.primary");
    validate_person(couple.spouse, "household.spouse");
    require(couple.survivor_expense_ratio > 0.0 && couple.survivor_expense_ratio <= 1.0,
            "household.survivor_expense_ratio", "must be in (0, 1]");
}

void validate_assets(const AssetBuckets& assets) {
    require_non_negative(assets.tax_deferred, "assets.tax_deferred");
    require_non_negative(assets.tax_free, "assets.tax_free");
    require_non_negative(assets.capital_gains, "assets.capital_gains");
    require_non_negative(assets.cash_equivalents, "assets.cash_equivalents");
    require_non_negative(assets.capital_gains_basis, "assets.capital_gains_basis");
    require(assets.capital_gains_basis <= assets.capital_gains + 1e-9,
            "assets.capital_gains_basis", "cannot exceed the taxable balance");
}

void validate_market(const MarketAssumptions& market) {
    static const char* names[NUM_ASSET_CLASSES] = {"stocks", "bonds", "cash"};
    for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
        const std::string prefix = std::string("market.") + names[k];
        require_rate(market.classes[k].cagr, prefix + ".cagr");
        require(market.classes[k].volatility >= 0.0 && market.classes[k].volatility < 2.0,
                prefix + ".volatility", "must be between 0 and 2");
    }
    for (size_t i = 0; i < NUM_ASSET_CLASSES; ++i) {
        require(std::fabs(market.correlation[i][i] - 1.0) < 1e-9, "market.correlation",
                "diagonal entries must be 1");
        for (size_t j = 0; j < NUM_ASSET_CLASSES; ++j) {
            double rho = market.correlation[i][j];
            require(rho >= -1.0 && rho <= 1.0, "market.correlation",
                    "entries must be between -1 and 1");
            require(std::fabs(rho - market.correlation[j][i]) < 1e-9, "market.correlation",
                    "matrix must be symmetric");
        }
    }
    // Throws InvalidParameterError when the matrix is not positive definite
    cholesky(market.correlation);

    require_rate(market.inflation, "market.inflation");
    require_rate(market.healthcare_inflation, "market.healthcare_inflation");
    require_rate(market.social_security_cola, "market.social_security_cola");
    if (market.distribution == ReturnDistribution::StudentT) {
        // Variance is infinite below three degrees of freedom
        require(market.degrees_of_freedom >= 3 && market.degrees_of_freedom <= 1000,
                "market.degrees_of_freedom", "must be between 3 and 1000");
    }
}

void validate_allocation(const AllocationPolicy& allocation) {
    double sum = 0.0;
    for (double w : allocation.weights) {
        require_probability(w, "allocation.weights");
        sum += w;
    }
    require(std::fabs(sum - 1.0) < 1e-6, "allocation.weights", "must sum to 1");
    if (allocation.glide_path) {
        require(allocation.glide_end_stocks >= 0.0 &&
                allocation.glide_end_stocks <= allocation.weights[0] + allocation.weights[1],
                "allocation.glide_end_stocks", "must be between 0 and the stock plus bond weight");
        require(allocation.glide_years >= 0, "allocation.glide_years", "must be non-negative");
    }
}

void validate_guardrails(const GuardrailPolicy& g) {
    require(g.withdrawal_rate > 0.0 && g.withdrawal_rate <= 1.0, "guardrails.withdrawal_rate",
            "must be in (0, 1]");
    require(g.lower_threshold > 0.0, "guardrails.lower_threshold", "must be positive");
    require(g.upper_threshold > g.lower_threshold, "guardrails.upper_threshold",
            "must exceed the lower threshold");
    require(g.cut_percent >= 0.0 && g.cut_percent < 1.0, "guardrails.cut_percent",
            "must be in [0, 1)");
    require(g.raise_percent >= 0.0 && g.raise_percent < 1.0, "guardrails.raise_percent",
            "must be in [0, 1)");
    require(g.floor > 0.0 && g.floor <= 1.0, "guardrails.floor", "must be in (0, 1]");
    require(g.ceiling >= 1.0, "guardrails.ceiling", "must be at least 1");
}

void validate_ltc(const LtcAssumptions& ltc) {
    require_probability(ltc.lifetime_probability, "ltc.lifetime_probability");
    require(ltc.onset_age_min >= 0 && ltc.onset_age_min <= ltc.onset_age_max &&
            ltc.onset_age_max <= 120, "ltc.onset_age", "range must satisfy 0 <= min <= max <= 120");
    require(ltc.average_duration_years > 0.0, "ltc.average_duration_years", "must be positive");
    require_non_negative(ltc.average_annual_cost, "ltc.average_annual_cost");
    require_rate(ltc.inflation, "ltc.inflation");
    if (ltc.insurance) {
        require_non_negative(ltc.insurance->daily_benefit, "ltc.insurance.daily_benefit");
        require_non_negative(ltc.insurance->benefit_years, "ltc.insurance.benefit_years");
        require(ltc.insurance->elimination_days >= 0, "ltc.insurance.elimination_days",
                "must be non-negative");
        require_rate(ltc.insurance->inflation_rider, "ltc.insurance.inflation_rider");
    }
}

void validate_settings(const SimulationSettings& s) {
    require(s.iterations > 0, "simulation.iterations", "must be positive");
    require(s.variance_reduction.control_years >= 1, "simulation.control_years",
            "must be at least 1");
    require(s.variance_reduction.lhs_years >= 1 && s.variance_reduction.lhs_years <= 120,
            "simulation.lhs_years", "must be between 1 and 120");
    require_probability(s.regime.normal_to_stress, "simulation.regime.normal_to_stress");
    require_probability(s.regime.stress_to_normal, "simulation.regime.stress_to_normal");
    require(s.regime.stress_volatility_multiplier > 0.0,
            "simulation.regime.stress_volatility_multiplier", "must be positive");
    require(s.swr_target_success > 0.0 && s.swr_target_success < 1.0,
            "simulation.swr_target_success", "must be in (0, 1)");
    require(s.swr_max_iterations >= 1, "simulation.swr_max_iterations", "must be at least 1");
    require(s.swr_iterations > 0, "simulation.swr_iterations", "must be positive");
}

} // anonymous namespace

void validate_parameters(const SimulationParameters& params) {
    validate_household(params.household);
    validate_assets(params.assets);

    require_non_negative(params.expenses.annual_expenses, "expenses.annual_expenses");
    require_probability(params.expenses.essential_fraction, "expenses.essential_fraction");
    require_non_negative(params.expenses.annual_healthcare, "expenses.annual_healthcare");

    validate_market(params.market);
    validate_allocation(params.allocation);
    validate_guardrails(params.guardrails);

    require(params.tax.state_tax_rate >= 0.0 && params.tax.state_tax_rate < 1.0,
            "tax.state_tax_rate", "must be in [0, 1)");
    require_non_negative(params.tax.prior_magi, "tax.prior_magi");
    require(params.tax.start_year >= 1900 && params.tax.start_year <= 2200, "tax.start_year",
            "must be between 1900 and 2200");

    validate_ltc(params.ltc);
    validate_settings(params.simulation);
    require_non_negative(params.legacy_goal, "legacy_goal");
}

} // namespace retirecalc
