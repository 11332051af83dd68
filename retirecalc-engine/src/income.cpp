#include "income.hpp"
#include <algorithm>
#include <cmath>

namespace retirecalc {

int full_retirement_age_months(int birth_year) {
    if (birth_year <= 1937) return 65 * 12;
    if (birth_year <= 1942) return 65 * 12 + 2 * (birth_year - 1937);
    if (birth_year <= 1954) return 66 * 12;
    if (birth_year <= 1959) return 66 * 12 + 2 * (birth_year - 1954);
    return 67 * 12;
}

double claim_adjustment(int claim_age, int birth_year) {
    int claim_months = std::min(std::max(claim_age, 62), 70) * 12;
    int fra_months = full_retirement_age_months(birth_year);

    if (claim_months < fra_months) {
        int early = fra_months - claim_months;
        double reduction = std::min(early, 36) * (5.0 / 900.0) +
                           std::max(early - 36, 0) * (5.0 / 1200.0);
        return 1.0 - reduction;
    }
    int delayed = claim_months - fra_months;
    return 1.0 + delayed * (0.08 / 12.0);
}

double social_security_benefit(const SocialSecurityBenefit& benefit, int birth_year,
                               int age_this_year, int year_index, double cola) {
    if (age_this_year < benefit.claim_age || benefit.annual_benefit_at_fra <= 0.0) {
        return 0.0;
    }
    return benefit.annual_benefit_at_fra * claim_adjustment(benefit.claim_age, birth_year) *
           std::pow(1.0 + cola, year_index);
}

GuaranteedIncome::GuaranteedIncome()
    : social_security(0.0), pension(0.0), part_time(0.0) {}

ExpenseBreakdown::ExpenseBreakdown()
    : essential(0.0), discretionary(0.0), healthcare(0.0), ltc(0.0) {}

// ============================================================================
// IncomeProjector Implementation
// ============================================================================

IncomeProjector::IncomeProjector(const SimulationParameters& params)
    : params_(params),
      primary_(primary_person(params.household)),
      spouse_(nullptr),
      survivor_expense_ratio_(1.0) {
    if (const auto* couple = std::get_if<CoupleHousehold>(&params.household)) {
        spouse_ = &couple->spouse;
        survivor_expense_ratio_ = couple->survivor_expense_ratio;
    }
}

int IncomeProjector::birth_year(const Person& person) const {
    return params_.tax.start_year - person.age;
}

double IncomeProjector::inflation_index(int year) const {
    return std::pow(1.0 + params_.market.inflation, year);
}

double IncomeProjector::healthcare_index(int year) const {
    return std::pow(1.0 + params_.market.healthcare_inflation, year);
}

bool IncomeProjector::retired(int year) const {
    return primary_.age + year >= primary_.retirement_age;
}

int IncomeProjector::retirement_year() const {
    return std::max(0, primary_.retirement_age - primary_.age);
}

double IncomeProjector::own_social_security(const Person& person, int year) const {
    return social_security_benefit(person.social_security, birth_year(person), person.age + year,
                                   year, params_.market.social_security_cola);
}

double IncomeProjector::pension_paid(const Person& owner, int year) const {
    if (!owner.pension || owner.pension->annual_benefit <= 0.0) {
        return 0.0;
    }
    int start_age = owner.pension->start_age > 0 ? owner.pension->start_age : owner.retirement_age;
    if (owner.age + year < start_age) {
        return 0.0;
    }
    // COLA accrues from the first simulated payment year
    int first_year = std::max(0, start_age - owner.age);
    return owner.pension->annual_benefit * std::pow(1.0 + owner.pension->cola, year - first_year);
}

double IncomeProjector::part_time_paid(const Person& owner, int year) const {
    if (!owner.part_time) {
        return 0.0;
    }
    int age = owner.age + year;
    if (age < owner.retirement_age || age >= owner.part_time->end_age) {
        return 0.0;
    }
    return owner.part_time->annual_income * inflation_index(year);
}

GuaranteedIncome IncomeProjector::income(int year, bool primary_alive, bool spouse_alive) const {
    GuaranteedIncome result;

    if (spouse_ == nullptr) {
        if (primary_alive) {
            result.social_security = own_social_security(primary_, year);
            result.pension = pension_paid(primary_, year);
            result.part_time = part_time_paid(primary_, year);
        }
        return result;
    }

    if (primary_alive && spouse_alive) {
        result.social_security = own_social_security(primary_, year) +
                                 own_social_security(*spouse_, year);
        result.pension = pension_paid(primary_, year) + pension_paid(*spouse_, year);
        result.part_time = part_time_paid(primary_, year) + part_time_paid(*spouse_, year);
        return result;
    }

    if (!primary_alive && !spouse_alive) {
        return result;
    }

    const Person& survivor = primary_alive ? primary_ : *spouse_;
    const Person& deceased = primary_alive ? *spouse_ : primary_;

    // Survivor benefit starts once the survivor reaches their own claim age
    double own = own_social_security(survivor, year);
    if (survivor.age + year >= survivor.social_security.claim_age) {
        double inherited = deceased.social_security.annual_benefit_at_fra *
                           claim_adjustment(deceased.social_security.claim_age, birth_year(deceased)) *
                           std::pow(1.0 + params_.market.social_security_cola, year);
        result.social_security = std::max(own, inherited);
    }

    result.pension = pension_paid(survivor, year);
    if (deceased.pension) {
        result.pension += pension_paid(deceased, year) * deceased.pension->survivor_fraction;
    }
    result.part_time = part_time_paid(survivor, year);
    return result;
}

ExpenseBreakdown IncomeProjector::expenses(int year, bool primary_alive, bool spouse_alive,
                                           double discretionary_multiplier) const {
    ExpenseBreakdown result;
    if (!primary_alive && !spouse_alive) {
        return result;
    }

    double living_ratio = 1.0;
    double healthcare_ratio = 1.0;
    if (spouse_ != nullptr && !(primary_alive && spouse_alive)) {
        living_ratio = survivor_expense_ratio_;
        healthcare_ratio = 0.5;
    }

    const double index = inflation_index(year);
    result.essential = params_.expenses.essential() * index * living_ratio;
    result.discretionary = params_.expenses.discretionary() * index * living_ratio *
                           discretionary_multiplier;
    result.healthcare = params_.expenses.annual_healthcare * healthcare_index(year) *
                        healthcare_ratio;
    return result;
}

double IncomeProjector::savings(int year, bool primary_alive, bool spouse_alive) const {
    double total = 0.0;
    if (primary_alive && primary_.age + year < primary_.retirement_age) {
        total += primary_.annual_savings;
    }
    if (spouse_ != nullptr && spouse_alive && spouse_->age + year < spouse_->retirement_age) {
        total += spouse_->annual_savings;
    }
    return total * inflation_index(year);
}

} // namespace retirecalc
