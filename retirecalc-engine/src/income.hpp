#ifndef RETIRECALC_INCOME_HPP
#define RETIRECALC_INCOME_HPP

#include "params.hpp"

namespace retirecalc {

// Full retirement age in months for a birth year (66 for 1943-1954,
// rising two months per year to 67 for 1960 and later)
int full_retirement_age_months(int birth_year);

// Benefit multiple for claiming at claim_age (clamped to 62-70):
// 5/9 % per month for the first 36 early months, 5/12 % beyond,
// 8 % per year of delay past full retirement age
double claim_adjustment(int claim_age, int birth_year);

// Nominal Social Security paid in a year, zero before the claim age
double social_security_benefit(const SocialSecurityBenefit& benefit, int birth_year,
                               int age_this_year, int year_index, double cola);

// Guaranteed income for one year, nominal dollars
struct GuaranteedIncome {
    double social_security;
    double pension;
    double part_time;

    GuaranteedIncome();

    double total() const { return social_security + pension + part_time; }
    // Pension and wages are ordinary income; Social Security goes through the provisional test
    double ordinary() const { return pension + part_time; }
};

// Expenses for one year, nominal dollars
struct ExpenseBreakdown {
    double essential;
    double discretionary;
    double healthcare;
    double ltc;

    ExpenseBreakdown();

    double total() const { return essential + discretionary + healthcare + ltc; }
};

// Projects guaranteed income and baseline expenses per simulated year.
// Survivor rules: Social Security becomes the larger of the two benefits,
// a deceased spouse's pension continues at its survivor fraction, and
// non-healthcare spending falls to survivor_expense_ratio.
class IncomeProjector {
public:
    explicit IncomeProjector(const SimulationParameters& params);

    GuaranteedIncome income(int year, bool primary_alive, bool spouse_alive) const;

    ExpenseBreakdown expenses(int year, bool primary_alive, bool spouse_alive,
                              double discretionary_multiplier) const;

    // Pre-retirement contributions, added to the tax-deferred bucket
    double savings(int year, bool primary_alive, bool spouse_alive) const;

    // Household draws on the portfolio once the primary person has retired
    bool retired(int year) const;

    // First simulated year in which the household is retired
    int retirement_year() const;

    double inflation_index(int year) const;
    double healthcare_index(int year) const;

private:
    const SimulationParameters& params_;
    const Person& primary_;
    const Person* spouse_;
    double survivor_expense_ratio_;

    int birth_year(const Person& person) const;
    double own_social_security(const Person& person, int year) const;
    double pension_paid(const Person& owner, int year) const;
    double part_time_paid(const Person& owner, int year) const;
};

} // namespace retirecalc

#endif // RETIRECALC_INCOME_HPP
