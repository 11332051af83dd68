#ifndef RETIRECALC_TAX_HPP
#define RETIRECALC_TAX_HPP

#include "params.hpp"
#include <functional>
#include <string>
#include <vector>

namespace retirecalc {

// Marginal bracket: rate applies to income above lower
struct TaxBracket {
    double lower;
    double rate;
};

// Tax on income over progressive brackets whose bounds are scaled by index
double bracket_tax(double income, const std::vector<TaxBracket>& brackets, double index);

// ============================================================================
// Federal (2024 law, bounds indexed by inflation)
// ============================================================================

const std::vector<TaxBracket>& federal_brackets(FilingStatus status);

// Standard deduction plus the additional amount per filer aged 65+
double standard_deduction(FilingStatus status, int seniors, double index);

double federal_ordinary_tax(double taxable_income, FilingStatus status, double index);

// Portion of Social Security included in income (0-85 %) by the provisional-income test.
// Thresholds are statutory and not indexed.
double taxable_social_security(double other_income, double benefits, FilingStatus status);

// Long-term gains stacked on top of ordinary taxable income
double capital_gains_tax(double ordinary_taxable, double gains, FilingStatus status, double index);

// 3.8 % on the lesser of investment income and MAGI above the threshold
double net_investment_income_tax(double magi, double investment_income, FilingStatus status);

// Annual Medicare Part B + D surcharge for one enrollee
double irmaa_surcharge(double magi, FilingStatus status, double index);

// ============================================================================
// Required minimum distributions
// ============================================================================

// 72 for births before 1951, 73 for 1951-1959, 75 from 1960
int rmd_start_age(int birth_year);

// IRS Uniform Lifetime divisor; throws out_of_range below age 72, clamps above 120
double rmd_divisor(int age);

// Zero before the start age
double required_minimum_distribution(double prior_year_balance, int age, int birth_year);

// ============================================================================
// State
// ============================================================================

struct StateTaxRule {
    std::string code;
    bool has_income_tax;
    double deduction_single;
    double deduction_married;
    std::vector<TaxBracket> single;
    std::vector<TaxBracket> married;
    double retirement_exclusion;    // Pension and IRA income excluded per return
    bool taxes_social_security;
};

// nullptr for states without a built-in table
const StateTaxRule* find_state_rule(const std::string& code);

// States that tax part of Social Security when only a flat rate is known
bool state_taxes_social_security(const std::string& code);

// ============================================================================
// Annual tax calculation
// ============================================================================

struct TaxableIncome {
    FilingStatus filing_status;
    double ordinary;                // Pension, wages and tax-deferred withdrawals
    double retirement_income;       // Pension and tax-deferred portion of ordinary
    double social_security;         // Gross benefits
    double realized_gains;          // Gain portion of taxable-bucket withdrawals
    int seniors;                    // Living filers aged 65+
    int medicare_enrollees;         // Living people aged 65+
    double lookback_magi;           // MAGI from two years earlier
    int year_index;

    TaxableIncome();
};

struct TaxBreakdown {
    double federal;
    double capital_gains;
    double niit;
    double state;
    double irmaa;
    double taxable_social_security;
    double magi;

    TaxBreakdown();

    double total() const { return federal + capital_gains + niit + state + irmaa; }
};

class TaxCalculator {
public:
    TaxCalculator(const TaxProfile& profile, double inflation);

    TaxBreakdown compute(const TaxableIncome& income) const;

    double index(int year_index) const;

private:
    std::string state_;
    double flat_state_rate_;
    double inflation_;
    const StateTaxRule* state_rule_;

    double state_tax(const TaxableIncome& income, double taxable_ss, double index) const;
};

// ============================================================================
// Gross-up search
// ============================================================================

struct GrossUpResult {
    double gross;
    double surplus;                 // Net cash after tax minus need at gross
    bool feasible;                  // False when even max_gross leaves a shortfall
    int iterations;

    GrossUpResult();
};

// Smallest gross withdrawal in [min_gross, max_gross] whose surplus(gross)
// reaches -tolerance. surplus must be non-decreasing in gross.
GrossUpResult gross_up(const std::function<double(double)>& surplus,
                       double min_gross, double max_gross,
                       double tolerance = 0.01, int max_iterations = 200);

} // namespace retirecalc

#endif // RETIRECALC_TAX_HPP
