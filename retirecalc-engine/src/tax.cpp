#include "tax.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>

namespace retirecalc {

namespace {

// 2024 ordinary brackets
const std::vector<TaxBracket> SINGLE_BRACKETS = {
    {0.0, 0.10}, {11600.0, 0.12}, {47150.0, 0.22}, {100525.0, 0.24},
    {191950.0, 0.32}, {243725.0, 0.35}, {609350.0, 0.37}
};
const std::vector<TaxBracket> MARRIED_BRACKETS = {
    {0.0, 0.10}, {23200.0, 0.12}, {94300.0, 0.22}, {201050.0, 0.24},
    {383900.0, 0.32}, {487450.0, 0.35}, {731200.0, 0.37}
};
const std::vector<TaxBracket> HEAD_OF_HOUSEHOLD_BRACKETS = {
    {0.0, 0.10}, {16550.0, 0.12}, {63100.0, 0.22}, {100500.0, 0.24},
    {191950.0, 0.32}, {243700.0, 0.35}, {609350.0, 0.37}
};

struct FilingConstants {
    double standard_deduction;
    double senior_addition;         // Per filer aged 65+
    double ltcg_zero_top;
    double ltcg_fifteen_top;
    double niit_threshold;
    double ss_base1;
    double ss_base2;
};

const FilingConstants& constants(FilingStatus status) {
    static const FilingConstants single = {14600.0, 1950.0, 47025.0, 518900.0, 200000.0,
                                           25000.0, 34000.0};
    static const FilingConstants married = {29200.0, 1550.0, 94050.0, 583750.0, 250000.0,
                                            32000.0, 44000.0};
    static const FilingConstants head = {21900.0, 1950.0, 63000.0, 551350.0, 200000.0,
                                         25000.0, 34000.0};
    switch (status) {
        case FilingStatus::Single: return single;
        case FilingStatus::MarriedJoint: return married;
        case FilingStatus::HeadOfHousehold: return head;
    }
    return single;
}

// IRMAA tiers: MAGI upper bound and monthly Part B + Part D surcharge
struct IrmaaTier {
    double single_limit;
    double married_limit;
    double monthly_surcharge;
};

const IrmaaTier IRMAA_TIERS[] = {
    {103000.0, 206000.0, 0.0},
    {129000.0, 258000.0, 69.90 + 12.90},
    {161000.0, 322000.0, 174.70 + 33.30},
    {193000.0, 386000.0, 279.50 + 53.80},
    {500000.0, 750000.0, 384.30 + 74.20},
    {std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity(),
     419.30 + 81.00}
};

constexpr int RMD_TABLE_FIRST_AGE = 72;
constexpr double UNIFORM_LIFETIME_DIVISORS[] = {
    27.4, 26.5, 25.5, 24.6, 23.7, 22.9, 22.0, 21.1, 20.2, 19.4,   // 72-81
    18.5, 17.7, 16.8, 16.0, 15.2, 14.4, 13.7, 12.9, 12.2, 11.5,   // 82-91
    10.8, 10.1, 9.5, 8.9, 8.4, 7.8, 7.3, 6.8, 6.4, 6.0,           // 92-101
    5.6, 5.2, 4.9, 4.6, 4.3, 4.1, 3.9, 3.7, 3.5, 3.4,             // 102-111
    3.3, 3.1, 3.0, 2.9, 2.8, 2.7, 2.5, 2.3, 2.0                   // 112-120
};
constexpr int RMD_TABLE_LAST_AGE = RMD_TABLE_FIRST_AGE +
    static_cast<int>(sizeof(UNIFORM_LIFETIME_DIVISORS) / sizeof(UNIFORM_LIFETIME_DIVISORS[0])) - 1;

const std::map<std::string, StateTaxRule>& state_rules() {
    static const std::map<std::string, StateTaxRule> rules = [] {
        std::map<std::string, StateTaxRule> r;
        for (const char* code : {"AK", "FL", "NV", "NH", "SD", "TN", "TX", "WA", "WY"}) {
            r[code] = StateTaxRule{code, false, 0.0, 0.0, {}, {}, 0.0, false};
        }
        r["CA"] = StateTaxRule{
            "CA", true, 5202.0, 10404.0,
            {{0.0, 0.01}, {10099.0, 0.02}, {23942.0, 0.04}, {37788.0, 0.06}, {52455.0, 0.08},
             {66295.0, 0.093}, {338639.0, 0.103}, {406364.0, 0.113}, {677278.0, 0.123}},
            {{0.0, 0.01}, {20198.0, 0.02}, {47884.0, 0.04}, {75576.0, 0.06}, {104910.0, 0.08},
             {132590.0, 0.093}, {677278.0, 0.103}, {812728.0, 0.113}, {1354556.0, 0.123}},
            0.0, false};
        r["NY"] = StateTaxRule{
            "NY", true, 8000.0, 16050.0,
            {{0.0, 0.04}, {8500.0, 0.045}, {11700.0, 0.0525}, {13900.0, 0.0585},
             {80650.0, 0.0625}, {215400.0, 0.0685}, {1077550.0, 0.0965},
             {5000000.0, 0.103}, {25000000.0, 0.109}},
            {{0.0, 0.04}, {17150.0, 0.045}, {23600.0, 0.0525}, {27900.0, 0.0585},
             {161550.0, 0.0625}, {323200.0, 0.0685}, {2155350.0, 0.0965},
             {5000000.0, 0.103}, {25000000.0, 0.109}},
            20000.0, false};
        r["PA"] = StateTaxRule{"PA", true, 0.0, 0.0, {{0.0, 0.0307}}, {{0.0, 0.0307}},
                               std::numeric_limits<double>::infinity(), false};
        r["IL"] = StateTaxRule{"IL", true, 2425.0, 4850.0, {{0.0, 0.0495}}, {{0.0, 0.0495}},
                               0.0, false};
        r["NC"] = StateTaxRule{"NC", true, 12750.0, 25500.0, {{0.0, 0.0475}}, {{0.0, 0.0475}},
                               0.0, false};
        return r;
    }();
    return rules;
}

} // anonymous namespace

double bracket_tax(double income, const std::vector<TaxBracket>& brackets, double index) {
    double tax = 0.0;
    for (size_t i = 0; i < brackets.size(); ++i) {
        double lower = brackets[i].lower * index;
        if (income <= lower) break;
        double upper = (i + 1 < brackets.size()) ? brackets[i + 1].lower * index
                                                 : std::numeric_limits<double>::infinity();
        tax += (std::min(income, upper) - lower) * brackets[i].rate;
    }
    return tax;
}

// ============================================================================
// Federal
// ============================================================================

const std::vector<TaxBracket>& federal_brackets(FilingStatus status) {
    switch (status) {
        case FilingStatus::Single: return SINGLE_BRACKETS;
        case FilingStatus::MarriedJoint: return MARRIED_BRACKETS;
        case FilingStatus::HeadOfHousehold: return HEAD_OF_HOUSEHOLD_BRACKETS;
    }
    return SINGLE_BRACKETS;
}

double standard_deduction(FilingStatus status, int seniors, double index) {
    const FilingConstants& c = constants(status);
    return (c.standard_deduction + c.senior_addition * std::max(seniors, 0)) * index;
}

double federal_ordinary_tax(double taxable_income, FilingStatus status, double index) {
    if (taxable_income <= 0.0) {
        return 0.0;
    }
    return bracket_tax(taxable_income, federal_brackets(status), index);
}

double taxable_social_security(double other_income, double benefits, FilingStatus status) {
    if (benefits <= 0.0) {
        return 0.0;
    }
    const FilingConstants& c = constants(status);
    double provisional = other_income + 0.5 * benefits;

    if (provisional <= c.ss_base1) {
        return 0.0;
    }
    if (provisional <= c.ss_base2) {
        return std::min(0.5 * benefits, 0.5 * (provisional - c.ss_base1));
    }
    double first_tier = std::min(0.5 * benefits, 0.5 * (c.ss_base2 - c.ss_base1));
    return std::min(0.85 * benefits, 0.85 * (provisional - c.ss_base2) + first_tier);
}

double capital_gains_tax(double ordinary_taxable, double gains, FilingStatus status, double index) {
    if (gains <= 0.0) {
        return 0.0;
    }
    const FilingConstants& c = constants(status);
    const double start = std::max(ordinary_taxable, 0.0);
    const double end = start + gains;
    const double zero_top = c.ltcg_zero_top * index;
    const double fifteen_top = c.ltcg_fifteen_top * index;

    double at_fifteen = std::max(0.0, std::min(end, fifteen_top) - std::max(start, zero_top));
    double at_twenty = std::max(0.0, end - std::max(start, fifteen_top));
    return 0.15 * at_fifteen + 0.20 * at_twenty;
}

double net_investment_income_tax(double magi, double investment_income, FilingStatus status) {
    if (investment_income <= 0.0) {
        return 0.0;
    }
    double excess = magi - constants(status).niit_threshold;
    if (excess <= 0.0) {
        return 0.0;
    }
    return 0.038 * std::min(investment_income, excess);
}

double irmaa_surcharge(double magi, FilingStatus status, double index) {
    const bool joint = status == FilingStatus::MarriedJoint;
    for (const auto& tier : IRMAA_TIERS) {
        double limit = (joint ? tier.married_limit : tier.single_limit) * index;
        if (magi <= limit) {
            return tier.monthly_surcharge * 12.0 * index;
        }
    }
    return 0.0;
}

// ============================================================================
// Required minimum distributions
// ============================================================================

int rmd_start_age(int birth_year) {
    if (birth_year < 1951) return 72;
    if (birth_year < 1960) return 73;
    return 75;
}

double rmd_divisor(int age) {
    if (age < RMD_TABLE_FIRST_AGE) {
        throw std::out_of_range("No RMD divisor for age " + std::to_string(age));
    }
    int clamped = std::min(age, RMD_TABLE_LAST_AGE);
    return UNIFORM_LIFETIME_DIVISORS[clamped - RMD_TABLE_FIRST_AGE];
}

double required_minimum_distribution(double prior_year_balance, int age, int birth_year) {
    if (prior_year_balance <= 0.0 || age < rmd_start_age(birth_year)) {
        return 0.0;
    }
    return prior_year_balance / rmd_divisor(age);
}

// ============================================================================
// State
// ============================================================================

const StateTaxRule* find_state_rule(const std::string& code) {
    const auto& rules = state_rules();
    auto it = rules.find(code);
    return it != rules.end() ? &it->second : nullptr;
}

bool state_taxes_social_security(const std::string& code) {
    static const std::set<std::string> taxing = {"CO", "CT", "MN", "MT", "NM", "RI", "UT",
                                                 "VT", "WV"};
    return taxing.count(code) > 0;
}

// ============================================================================
// TaxCalculator Implementation
// ============================================================================

TaxableIncome::TaxableIncome()
    : filing_status(FilingStatus::Single),
      ordinary(0.0),
      retirement_income(0.0),
      social_security(0.0),
      realized_gains(0.0),
      seniors(0),
      medicare_enrollees(0),
      lookback_magi(0.0),
      year_index(0) {}

TaxBreakdown::TaxBreakdown()
    : federal(0.0),
      capital_gains(0.0),
      niit(0.0),
      state(0.0),
      irmaa(0.0),
      taxable_social_security(0.0),
      magi(0.0) {}

TaxCalculator::TaxCalculator(const TaxProfile& profile, double inflation)
    : state_(profile.state),
      flat_state_rate_(profile.state_tax_rate),
      inflation_(inflation),
      state_rule_(find_state_rule(profile.state)) {}

double TaxCalculator::index(int year_index) const {
    return std::pow(1.0 + inflation_, year_index);
}

TaxBreakdown TaxCalculator::compute(const TaxableIncome& income) const {
    TaxBreakdown result;
    const double idx = index(income.year_index);
    const FilingStatus status = income.filing_status;

    const double other_income = income.ordinary + income.realized_gains;
    result.taxable_social_security = taxable_social_security(other_income, income.social_security,
                                                             status);
    result.magi = other_income + result.taxable_social_security;

    // Deduction offsets ordinary income first, any remainder offsets gains
    const double deduction = standard_deduction(status, income.seniors, idx);
    const double ordinary_gross = income.ordinary + result.taxable_social_security;
    const double ordinary_taxable = std::max(0.0, ordinary_gross - deduction);
    const double unused_deduction = std::max(0.0, deduction - ordinary_gross);
    const double taxable_gains = std::max(0.0, income.realized_gains - unused_deduction);

    result.federal = federal_ordinary_tax(ordinary_taxable, status, idx);
    result.capital_gains = capital_gains_tax(ordinary_taxable, taxable_gains, status, idx);
    result.niit = net_investment_income_tax(result.magi, income.realized_gains, status);
    result.state = state_tax(income, result.taxable_social_security, idx);

    if (income.medicare_enrollees > 0) {
        result.irmaa = irmaa_surcharge(income.lookback_magi, status, idx) *
                       income.medicare_enrollees;
    }

    return result;
}

double TaxCalculator::state_tax(const TaxableIncome& income, double taxable_ss, double idx) const {
    if (state_rule_ == nullptr) {
        double base = income.ordinary + income.realized_gains;
        if (state_taxes_social_security(state_)) {
            base += taxable_ss;
        }
        return flat_state_rate_ * std::max(0.0, base);
    }

    const StateTaxRule& rule = *state_rule_;
    if (!rule.has_income_tax) {
        return 0.0;
    }

    const bool joint = income.filing_status == FilingStatus::MarriedJoint;
    double excluded = std::min(income.retirement_income, rule.retirement_exclusion);
    double base = income.ordinary - excluded + income.realized_gains;
    if (rule.taxes_social_security) {
        base += taxable_ss;
    }
    base -= (joint ? rule.deduction_married : rule.deduction_single) * idx;
    if (base <= 0.0) {
        return 0.0;
    }
    return bracket_tax(base, joint ? rule.married : rule.single, idx);
}

// ============================================================================
// Gross-up search
// ============================================================================

GrossUpResult::GrossUpResult()
    : gross(0.0), surplus(0.0), feasible(true), iterations(0) {}

GrossUpResult gross_up(const std::function<double(double)>& surplus,
                       double min_gross, double max_gross,
                       double tolerance, int max_iterations) {
    GrossUpResult result;
    max_gross = std::max(max_gross, min_gross);

    double low_surplus = surplus(min_gross);
    if (low_surplus >= -tolerance) {
        result.gross = min_gross;
        result.surplus = low_surplus;
        return result;
    }

    double high_surplus = surplus(max_gross);
    if (high_surplus < -tolerance) {
        result.gross = max_gross;
        result.surplus = high_surplus;
        result.feasible = false;
        return result;
    }

    // Invariant: surplus(lo) < -tolerance <= surplus(hi)
    double lo = min_gross;
    double hi = max_gross;
    while (hi - lo > 0.005 && result.iterations < max_iterations) {
        double mid = 0.5 * (lo + hi);
        double mid_surplus = surplus(mid);
        if (mid_surplus >= -tolerance) {
            hi = mid;
            high_surplus = mid_surplus;
        } else {
            lo = mid;
        }
        ++result.iterations;
    }

    result.gross = hi;
    result.surplus = high_surplus;
    return result;
}

} // namespace retirecalc
