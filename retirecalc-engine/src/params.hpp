#ifndef RETIRECALC_PARAMS_HPP
#define RETIRECALC_PARAMS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace retirecalc {

enum class Gender : uint8_t {
    Male = 0,
    Female = 1
};

enum class HealthStatus : uint8_t {
    Excellent = 0,
    Good = 1,
    Fair = 2,
    Poor = 3
};

enum class FilingStatus : uint8_t {
    Single = 0,
    MarriedJoint = 1,
    HeadOfHousehold = 2
};

// Asset classes sampled by the return generator
enum class AssetClass : uint8_t {
    Stocks = 0,
    Bonds = 1,
    Cash = 2
};

constexpr size_t NUM_ASSET_CLASSES = 3;

// Shape of the annual return innovations
enum class ReturnDistribution : uint8_t {
    Normal = 0,
    StudentT = 1        // Multivariate t, rescaled to unit variance
};

using AssetVector = std::array<double, NUM_ASSET_CLASSES>;
using CorrelationMatrix = std::array<AssetVector, NUM_ASSET_CLASSES>;

std::string gender_to_string(Gender gender);
std::string health_to_string(HealthStatus health);
std::string filing_status_to_string(FilingStatus status);
std::string distribution_to_string(ReturnDistribution distribution);

// Parse helpers used at ingestion; throw InvalidParameterError on unknown names
Gender parse_gender(const std::string& value, const std::string& field);
HealthStatus parse_health(const std::string& value, const std::string& field);
FilingStatus parse_filing_status(const std::string& value, const std::string& field);
ReturnDistribution parse_distribution(const std::string& value, const std::string& field);

// ============================================================================
// Household
// ============================================================================

// Annual Social Security benefit payable at full retirement age, in today's dollars
struct SocialSecurityBenefit {
    double annual_benefit_at_fra;
    int claim_age;

    SocialSecurityBenefit();
    SocialSecurityBenefit(double benefit, int claim);
};

struct Pension {
    double annual_benefit;          // Nominal benefit in the first payment year
    double survivor_fraction;       // Share paid to the surviving spouse (0-1)
    double cola;                    // Annual cost-of-living increase
    int start_age;                  // 0 = owner's retirement age

    Pension();
};

struct PartTimeWork {
    double annual_income;           // Today's dollars, grows with general inflation
    int end_age;                    // Income stops once the owner reaches this age

    PartTimeWork();
};

struct Person {
    int age;
    int retirement_age;
    Gender gender;
    HealthStatus health;
    int life_expectancy;            // Fixed horizon when dynamic mortality is off
    double annual_savings;          // Pre-retirement contribution to tax-deferred
    SocialSecurityBenefit social_security;
    std::optional<Pension> pension;
    std::optional<PartTimeWork> part_time;

    Person();
};

struct SingleHousehold {
    Person person;
    FilingStatus filing_status;     // Single or HeadOfHousehold

    SingleHousehold();
    explicit SingleHousehold(const Person& p);
};

struct CoupleHousehold {
    Person primary;
    Person spouse;
    double survivor_expense_ratio;  // Non-healthcare spending after the first death

    CoupleHousehold();
    CoupleHousehold(const Person& first, const Person& second);
};

using Household = std::variant<SingleHousehold, CoupleHousehold>;

const Person& primary_person(const Household& household);
bool is_couple(const Household& household);
FilingStatus household_filing_status(const Household& household);

// ============================================================================
// Assets, expenses and market assumptions
// ============================================================================

struct AssetBuckets {
    double tax_deferred;
    double tax_free;
    double capital_gains;           // Taxable brokerage balance
    double cash_equivalents;
    double capital_gains_basis;     // Cost basis of the taxable bucket

    AssetBuckets();
    AssetBuckets(double deferred, double free, double taxable, double cash, double basis);

    double total() const { return tax_deferred + tax_free + capital_gains + cash_equivalents; }
    double invested() const { return tax_deferred + tax_free + capital_gains; }
};

struct ExpenseProfile {
    double annual_expenses;         // Essential + discretionary, today's dollars
    double essential_fraction;      // Share of annual_expenses that guardrails never touch
    double annual_healthcare;       // Household healthcare, today's dollars

    ExpenseProfile();

    double essential() const { return annual_expenses * essential_fraction; }
    double discretionary() const { return annual_expenses * (1.0 - essential_fraction); }
};

struct AssetClassAssumption {
    double cagr;
    double volatility;

    AssetClassAssumption();
    AssetClassAssumption(double growth, double vol);
};

struct MarketAssumptions {
    std::array<AssetClassAssumption, NUM_ASSET_CLASSES> classes;
    CorrelationMatrix correlation;
    double inflation;
    double healthcare_inflation;
    double social_security_cola;
    ReturnDistribution distribution;
    int degrees_of_freedom;             // Student-t only, at least 3

    MarketAssumptions();
};

// Target weights of the invested buckets; the glide path moves the stock
// weight linearly toward glide_end_stocks, shifting the difference into bonds
struct AllocationPolicy {
    AssetVector weights;
    bool glide_path;
    double glide_end_stocks;
    int glide_years;

    AllocationPolicy();

    AssetVector weights_for_year(int year_index) const;
};

struct GuardrailPolicy {
    bool enabled;
    double withdrawal_rate;         // Initial rate when the first year needs no withdrawal
    double upper_threshold;         // Multiple of the initial rate that triggers a cut
    double lower_threshold;         // Multiple of the initial rate that triggers a raise
    double cut_percent;
    double raise_percent;
    double floor;                   // Minimum discretionary multiplier
    double ceiling;                 // Maximum discretionary multiplier

    GuardrailPolicy();
};

struct TaxProfile {
    std::string state;              // Two-letter code, empty for none
    double state_tax_rate;          // Flat fallback for states without a table
    double prior_magi;              // MAGI assumed for the IRMAA lookback before history exists
    int start_year;                 // Calendar year of simulation year 0

    TaxProfile();
};

// ============================================================================
// Long-term care
// ============================================================================

enum class CareType : uint8_t {
    HomeCare = 0,
    AssistedLiving = 1,
    NursingHome = 2,
    MemoryCare = 3
};

constexpr size_t NUM_CARE_TYPES = 4;

std::string care_type_to_string(CareType type);

struct LtcInsurance {
    double daily_benefit;
    double benefit_years;
    int elimination_days;
    double inflation_rider;         // Compound benefit growth per year, 0 = none

    LtcInsurance();
};

struct LtcAssumptions {
    bool enabled;
    double lifetime_probability;
    int onset_age_min;
    int onset_age_max;
    double average_duration_years;
    double average_annual_cost;     // Today's dollars, national average
    double inflation;               // LTC-specific cost inflation
    std::optional<LtcInsurance> insurance;

    LtcAssumptions();
};

// ============================================================================
// Simulation settings
// ============================================================================

struct VarianceReduction {
    bool antithetic;
    bool control_variates;
    int control_years;              // Horizon of the control statistic
    bool latin_hypercube;
    int lhs_years;                  // Years stratified per scenario

    VarianceReduction();
};

struct RegimeSwitching {
    bool enabled;
    double normal_to_stress;
    double stress_to_normal;
    AssetVector stress_mean_shift;
    double stress_volatility_multiplier;

    RegimeSwitching();
};

struct SimulationSettings {
    size_t iterations;
    uint64_t seed;
    bool dynamic_mortality;
    VarianceReduction variance_reduction;
    RegimeSwitching regime;
    bool compute_safe_withdrawal_rate;
    double swr_target_success;
    int swr_max_iterations;
    size_t swr_iterations;          // Scenarios per search evaluation

    SimulationSettings();
};

// Canonical engine input. Built once at ingestion and never coerced again.
struct SimulationParameters {
    Household household;
    AssetBuckets assets;
    ExpenseProfile expenses;
    MarketAssumptions market;
    AllocationPolicy allocation;
    GuardrailPolicy guardrails;
    TaxProfile tax;
    LtcAssumptions ltc;
    SimulationSettings simulation;
    double legacy_goal;

    SimulationParameters();
};

// Throws InvalidParameterError naming the first offending field
void validate_parameters(const SimulationParameters& params);

} // namespace retirecalc

#endif // RETIRECALC_PARAMS_HPP
