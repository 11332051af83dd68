#ifndef RETIRECALC_LTC_HPP
#define RETIRECALC_LTC_HPP

#include "params.hpp"
#include "rng.hpp"
#include <string>

namespace retirecalc {

// Care-type mix and cost relative to the national average annual cost
struct CareTypeProfile {
    CareType type;
    double probability;
    double cost_multiplier;
};

const CareTypeProfile& care_type_profile(CareType type);

// State cost multiplier relative to the national average (1.0 if unknown)
double ltc_regional_multiplier(const std::string& state);

// Lifetime probability of needing care, adjusted by gender and health
double ltc_probability(const LtcAssumptions& ltc, Gender gender, HealthStatus health);

struct LtcEpisode {
    bool occurs;
    double onset_age;
    double duration_years;
    CareType care_type;
    double annual_cost;             // Today's dollars incl. care-type and regional multipliers

    LtcEpisode();

    double end_age() const { return onset_age + duration_years; }
};

// Always consumes the same number of draws so toggling insurance or
// other assumptions keeps scenarios paired
LtcEpisode sample_ltc_episode(const LtcAssumptions& ltc, const Person& person,
                              const std::string& state, RandomStream& stream);

struct LtcYearCost {
    double gross;
    double insurance_benefit;

    LtcYearCost();

    double net() const { return gross - insurance_benefit; }
};

// Cost of the part of the episode that falls inside [age, age + 1),
// inflated from today at the LTC rate, less any insurance benefit
LtcYearCost ltc_cost_for_year(const LtcEpisode& episode, const LtcAssumptions& ltc,
                              int age, int year_index);

} // namespace retirecalc

#endif // RETIRECALC_LTC_HPP
