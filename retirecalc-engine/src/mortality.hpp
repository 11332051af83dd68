#ifndef RETIRECALC_MORTALITY_HPP
#define RETIRECALC_MORTALITY_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <string>
#include "params.hpp"
#include "rng.hpp"

namespace retirecalc {

// MortalityTable: qx rates by age (0-120) and gender
// qx = probability of death within one year for a life aged x
class MortalityTable {
public:
    static constexpr int MAX_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_AGE + 1;  // 0 to 120 inclusive
    static constexpr size_t NUM_GENDERS = 2;

    MortalityTable();

    // Set/get mortality rate for a specific age and gender; throws out_of_range
    void set_qx(int age, Gender gender, double qx);
    double get_qx(int age, Gender gender) const;

    // Age clamped to [0, MAX_AGE], qx times multiplier capped at 1.0
    double hazard(int age, Gender gender, double multiplier) const;

    // Load from CSV: expects columns age,male_qx,female_qx
    static MortalityTable load_from_csv(const std::string& filepath);
    static MortalityTable load_from_csv(std::istream& is);

    // SSA 2021 period life table; ages below 50 use the age-50 rate
    static const MortalityTable& ssa_2021();

private:
    // rates_[gender][age] = qx
    std::array<std::array<double, NUM_AGES>, NUM_GENDERS> rates_;
};

// Hazard multiplier by self-reported health
double health_multiplier(HealthStatus health);

// Probability of surviving from from_age to to_age
double survival_probability(const MortalityTable& table, int from_age, int to_age,
                            Gender gender, HealthStatus health);

// Expected age at death, counting half a year in the year of death
double life_expectancy(const MortalityTable& table, int age, Gender gender, HealthStatus health);

// Last age the person is alive for. Fixed horizon uses life_expectancy;
// sampled mode walks the hazard with the mortality stream.
int final_age(const MortalityTable& table, const Person& person, bool dynamic,
              RandomStream& stream);

// Per-scenario household horizon
struct Horizon {
    int primary_final_age;
    int spouse_final_age;           // -1 for a single household
    int years;                      // Simulated years, 0 = automatic success

    Horizon();

    // True while the person is alive in the given year
    bool primary_alive(int year, int primary_age) const {
        return primary_age + year <= primary_final_age;
    }
    bool spouse_alive(int year, int spouse_age) const {
        return spouse_final_age >= 0 && spouse_age + year <= spouse_final_age;
    }
};

// Household horizon ends with the later death
Horizon sample_horizon(const MortalityTable& table, const Household& household, bool dynamic,
                       RandomStream& stream);

} // namespace retirecalc

#endif // RETIRECALC_MORTALITY_HPP
