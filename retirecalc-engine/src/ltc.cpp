#include "ltc.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace retirecalc {

namespace {

const CareTypeProfile CARE_TYPES[NUM_CARE_TYPES] = {
    {CareType::HomeCare, 0.40, 0.6},
    {CareType::AssistedLiving, 0.35, 0.8},
    {CareType::NursingHome, 0.20, 1.2},
    {CareType::MemoryCare, 0.05, 1.4}
};

const std::map<std::string, double>& regional_multipliers() {
    static const std::map<std::string, double> table = {
        {"CA", 1.40}, {"NY", 1.35}, {"MA", 1.30}, {"CT", 1.25}, {"NJ", 1.20},
        {"FL", 0.90}, {"TX", 0.80}, {"GA", 0.85}, {"NC", 0.90}, {"AZ", 0.95},
        {"NV", 1.00}, {"WA", 1.15}, {"OR", 1.10}, {"CO", 1.05}, {"IL", 1.00},
        {"MI", 0.90}, {"OH", 0.85}, {"PA", 0.95}, {"VA", 1.00}, {"MD", 1.10}
    };
    return table;
}

double gender_probability_factor(Gender gender) {
    return gender == Gender::Female ? 1.15 : 0.85;
}

double gender_duration_factor(Gender gender) {
    return gender == Gender::Female ? 1.15 : 0.85;
}

double health_probability_factor(HealthStatus health) {
    switch (health) {
        case HealthStatus::Excellent: return 0.8;
        case HealthStatus::Good: return 1.0;
        case HealthStatus::Fair: return 1.2;
        case HealthStatus::Poor: return 1.4;
    }
    return 1.0;
}

constexpr double MAX_LTC_PROBABILITY = 0.95;
constexpr double MIN_DURATION_YEARS = 0.5;

double overlap(double a_start, double a_end, double b_start, double b_end) {
    return std::max(0.0, std::min(a_end, b_end) - std::max(a_start, b_start));
}

} // anonymous namespace

const CareTypeProfile& care_type_profile(CareType type) {
    return CARE_TYPES[static_cast<size_t>(type)];
}

double ltc_regional_multiplier(const std::string& state) {
    const auto& table = regional_multipliers();
    auto it = table.find(state);
    return it != table.end() ? it->second : 1.0;
}

double ltc_probability(const LtcAssumptions& ltc, Gender gender, HealthStatus health) {
    double p = ltc.lifetime_probability * gender_probability_factor(gender) *
               health_probability_factor(health);
    return std::min(p, MAX_LTC_PROBABILITY);
}

LtcEpisode::LtcEpisode()
    : occurs(false),
      onset_age(0.0),
      duration_years(0.0),
      care_type(CareType::HomeCare),
      annual_cost(0.0) {}

LtcEpisode sample_ltc_episode(const LtcAssumptions& ltc, const Person& person,
                              const std::string& state, RandomStream& stream) {
    const double occurrence_draw = stream.uniform();
    const double onset_draw = stream.uniform();
    const double duration_draw = stream.uniform();
    const double care_draw = stream.uniform();

    LtcEpisode episode;
    if (occurrence_draw >= ltc_probability(ltc, person.gender, person.health)) {
        return episode;
    }

    episode.occurs = true;
    episode.onset_age = ltc.onset_age_min + (ltc.onset_age_max - ltc.onset_age_min) * onset_draw;
    episode.duration_years = std::max(MIN_DURATION_YEARS,
                                      ltc.average_duration_years * gender_duration_factor(person.gender) *
                                      (0.5 + duration_draw));

    double cumulative = 0.0;
    episode.care_type = CareType::MemoryCare;
    for (const auto& profile : CARE_TYPES) {
        cumulative += profile.probability;
        if (care_draw < cumulative) {
            episode.care_type = profile.type;
            break;
        }
    }

    episode.annual_cost = ltc.average_annual_cost *
                          care_type_profile(episode.care_type).cost_multiplier *
                          ltc_regional_multiplier(state);
    return episode;
}

LtcYearCost::LtcYearCost()
    : gross(0.0), insurance_benefit(0.0) {}

LtcYearCost ltc_cost_for_year(const LtcEpisode& episode, const LtcAssumptions& ltc,
                              int age, int year_index) {
    LtcYearCost cost;
    if (!episode.occurs) {
        return cost;
    }

    const double year_start = static_cast<double>(age);
    const double year_end = year_start + 1.0;
    const double in_care = overlap(year_start, year_end, episode.onset_age, episode.end_age());
    if (in_care <= 0.0) {
        return cost;
    }

    cost.gross = episode.annual_cost * std::pow(1.0 + ltc.inflation, year_index) * in_care;

    if (ltc.insurance) {
        // Coverage window in age terms: after the elimination period, for benefit_years
        const LtcInsurance& policy = *ltc.insurance;
        double cover_start = episode.onset_age + policy.elimination_days / 365.0;
        double cover_end = cover_start + policy.benefit_years;
        double covered = overlap(std::max(year_start, episode.onset_age),
                                 std::min(year_end, episode.end_age()),
                                 cover_start, cover_end);
        double benefit = policy.daily_benefit * 365.0 * covered *
                         std::pow(1.0 + policy.inflation_rider, year_index);
        cost.insurance_benefit = std::min(benefit, cost.gross);
    }

    return cost;
}

} // namespace retirecalc
