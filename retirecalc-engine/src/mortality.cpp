#include "mortality.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace retirecalc {

namespace {

// SSA 2021 period life table, qx for ages 50-119 (age 120 is certain death)
constexpr int SSA_FIRST_AGE = 50;
constexpr double SSA_MALE_QX[] = {
    0.004186, 0.004530, 0.004912, 0.005346, 0.005838, 0.006390, 0.006993, 0.007646,
    0.008359, 0.009147, 0.010028, 0.010998, 0.012047, 0.013168, 0.014366, 0.015651,
    0.017030, 0.018506, 0.020088, 0.021791, 0.023640, 0.025660, 0.027872, 0.030275,
    0.032884, 0.035746, 0.038921, 0.042465, 0.046414, 0.050799, 0.055651, 0.061000,
    0.066875, 0.073305, 0.080319, 0.087945, 0.096211, 0.105145, 0.114772, 0.125116,
    0.136200, 0.148046, 0.160674, 0.174102, 0.188348, 0.203426, 0.219352, 0.236136,
    0.253789, 0.272320, 0.291735, 0.312043, 0.333249, 0.355359, 0.378378, 0.402310,
    0.427159, 0.452928, 0.479619, 0.507236, 0.535782, 0.565256, 0.595662, 0.627001,
    0.659274, 0.692482, 0.726625, 0.761705, 0.797720, 0.834672
};
constexpr double SSA_FEMALE_QX[] = {
    0.002634, 0.002838, 0.003071, 0.003344, 0.003658, 0.004005, 0.004379, 0.004780,
    0.005217, 0.005710, 0.006283, 0.006920, 0.007610, 0.008351, 0.009154, 0.010035,
    0.010998, 0.012049, 0.013201, 0.014477, 0.015901, 0.017483, 0.019230, 0.021139,
    0.023216, 0.025490, 0.027998, 0.030774, 0.033834, 0.037189, 0.040853, 0.044842,
    0.049174, 0.053870, 0.058954, 0.064449, 0.070379, 0.076770, 0.083647, 0.091037,
    0.098966, 0.107461, 0.116549, 0.126257, 0.136613, 0.147644, 0.159378, 0.171842,
    0.185064, 0.199071, 0.213890, 0.229548, 0.246073, 0.263492, 0.281832, 0.301122,
    0.321389, 0.342661, 0.364966, 0.388332, 0.412788, 0.438361, 0.465082, 0.492978,
    0.522080, 0.552418, 0.584022, 0.616923, 0.651152, 0.686741
};
constexpr size_t SSA_ROWS = sizeof(SSA_MALE_QX) / sizeof(SSA_MALE_QX[0]);

MortalityTable build_ssa_table() {
    MortalityTable table;
    for (int age = 0; age <= MortalityTable::MAX_AGE; ++age) {
        int row = std::max(age, SSA_FIRST_AGE) - SSA_FIRST_AGE;
        if (row < static_cast<int>(SSA_ROWS)) {
            table.set_qx(age, Gender::Male, SSA_MALE_QX[row]);
            table.set_qx(age, Gender::Female, SSA_FEMALE_QX[row]);
        } else {
            table.set_qx(age, Gender::Male, 1.0);
            table.set_qx(age, Gender::Female, 1.0);
        }
    }
    return table;
}

} // anonymous namespace

// ============================================================================
// MortalityTable Implementation
// ============================================================================

MortalityTable::MortalityTable() {
    for (auto& gender_rates : rates_) {
        gender_rates.fill(0.0);
    }
}

void MortalityTable::set_qx(int age, Gender gender, double qx) {
    if (age < 0 || age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " outside table range 0-" +
                                std::to_string(MAX_AGE));
    }
    if (!(qx >= 0.0 && qx <= 1.0)) {
        throw std::invalid_argument("qx must be between 0.0 and 1.0");
    }
    rates_[static_cast<size_t>(gender)][static_cast<size_t>(age)] = qx;
}

double MortalityTable::get_qx(int age, Gender gender) const {
    if (age < 0 || age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " outside table range 0-" +
                                std::to_string(MAX_AGE));
    }
    return rates_[static_cast<size_t>(gender)][static_cast<size_t>(age)];
}

double MortalityTable::hazard(int age, Gender gender, double multiplier) const {
    int clamped = std::min(std::max(age, 0), MAX_AGE);
    if (clamped == MAX_AGE) {
        return 1.0;
    }
    return std::min(get_qx(clamped, gender) * multiplier, 1.0);
}

MortalityTable MortalityTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open mortality file: " + filepath);
    }
    return load_from_csv(file);
}

MortalityTable MortalityTable::load_from_csv(std::istream& is) {
    // Start from the built-in table so a partial file only overrides its rows
    MortalityTable table = ssa_2021();
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (row.size() < 3) {
            throw std::runtime_error("Mortality CSV requires columns: age,male_qx,female_qx");
        }

        int age = std::stoi(row[0]);
        table.set_qx(age, Gender::Male, std::stod(row[1]));
        table.set_qx(age, Gender::Female, std::stod(row[2]));
    }

    return table;
}

const MortalityTable& MortalityTable::ssa_2021() {
    static const MortalityTable table = build_ssa_table();
    return table;
}

// ============================================================================
// Survival
// ============================================================================

double health_multiplier(HealthStatus health) {
    switch (health) {
        case HealthStatus::Excellent: return 0.7;
        case HealthStatus::Good: return 1.0;
        case HealthStatus::Fair: return 1.3;
        case HealthStatus::Poor: return 1.6;
    }
    return 1.0;
}

double survival_probability(const MortalityTable& table, int from_age, int to_age,
                            Gender gender, HealthStatus health) {
    if (to_age <= from_age) {
        return 1.0;
    }
    const double multiplier = health_multiplier(health);
    double survival = 1.0;
    for (int age = from_age; age < to_age; ++age) {
        survival *= 1.0 - table.hazard(age, gender, multiplier);
        if (survival <= 0.0) {
            return 0.0;
        }
    }
    return survival;
}

double life_expectancy(const MortalityTable& table, int age, Gender gender, HealthStatus health) {
    const double multiplier = health_multiplier(health);
    int start = std::min(std::max(age, 0), MortalityTable::MAX_AGE);

    // Curtate expectation plus half a year for the year of death
    double survival = 1.0;
    double curtate = 0.0;
    for (int a = start; a < MortalityTable::MAX_AGE; ++a) {
        survival *= 1.0 - table.hazard(a, gender, multiplier);
        curtate += survival;
        if (survival <= 0.0) break;
    }
    return static_cast<double>(start) + curtate + 0.5;
}

int final_age(const MortalityTable& table, const Person& person, bool dynamic,
              RandomStream& stream) {
    if (!dynamic) {
        return person.life_expectancy;
    }

    const double multiplier = health_multiplier(person.health);
    int age = std::min(std::max(person.age, 0), MortalityTable::MAX_AGE);
    while (age < MortalityTable::MAX_AGE) {
        if (stream.uniform() < table.hazard(age, person.gender, multiplier)) {
            return age;
        }
        ++age;
    }
    return MortalityTable::MAX_AGE;
}

Horizon::Horizon()
    : primary_final_age(0), spouse_final_age(-1), years(0) {}

Horizon sample_horizon(const MortalityTable& table, const Household& household, bool dynamic,
                       RandomStream& stream) {
    Horizon horizon;

    if (const auto* single = std::get_if<SingleHousehold>(&household)) {
        horizon.primary_final_age = final_age(table, single->person, dynamic, stream);
        horizon.years = std::max(0, horizon.primary_final_age - single->person.age + 1);
        return horizon;
    }

    // Spouses are sampled independently from the same stream, primary first
    const auto& couple = std::get<CoupleHousehold>(household);
    horizon.primary_final_age = final_age(table, couple.primary, dynamic, stream);
    horizon.spouse_final_age = final_age(table, couple.spouse, dynamic, stream);

    int primary_years = horizon.primary_final_age - couple.primary.age + 1;
    int spouse_years = horizon.spouse_final_age - couple.spouse.age + 1;
    horizon.years = std::max(0, std::max(primary_years, spouse_years));
    return horizon;
}

} // namespace retirecalc
