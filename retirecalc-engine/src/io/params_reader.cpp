#include "params_reader.hpp"
#include "../errors.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace retirecalc {
namespace io {

namespace {

// Counts arrive as signed JSON numbers; reject negatives before the unsigned cast
size_t read_count(const json& j, const char* key, size_t fallback, const std::string& field) {
    if (!j.contains(key)) {
        return fallback;
    }
    long long value = j.at(key).get<long long>();
    if (value <= 0) {
        throw InvalidParameterError(field, "must be positive");
    }
    return static_cast<size_t>(value);
}

AssetVector read_asset_vector(const json& j, const AssetVector& fallback) {
    AssetVector result = fallback;
    result[0] = j.value("stocks", fallback[0]);
    result[1] = j.value("bonds", fallback[1]);
    result[2] = j.value("cash", fallback[2]);
    return result;
}

Person read_person(const json& j, const std::string& field) {
    Person person;
    person.age = j.value("age", person.age);
    person.retirement_age = j.value("retirement_age", person.retirement_age);
    if (j.contains("gender")) {
        person.gender = parse_gender(j["gender"].get<std::string>(), field + ".gender");
    }
    if (j.contains("health")) {
        person.health = parse_health(j["health"].get<std::string>(), field + ".health");
    }
    person.life_expectancy = j.value("life_expectancy", person.life_expectancy);
    person.annual_savings = j.value("annual_savings", person.annual_savings);

    if (j.contains("social_security")) {
        const json& ss = j["social_security"];
        person.social_security.annual_benefit_at_fra =
            ss.value("annual_benefit_at_fra", person.social_security.annual_benefit_at_fra);
        person.social_security.claim_age = ss.value("claim_age", person.social_security.claim_age);
    }

    if (j.contains("pension") && !j["pension"].is_null()) {
        const json& pj = j["pension"];
        Pension pension;
        pension.annual_benefit = pj.value("annual_benefit", pension.annual_benefit);
        pension.survivor_fraction = pj.value("survivor_fraction", pension.survivor_fraction);
        pension.cola = pj.value("cola", pension.cola);
        pension.start_age = pj.value("start_age", pension.start_age);
        person.pension = pension;
    }

    if (j.contains("part_time") && !j["part_time"].is_null()) {
        const json& wj = j["part_time"];
        PartTimeWork work;
        work.annual_income = wj.value("annual_income", work.annual_income);
        work.end_age = wj.value("end_age", work.end_age);
        person.part_time = work;
    }

    return person;
}

Household read_household(const json& j) {
    std::string type = j.value("type", std::string(j.contains("spouse") ? "couple" : "single"));

    if (type == "couple") {
        if (!j.contains("primary") || !j.contains("spouse")) {
            throw ConfigParseError("couple household requires 'primary' and 'spouse'");
        }
        CoupleHousehold couple(read_person(j["primary"], "household.primary"),
                               read_person(j["spouse"], "household.spouse"));
        couple.survivor_expense_ratio = j.value("survivor_expense_ratio",
                                                couple.survivor_expense_ratio);
        return couple;
    }

    if (type != "single") {
        throw InvalidParameterError("household.type", "unknown household type '" + type + "'");
    }
    if (!j.contains("person")) {
        throw ConfigParseError("single household requires 'person'");
    }
    SingleHousehold single(read_person(j["person"], "household.person"));
    if (j.contains("filing_status")) {
        single.filing_status = parse_filing_status(j["filing_status"].get<std::string>(),
                                                   "household.filing_status");
    }
    return single;
}

void read_market(const json& j, MarketAssumptions& market) {
    static const char* const CLASS_KEYS[NUM_ASSET_CLASSES] = {"stocks", "bonds", "cash"};
    for (size_t k = 0; k < NUM_ASSET_CLASSES; ++k) {
        if (j.contains(CLASS_KEYS[k])) {
            const json& cj = j[CLASS_KEYS[k]];
            market.classes[k].cagr = cj.value("cagr", market.classes[k].cagr);
            market.classes[k].volatility = cj.value("volatility", market.classes[k].volatility);
        }
    }

    if (j.contains("correlation")) {
        const json& cj = j["correlation"];
        if (!cj.is_array() || cj.size() != NUM_ASSET_CLASSES) {
            throw ConfigParseError("market.correlation must be a 3x3 array");
        }
        for (size_t r = 0; r < NUM_ASSET_CLASSES; ++r) {
            if (!cj[r].is_array() || cj[r].size() != NUM_ASSET_CLASSES) {
                throw ConfigParseError("market.correlation must be a 3x3 array");
            }
            for (size_t c = 0; c < NUM_ASSET_CLASSES; ++c) {
                market.correlation[r][c] = cj[r][c].get<double>();
            }
        }
    }

    market.inflation = j.value("inflation", market.inflation);
    market.healthcare_inflation = j.value("healthcare_inflation", market.healthcare_inflation);
    market.social_security_cola = j.value("social_security_cola", market.social_security_cola);
    if (j.contains("distribution")) {
        market.distribution = parse_distribution(j["distribution"].get<std::string>(),
                                                 "market.distribution");
    }
    market.degrees_of_freedom = j.value("degrees_of_freedom", market.degrees_of_freedom);
}

void read_ltc(const json& j, LtcAssumptions& ltc) {
    ltc.enabled = j.value("enabled", ltc.enabled);
    ltc.lifetime_probability = j.value("lifetime_probability", ltc.lifetime_probability);
    ltc.onset_age_min = j.value("onset_age_min", ltc.onset_age_min);
    ltc.onset_age_max = j.value("onset_age_max", ltc.onset_age_max);
    ltc.average_duration_years = j.value("average_duration_years", ltc.average_duration_years);
    ltc.average_annual_cost = j.value("average_annual_cost", ltc.average_annual_cost);
    ltc.inflation = j.value("inflation", ltc.inflation);

    if (j.contains("insurance") && !j["insurance"].is_null()) {
        const json& ij = j["insurance"];
        LtcInsurance policy;
        policy.daily_benefit = ij.value("daily_benefit", policy.daily_benefit);
        policy.benefit_years = ij.value("benefit_years", policy.benefit_years);
        policy.elimination_days = ij.value("elimination_days", policy.elimination_days);
        policy.inflation_rider = ij.value("inflation_rider", policy.inflation_rider);
        ltc.insurance = policy;
    }
}

void read_simulation(const json& j, SimulationSettings& s) {
    s.iterations = read_count(j, "iterations", s.iterations, "simulation.iterations");
    s.seed = j.value("seed", s.seed);
    s.dynamic_mortality = j.value("dynamic_mortality", s.dynamic_mortality);

    VarianceReduction& vr = s.variance_reduction;
    vr.antithetic = j.value("antithetic", vr.antithetic);
    vr.control_variates = j.value("control_variates", vr.control_variates);
    vr.control_years = j.value("control_years", vr.control_years);
    vr.latin_hypercube = j.value("latin_hypercube", vr.latin_hypercube);
    vr.lhs_years = j.value("lhs_years", vr.lhs_years);

    if (j.contains("regime")) {
        const json& rj = j["regime"];
        RegimeSwitching& regime = s.regime;
        regime.enabled = rj.value("enabled", regime.enabled);
        regime.normal_to_stress = rj.value("normal_to_stress", regime.normal_to_stress);
        regime.stress_to_normal = rj.value("stress_to_normal", regime.stress_to_normal);
        if (rj.contains("stress_mean_shift")) {
            regime.stress_mean_shift = read_asset_vector(rj["stress_mean_shift"],
                                                         regime.stress_mean_shift);
        }
        regime.stress_volatility_multiplier =
            rj.value("stress_volatility_multiplier", regime.stress_volatility_multiplier);
    }

    if (j.contains("safe_withdrawal_rate")) {
        const json& wj = j["safe_withdrawal_rate"];
        s.compute_safe_withdrawal_rate = wj.value("enabled", s.compute_safe_withdrawal_rate);
        s.swr_target_success = wj.value("target_success", s.swr_target_success);
        s.swr_max_iterations = wj.value("max_iterations", s.swr_max_iterations);
        s.swr_iterations = read_count(wj, "iterations", s.swr_iterations,
                                      "simulation.swr_iterations");
    }
}

} // anonymous namespace

SimulationParameters parameters_from_json(const json& j) {
    SimulationParameters params;

    try {
        if (!j.is_object()) {
            throw ConfigParseError("profile must be a JSON object");
        }
        if (!j.contains("household")) {
            throw ConfigParseError("Missing required field: household");
        }
        params.household = read_household(j["household"]);

        if (j.contains("assets")) {
            const json& aj = j["assets"];
            AssetBuckets& a = params.assets;
            a.tax_deferred = aj.value("tax_deferred", a.tax_deferred);
            a.tax_free = aj.value("tax_free", a.tax_free);
            a.capital_gains = aj.value("capital_gains", a.capital_gains);
            a.cash_equivalents = aj.value("cash_equivalents", a.cash_equivalents);
            // Basis defaults to the full taxable balance
            a.capital_gains_basis = aj.value("capital_gains_basis", a.capital_gains);
        }

        if (j.contains("expenses")) {
            const json& ej = j["expenses"];
            ExpenseProfile& e = params.expenses;
            e.annual_expenses = ej.value("annual_expenses", e.annual_expenses);
            e.essential_fraction = ej.value("essential_fraction", e.essential_fraction);
            e.annual_healthcare = ej.value("annual_healthcare", e.annual_healthcare);
        }

        if (j.contains("market")) {
            read_market(j["market"], params.market);
        }

        if (j.contains("allocation")) {
            const json& aj = j["allocation"];
            AllocationPolicy& alloc = params.allocation;
            alloc.weights = read_asset_vector(aj, alloc.weights);
            alloc.glide_path = aj.value("glide_path", alloc.glide_path);
            alloc.glide_end_stocks = aj.value("glide_end_stocks", alloc.glide_end_stocks);
            alloc.glide_years = aj.value("glide_years", alloc.glide_years);
        }

        if (j.contains("guardrails")) {
            const json& gj = j["guardrails"];
            GuardrailPolicy& g = params.guardrails;
            g.enabled = gj.value("enabled", g.enabled);
            g.withdrawal_rate = gj.value("withdrawal_rate", g.withdrawal_rate);
            g.upper_threshold = gj.value("upper_threshold", g.upper_threshold);
            g.lower_threshold = gj.value("lower_threshold", g.lower_threshold);
            g.cut_percent = gj.value("cut_percent", g.cut_percent);
            g.raise_percent = gj.value("raise_percent", g.raise_percent);
            g.floor = gj.value("floor", g.floor);
            g.ceiling = gj.value("ceiling", g.ceiling);
        }

        if (j.contains("tax")) {
            const json& tj = j["tax"];
            TaxProfile& t = params.tax;
            t.state = tj.value("state", t.state);
            t.state_tax_rate = tj.value("state_tax_rate", t.state_tax_rate);
            t.prior_magi = tj.value("prior_magi", t.prior_magi);
            t.start_year = tj.value("start_year", t.start_year);
        }

        if (j.contains("ltc")) {
            read_ltc(j["ltc"], params.ltc);
        }

        if (j.contains("simulation")) {
            read_simulation(j["simulation"], params.simulation);
        }

        params.legacy_goal = j.value("legacy_goal", params.legacy_goal);
    } catch (const json::exception& e) {
        throw ConfigParseError(e.what());
    }

    return params;
}

SimulationParameters parse_parameters_json(std::istream& is) {
    json j;
    try {
        j = json::parse(is);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parameters_from_json(j);
}

SimulationParameters load_parameters_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open parameters file: " + filepath);
    }
    return parse_parameters_json(file);
}

} // namespace io
} // namespace retirecalc
