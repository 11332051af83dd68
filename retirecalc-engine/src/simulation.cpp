#include "simulation.hpp"
#include "errors.hpp"
#include "income.hpp"
#include "logger.hpp"
#include "return_generator.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <map>
#include <new>
#include <numeric>
#include <system_error>
#include <thread>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace retirecalc {

// ============================================================================
// Result types
// ============================================================================

SimulationOptions::SimulationOptions()
    : worker_threads(0),
      cancel(nullptr),
      mortality(nullptr),
      include_representative(true),
      ltc_counterfactual(true),
      run_label("") {}

BalanceBand::BalanceBand()
    : year(0), p10(0.0), p50(0.0), p90(0.0), active_scenarios(0) {}

GuardrailStatistics::GuardrailStatistics()
    : average_adjustments(0.0), total_cuts(0), total_raises(0), scenarios_with_cut(0) {}

LtcImpact::LtcImpact()
    : computed(false),
      occurrence_probability(0.0),
      average_cost_when_occurs(0.0),
      counterfactual_run(false),
      success_without_ltc(0.0),
      success_delta(0.0) {}

SafeWithdrawalRate::SafeWithdrawalRate()
    : computed(false), rate(0.0), success_at_rate(0.0), low_confidence(false), iterations(0) {}

DangerZone::DangerZone()
    : year(0), age(0), depletion_rate(0.0) {}

DrawdownStatistics::DrawdownStatistics()
    : max_drawdown(0.0), max_duration(0), ulcer_index(0.0) {}

RiskMetrics::RiskMetrics()
    : cvar_95(0.0),
      cvar_99(0.0),
      median_max_drawdown(0.0),
      median_drawdown_duration(0.0),
      median_ulcer_index(0.0),
      sequence_risk_score(0.0) {}

SimulationResult::SimulationResult()
    : success_probability(0.0),
      adjusted_success_probability(0.0),
      control_variate_applied(false),
      control_beta(0.0),
      p10_ending_balance(0.0),
      p50_ending_balance(0.0),
      p90_ending_balance(0.0),
      mean_ending_balance(0.0),
      mean_years_until_depletion(0.0),
      successful_scenarios(0),
      failed_scenarios(0),
      excluded_scenarios(0),
      total_scenarios(0),
      representative_scenario(-1),
      legacy_goal_probability(0.0),
      execution_time_ms(0.0) {}

ControlVariateEstimate::ControlVariateEstimate()
    : estimate(0.0), beta(0.0), applied(false) {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

// Linear interpolation between closest ranks; values sorted ascending, p in 0-100
double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

int resolve_workers(int requested) {
    if (requested > 0) {
        return requested;
    }
#ifdef HAVE_OPENMP
    return omp_get_max_threads();
#else
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
#endif
}

RunContext make_context(const SimulationParameters& params, const SimulationOptions& options,
                        const std::string& phase) {
    std::string run_id = options.run_label.empty()
                             ? "run-" + std::to_string(params.simulation.seed)
                             : options.run_label;
    return RunContext(run_id, params.simulation.seed, phase);
}

void validate_logged(const SimulationParameters& params, const RunContext& ctx) {
    try {
        validate_parameters(params);
    } catch (const InvalidParameterError& e) {
        Logger::get_instance().log_validation_failure(ctx, e.field(), e.what());
        throw;
    }
}

struct Batch {
    std::vector<ScenarioOutcome> outcomes;
    std::vector<char> excluded;     // Per-index flags, written by one worker each
    size_t excluded_count;
};

// Runs every scenario into its own slot. Exceptions other than numeric
// instability abort the batch and are rethrown on the calling thread.
Batch run_batch(const ScenarioRunner& runner, size_t iterations, const SimulationOptions& options,
                const RunContext& ctx, int workers) {
    Batch batch;
    batch.outcomes.resize(iterations);
    batch.excluded.assign(iterations, 0);
    batch.excluded_count = 0;

    std::atomic<bool> stop(false);

    auto run_one = [&](size_t s) {
        if (stop.load(std::memory_order_relaxed)) {
            return;
        }
        if (options.cancel != nullptr && options.cancel->load()) {
            stop = true;
            return;
        }
        try {
            batch.outcomes[s] = runner.run(s);
        } catch (const NumericInstabilityError& e) {
            batch.excluded[s] = 1;
            Logger::get_instance().log_scenario_excluded(ctx, s, e.year(), e.what());
        }
    };

#ifdef HAVE_OPENMP
    std::exception_ptr failure;
    const long long count = static_cast<long long>(iterations);

    #pragma omp parallel for schedule(dynamic, 16) num_threads(workers)
    for (long long s = 0; s < count; ++s) {
        try {
            run_one(static_cast<size_t>(s));
        } catch (...) {
            // Exceptions cannot leave the parallel region; keep the first one
            #pragma omp critical(retirecalc_batch_failure)
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            stop = true;
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
#else
    (void)workers;
    for (size_t s = 0; s < iterations && !stop; ++s) {
        run_one(s);
    }
#endif

    if (stop || (options.cancel != nullptr && options.cancel->load())) {
        throw RunCancelledError();
    }

    for (char flag : batch.excluded) {
        batch.excluded_count += flag ? 1 : 0;
    }
    return batch;
}

double raw_success(const Batch& batch) {
    size_t valid = batch.outcomes.size() - batch.excluded_count;
    if (valid == 0) {
        return 0.0;
    }
    size_t successes = 0;
    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (!batch.excluded[s] && batch.outcomes[s].success) {
            ++successes;
        }
    }
    return static_cast<double>(successes) / static_cast<double>(valid);
}

// Raw success probability of a parameter variant on the run's seeds
double success_rate(const SimulationParameters& params, const MortalityTable& table,
                    const SimulationOptions& options, const RunContext& ctx, int workers) {
    const size_t n = params.simulation.iterations;
    RngContext rng(params.simulation.seed);
    ReturnGenerator generator(params.market, params.simulation, rng, n);
    ScenarioRunner runner(params, table, generator, rng, ScenarioConfig());
    return raw_success(run_batch(runner, n, options, ctx, workers));
}

std::vector<BalanceBand> balance_bands(const Batch& batch) {
    size_t years = 0;
    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (!batch.excluded[s]) {
            years = std::max(years, batch.outcomes[s].balance_path.size());
        }
    }

    std::vector<BalanceBand> bands;
    bands.reserve(years);
    std::vector<double> values;
    for (size_t y = 0; y < years; ++y) {
        values.clear();
        for (size_t s = 0; s < batch.outcomes.size(); ++s) {
            const auto& path = batch.outcomes[s].balance_path;
            if (!batch.excluded[s] && y < path.size()) {
                values.push_back(path[y]);
            }
        }
        std::sort(values.begin(), values.end());

        BalanceBand band;
        band.year = static_cast<int>(y);
        band.p10 = calculate_percentile(values, 10.0);
        band.p50 = calculate_percentile(values, 50.0);
        band.p90 = calculate_percentile(values, 90.0);
        band.active_scenarios = values.size();
        bands.push_back(band);
    }
    return bands;
}

// Cumulative depletion rate per year; scenarios depleted earlier stay depleted
std::vector<DangerZone> danger_zones(const Batch& batch, int start_age) {
    size_t years = 0;
    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (!batch.excluded[s]) {
            years = std::max(years, batch.outcomes[s].balance_path.size());
        }
    }

    std::vector<DangerZone> zones;
    for (size_t y = 0; y < years; ++y) {
        size_t reached = 0;
        size_t depleted = 0;
        for (size_t s = 0; s < batch.outcomes.size(); ++s) {
            if (batch.excluded[s]) {
                continue;
            }
            const ScenarioOutcome& outcome = batch.outcomes[s];
            const bool failed_by_now = !outcome.success &&
                                       static_cast<size_t>(outcome.depletion_year) <= y;
            if (failed_by_now) {
                ++reached;
                ++depleted;
            } else if (y < outcome.balance_path.size()) {
                ++reached;
            }
        }
        if (reached == 0) {
            continue;
        }
        double rate = static_cast<double>(depleted) / static_cast<double>(reached);
        if (rate > DANGER_ZONE_THRESHOLD) {
            DangerZone zone;
            zone.year = static_cast<int>(y);
            zone.age = start_age + static_cast<int>(y);
            zone.depletion_rate = rate;
            zones.push_back(zone);
        }
    }
    return zones;
}

void summarize_risk(const Batch& batch, const std::vector<double>& sorted_endings,
                    const SimulationParameters& params, RiskMetrics& risk) {
    risk.cvar_95 = conditional_value_at_risk(sorted_endings, 0.95);
    risk.cvar_99 = conditional_value_at_risk(sorted_endings, 0.99);

    std::vector<double> drawdowns;
    std::vector<double> durations;
    std::vector<double> ulcers;
    size_t failed_long_enough = 0;
    size_t failed_with_early_losses = 0;
    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (batch.excluded[s]) {
            continue;
        }
        const ScenarioOutcome& outcome = batch.outcomes[s];
        DrawdownStatistics dd = drawdown_statistics(outcome.balance_path);
        drawdowns.push_back(dd.max_drawdown);
        durations.push_back(static_cast<double>(dd.max_duration));
        ulcers.push_back(dd.ulcer_index);

        if (!outcome.success && outcome.retired_years >= SEQUENCE_RISK_YEARS) {
            ++failed_long_enough;
            if (outcome.early_losing_years >= 2) {
                ++failed_with_early_losses;
            }
        }
    }
    std::sort(drawdowns.begin(), drawdowns.end());
    std::sort(durations.begin(), durations.end());
    std::sort(ulcers.begin(), ulcers.end());
    risk.median_max_drawdown = calculate_percentile(drawdowns, 50.0);
    risk.median_drawdown_duration = calculate_percentile(durations, 50.0);
    risk.median_ulcer_index = calculate_percentile(ulcers, 50.0);

    risk.sequence_risk_score = failed_long_enough > 0
        ? static_cast<double>(failed_with_early_losses) / static_cast<double>(failed_long_enough)
        : 0.0;
    risk.danger_zones = danger_zones(batch, primary_person(params.household).age);
}

void summarize(const Batch& batch, const SimulationParameters& params, SimulationResult& result) {
    result.total_scenarios = batch.outcomes.size();
    result.excluded_scenarios = batch.excluded_count;

    std::vector<double> endings;
    std::vector<double> depletion_years;
    double ltc_cost_sum = 0.0;
    size_t ltc_count = 0;
    size_t legacy_met = 0;
    endings.reserve(batch.outcomes.size());

    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (batch.excluded[s]) {
            continue;
        }
        const ScenarioOutcome& outcome = batch.outcomes[s];
        endings.push_back(outcome.ending_balance);

        if (outcome.success) {
            ++result.successful_scenarios;
            double goal = params.legacy_goal *
                          std::pow(1.0 + params.market.inflation, outcome.years_simulated);
            if (outcome.ending_balance >= goal) {
                ++legacy_met;
            }
        } else {
            ++result.failed_scenarios;
            depletion_years.push_back(static_cast<double>(outcome.depletion_year));
        }

        result.guardrails.total_cuts += static_cast<size_t>(outcome.guardrail_cuts);
        result.guardrails.total_raises += static_cast<size_t>(outcome.guardrail_raises);
        if (outcome.guardrail_cuts > 0) {
            ++result.guardrails.scenarios_with_cut;
        }
        if (outcome.ltc_occurred) {
            ++ltc_count;
            ltc_cost_sum += outcome.total_ltc_cost;
        }
    }

    const size_t valid = endings.size();
    if (valid == 0) {
        return;
    }
    const double n = static_cast<double>(valid);

    result.success_probability = static_cast<double>(result.successful_scenarios) / n;
    result.adjusted_success_probability = result.success_probability;
    result.legacy_goal_probability = static_cast<double>(legacy_met) / n;
    result.mean_ending_balance = calculate_mean(endings);
    result.mean_years_until_depletion = calculate_mean(depletion_years);

    std::sort(endings.begin(), endings.end());
    result.p10_ending_balance = calculate_percentile(endings, 10.0);
    result.p50_ending_balance = calculate_percentile(endings, 50.0);
    result.p90_ending_balance = calculate_percentile(endings, 90.0);

    result.guardrails.average_adjustments =
        static_cast<double>(result.guardrails.total_cuts + result.guardrails.total_raises) / n;

    if (params.ltc.enabled) {
        result.ltc.computed = true;
        result.ltc.occurrence_probability = static_cast<double>(ltc_count) / n;
        result.ltc.average_cost_when_occurs =
            ltc_count > 0 ? ltc_cost_sum / static_cast<double>(ltc_count) : 0.0;
    }

    result.balance_bands = balance_bands(batch);
    summarize_risk(batch, endings, params, result.risk);
}

// Valid scenario whose ending balance is closest to the median, lowest index on ties
int representative_index(const Batch& batch, double median) {
    int best = -1;
    double best_distance = std::numeric_limits<double>::infinity();
    for (size_t s = 0; s < batch.outcomes.size(); ++s) {
        if (batch.excluded[s]) {
            continue;
        }
        double distance = std::abs(batch.outcomes[s].ending_balance - median);
        if (distance < best_distance) {
            best_distance = distance;
            best = static_cast<int>(s);
        }
    }
    return best;
}

SafeWithdrawalRate search_safe_withdrawal_rate(const SimulationParameters& params,
                                               const MortalityTable& table,
                                               const SimulationOptions& options,
                                               int workers) {
    const RunContext ctx = make_context(params, options, "swr_search");
    SafeWithdrawalRate swr;
    swr.computed = true;

    const double assets = params.assets.total();
    if (assets <= 0.0) {
        swr.low_confidence = true;
        Logger::get_instance().log_swr_search(ctx, swr.rate, swr.iterations, swr.low_confidence);
        return swr;
    }

    // Guaranteed income in today's dollars at the first retired year
    IncomeProjector projector(params);
    const int first_year = projector.retirement_year();
    const double income_today = projector.income(first_year, true, is_couple(params.household)).total() /
                                projector.inflation_index(first_year);
    const double healthcare = params.expenses.annual_healthcare;

    auto rate_for = [&](double spending) {
        return std::max(0.0, spending + healthcare - income_today) / assets;
    };

    SimulationParameters trial = params;
    trial.simulation.iterations = params.simulation.swr_iterations;
    trial.simulation.compute_safe_withdrawal_rate = false;

    const double target = params.simulation.swr_target_success;
    const int budget = std::max(1, params.simulation.swr_max_iterations);

    auto success_at = [&](double spending) {
        trial.expenses.annual_expenses = spending;
        ++swr.iterations;
        double p = success_rate(trial, table, options, ctx, workers);
        std::map<std::string, std::string> fields;
        fields["event"] = "swr_step";
        fields["spending"] = std::to_string(spending);
        fields["success"] = std::to_string(p);
        Logger::get_instance().log_debug(ctx, "Safe withdrawal rate search step", fields);
        return p;
    };

    double lo = 0.0;
    double lo_success = success_at(lo);
    if (lo_success < target) {
        // Even no living expenses misses the target
        swr.rate = 0.0;
        swr.success_at_rate = lo_success;
        swr.low_confidence = true;
        Logger::get_instance().log_swr_search(ctx, swr.rate, swr.iterations, swr.low_confidence);
        return swr;
    }

    // Bracket: double the spending until the target is missed
    double hi = std::max(2.0 * params.expenses.annual_expenses, 0.2 * assets + income_today);
    bool bracketed = false;
    while (swr.iterations < budget) {
        double p = success_at(hi);
        if (p < target) {
            bracketed = true;
            break;
        }
        lo = hi;
        lo_success = p;
        hi *= 2.0;
    }

    bool converged = false;
    if (bracketed) {
        // Rate resolution of five basis points
        const double resolution = 0.0005 * assets;
        while (hi - lo > resolution && swr.iterations < budget) {
            double mid = 0.5 * (lo + hi);
            double p = success_at(mid);
            if (p >= target) {
                lo = mid;
                lo_success = p;
            } else {
                hi = mid;
            }
        }
        converged = hi - lo <= resolution;
    }

    swr.rate = rate_for(lo);
    swr.success_at_rate = lo_success;
    swr.low_confidence = !converged;
    Logger::get_instance().log_swr_search(ctx, swr.rate, swr.iterations, swr.low_confidence);
    return swr;
}

} // anonymous namespace

// ============================================================================
// Tail and path risk
// ============================================================================

double conditional_value_at_risk(std::vector<double> values, double confidence) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const size_t cutoff = static_cast<size_t>(
        std::floor(static_cast<double>(values.size()) * (1.0 - confidence)));
    if (cutoff == 0) {
        return values.front();
    }
    return std::accumulate(values.begin(), values.begin() + cutoff, 0.0) /
           static_cast<double>(cutoff);
}

DrawdownStatistics drawdown_statistics(const std::vector<double>& balances) {
    DrawdownStatistics stats;
    if (balances.empty()) {
        return stats;
    }

    double peak = balances[0];
    double squares = 0.0;
    int duration = 0;
    for (double current : balances) {
        if (current > peak) {
            peak = current;
            stats.max_duration = std::max(stats.max_duration, duration);
            duration = 0;
            continue;
        }
        double drawdown = peak > 0.0 ? std::min(1.0, (peak - current) / peak) : 0.0;
        if (drawdown > 0.0) {
            ++duration;
        } else {
            stats.max_duration = std::max(stats.max_duration, duration);
            duration = 0;
        }
        stats.max_drawdown = std::max(stats.max_drawdown, drawdown);
        squares += drawdown * drawdown;
    }
    stats.max_duration = std::max(stats.max_duration, duration);

    stats.max_drawdown *= 100.0;
    stats.ulcer_index = std::sqrt(squares / static_cast<double>(balances.size())) * 100.0;
    return stats;
}

// ============================================================================
// Control variates
// ============================================================================

ControlVariateEstimate control_variate_estimate(const std::vector<double>& y,
                                                const std::vector<double>& x,
                                                double expected_x) {
    ControlVariateEstimate result;
    result.estimate = calculate_mean(y);
    if (y.size() < 2 || y.size() != x.size()) {
        return result;
    }

    const double mean_y = result.estimate;
    const double mean_x = calculate_mean(x);
    double cov = 0.0;
    double var = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mean_x;
        cov += (y[i] - mean_y) * dx;
        var += dx * dx;
    }
    if (var <= 0.0) {
        return result;
    }

    result.beta = cov / var;
    result.estimate = std::min(1.0, std::max(0.0, mean_y - result.beta * (mean_x - expected_x)));
    result.applied = true;
    return result;
}

// ============================================================================
// Simulation entry points
// ============================================================================

SimulationResult run_simulation(const SimulationParameters& params,
                                const SimulationOptions& options) {
    auto start_time = std::chrono::high_resolution_clock::now();

    const RunContext ctx = make_context(params, options, "main");
    validate_logged(params, ctx);

    const MortalityTable& table = options.mortality != nullptr ? *options.mortality
                                                               : MortalityTable::ssa_2021();
    const int workers = resolve_workers(options.worker_threads);
    const size_t n = params.simulation.iterations;
    Logger& logger = Logger::get_instance();
    logger.log_run_start(ctx, n, workers);

    SimulationResult result;
    try {
        RngContext rng(params.simulation.seed);
        ReturnGenerator generator(params.market, params.simulation, rng, n);
        ScenarioConfig config;
        config.record_balance_path = true;
        ScenarioRunner runner(params, table, generator, rng, config);

        Batch batch = run_batch(runner, n, options, ctx, workers);
        summarize(batch, params, result);

        // ====================================================================
        // Control variates
        // ====================================================================

        const VarianceReduction& vr = params.simulation.variance_reduction;
        if (vr.control_variates && params.simulation.regime.enabled) {
            logger.log_warning(ctx, "Control variates skipped: regime switching makes the "
                                    "analytical control mean inexact");
        } else if (vr.control_variates && vr.control_years > 0) {
            std::vector<double> y;
            std::vector<double> x;
            y.reserve(n);
            x.reserve(n);
            for (size_t s = 0; s < n; ++s) {
                if (batch.excluded[s]) {
                    continue;
                }
                y.push_back(batch.outcomes[s].success ? 1.0 : 0.0);
                x.push_back(batch.outcomes[s].control_statistic);
            }
            ControlVariateEstimate cv = control_variate_estimate(y, x,
                                                                 runner.expected_control_statistic());
            if (cv.applied) {
                result.adjusted_success_probability = cv.estimate;
                result.control_variate_applied = true;
                result.control_beta = cv.beta;
            }
        }

        // ====================================================================
        // Representative scenario
        // ====================================================================

        if (options.include_representative) {
            int index = representative_index(batch, result.p50_ending_balance);
            if (index >= 0) {
                ScenarioConfig detailed;
                detailed.detailed_cashflows = true;
                ScenarioRunner replay(params, table, generator, rng, detailed);
                result.representative_scenario = index;
                result.representative_cashflows = replay.run(static_cast<size_t>(index)).cashflows;
            }
        }

        // ====================================================================
        // LTC counterfactual on identical seeds
        // ====================================================================

        if (params.ltc.enabled && options.ltc_counterfactual) {
            SimulationParameters without = params;
            without.ltc.enabled = false;
            const RunContext cf_ctx = make_context(params, options, "ltc_counterfactual");
            result.ltc.counterfactual_run = true;
            result.ltc.success_without_ltc = success_rate(without, table, options, cf_ctx, workers);
            result.ltc.success_delta = result.success_probability - result.ltc.success_without_ltc;
        }

        if (params.simulation.compute_safe_withdrawal_rate) {
            result.safe_withdrawal = search_safe_withdrawal_rate(params, table, options, workers);
        }
    } catch (const std::bad_alloc&) {
        logger.log_error(ctx, "Out of memory during simulation run");
        throw InfrastructureError("out of memory");
    } catch (const std::system_error& e) {
        logger.log_error(ctx, e.what());
        throw InfrastructureError(e.what());
    } catch (const RunCancelledError& e) {
        logger.log_warning(ctx, e.what());
        throw;
    }

    if (result.excluded_scenarios == result.total_scenarios && result.total_scenarios > 0) {
        logger.log_warning(ctx, "Every scenario was excluded for numeric instability");
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    std::map<std::string, std::string> summary;
    summary["success_probability"] = std::to_string(result.success_probability);
    summary["adjusted_success_probability"] = std::to_string(result.adjusted_success_probability);
    summary["successful"] = std::to_string(result.successful_scenarios);
    summary["failed"] = std::to_string(result.failed_scenarios);
    summary["excluded"] = std::to_string(result.excluded_scenarios);
    summary["execution_time_ms"] = std::to_string(result.execution_time_ms);
    logger.log_run_complete(ctx, summary);

    return result;
}

SafeWithdrawalRate find_safe_withdrawal_rate(const SimulationParameters& params,
                                             const SimulationOptions& options) {
    validate_logged(params, make_context(params, options, "swr_search"));
    const MortalityTable& table = options.mortality != nullptr ? *options.mortality
                                                               : MortalityTable::ssa_2021();
    try {
        return search_safe_withdrawal_rate(params, table, options,
                                           resolve_workers(options.worker_threads));
    } catch (const std::bad_alloc&) {
        throw InfrastructureError("out of memory");
    } catch (const std::system_error& e) {
        throw InfrastructureError(e.what());
    }
}

} // namespace retirecalc
