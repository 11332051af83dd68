#ifndef RETIRECALC_SIMULATION_HPP
#define RETIRECALC_SIMULATION_HPP

#include "mortality.hpp"
#include "params.hpp"
#include "scenario.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace retirecalc {

struct SimulationOptions {
    int worker_threads;                 // 0 = hardware concurrency
    const std::atomic<bool>* cancel;    // Checked before each scenario; nullptr = never
    const MortalityTable* mortality;    // nullptr = built-in SSA 2021 table
    bool include_representative;        // Replay the median scenario with full cash flows
    bool ltc_counterfactual;            // Re-run without LTC to measure its impact
    std::string run_label;              // Run id in log events, derived from the seed if empty

    SimulationOptions();
};

// Percentiles of end-of-year balance across scenarios still running that year
struct BalanceBand {
    int year;
    double p10;
    double p50;
    double p90;
    size_t active_scenarios;

    BalanceBand();
};

struct GuardrailStatistics {
    double average_adjustments;         // Cuts + raises per valid scenario
    size_t total_cuts;
    size_t total_raises;
    size_t scenarios_with_cut;

    GuardrailStatistics();
};

struct LtcImpact {
    bool computed;                      // False when LTC is disabled
    double occurrence_probability;      // Scenarios with any LTC cost
    double average_cost_when_occurs;    // Gross nominal cost over the scenario
    bool counterfactual_run;
    double success_without_ltc;
    double success_delta;               // With LTC minus without

    LtcImpact();
};

struct SafeWithdrawalRate {
    bool computed;
    double rate;                        // First-year portfolio withdrawal / assets
    double success_at_rate;
    bool low_confidence;                // Search did not converge or bracket the target
    int iterations;

    SafeWithdrawalRate();
};

// Year whose cumulative depletion rate exceeds DANGER_ZONE_THRESHOLD
struct DangerZone {
    int year;
    int age;                            // Primary's age that year
    double depletion_rate;              // Depleted by year end / scenarios that reached the year

    DangerZone();
};

constexpr double DANGER_ZONE_THRESHOLD = 0.2;

struct DrawdownStatistics {
    double max_drawdown;                // Percent of the running peak, capped at 100
    int max_duration;                   // Longest run of years below the peak
    double ulcer_index;                 // RMS drawdown in percent

    DrawdownStatistics();
};

struct RiskMetrics {
    double cvar_95;                     // Mean of the worst 5% of ending balances
    double cvar_99;
    double median_max_drawdown;         // Median across scenarios of DrawdownStatistics
    double median_drawdown_duration;
    double median_ulcer_index;
    // Share of failed scenarios with at least two losing years among the
    // first SEQUENCE_RISK_YEARS retired years; 0 when none qualifies
    double sequence_risk_score;
    std::vector<DangerZone> danger_zones;

    RiskMetrics();
};

struct SimulationResult {
    // Successful / valid scenarios. Monotone in assets on common seeds.
    double success_probability;
    // Control-variate estimate of the same probability; equals
    // success_probability when control variates were not applied
    double adjusted_success_probability;
    bool control_variate_applied;
    double control_beta;

    double p10_ending_balance;
    double p50_ending_balance;
    double p90_ending_balance;
    double mean_ending_balance;
    double mean_years_until_depletion;  // Among failed scenarios

    size_t successful_scenarios;
    size_t failed_scenarios;
    size_t excluded_scenarios;          // Dropped for numeric instability
    size_t total_scenarios;

    int representative_scenario;        // -1 when not replayed
    std::vector<YearlyCashFlow> representative_cashflows;
    std::vector<BalanceBand> balance_bands;

    RiskMetrics risk;
    GuardrailStatistics guardrails;
    LtcImpact ltc;
    SafeWithdrawalRate safe_withdrawal;
    double legacy_goal_probability;

    double execution_time_ms;

    SimulationResult();
};

struct ControlVariateEstimate {
    double estimate;
    double beta;
    bool applied;

    ControlVariateEstimate();
};

// Adjusts mean(y) by beta * (mean(x) - expected_x), beta = Cov(y, x) / Var(x).
// Not applied when x has no variance; the estimate is clamped to [0, 1].
ControlVariateEstimate control_variate_estimate(const std::vector<double>& y,
                                                const std::vector<double>& x,
                                                double expected_x);

// Mean of the lowest floor(n * (1 - confidence)) values, or the minimum
// when that count is zero. Returns 0 for an empty input.
double conditional_value_at_risk(std::vector<double> values, double confidence);

// Peak-to-trough statistics of one balance path
DrawdownStatistics drawdown_statistics(const std::vector<double>& balances);

// Validates params, runs every scenario and aggregates in scenario order.
// Throws InvalidParameterError, RunCancelledError or InfrastructureError.
SimulationResult run_simulation(const SimulationParameters& params,
                                const SimulationOptions& options = SimulationOptions());

// Bisection on the spending level whose success probability meets
// simulation.swr_target_success, using swr_iterations scenarios per step
SafeWithdrawalRate find_safe_withdrawal_rate(const SimulationParameters& params,
                                             const SimulationOptions& options = SimulationOptions());

} // namespace retirecalc

#endif // RETIRECALC_SIMULATION_HPP
