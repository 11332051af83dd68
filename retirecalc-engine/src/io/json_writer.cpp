#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace retirecalc {
namespace io {

namespace {

// Streams "key": value pairs with indentation and separators
class Fields {
public:
    Fields(std::ostream& os, bool pretty, int depth)
        : os_(os), pretty_(pretty), depth_(depth), first_(true) {}

    Fields& number(const std::string& key, double value) {
        start(key);
        os_ << value;
        return *this;
    }

    Fields& integer(const std::string& key, long long value) {
        start(key);
        os_ << value;
        return *this;
    }

    Fields& boolean(const std::string& key, bool value) {
        start(key);
        os_ << (value ? "true" : "false");
        return *this;
    }

    Fields& text(const std::string& key, const std::string& value) {
        start(key);
        os_ << "\"" << value << "\"";
        return *this;
    }

    // Emits the key and leaves the caller to stream the value
    std::ostream& raw(const std::string& key) {
        start(key);
        return os_;
    }

    void finish() {
        if (pretty_ && !first_) {
            os_ << "\n";
            indent(depth_ - 1);
        }
    }

private:
    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_;

    void indent(int depth) {
        for (int i = 0; i < depth; ++i) {
            os_ << "  ";
        }
    }

    void start(const std::string& key) {
        if (!first_) {
            os_ << ",";
        }
        first_ = false;
        if (pretty_) {
            os_ << "\n";
            indent(depth_);
        }
        os_ << "\"" << key << "\":" << (pretty_ ? " " : "");
    }
};

void write_cashflow(std::ostream& os, const YearlyCashFlow& cf, bool pretty, int depth) {
    os << "{";
    Fields f(os, pretty, depth);
    f.integer("year", cf.year)
     .integer("age", cf.age)
     .integer("spouse_age", cf.spouse_age)
     .boolean("primary_alive", cf.primary_alive)
     .boolean("spouse_alive", cf.spouse_alive)
     .boolean("retired", cf.retired)
     .number("end_balance", cf.end_balance)
     .number("tax_deferred_balance", cf.tax_deferred_balance)
     .number("tax_free_balance", cf.tax_free_balance)
     .number("taxable_balance", cf.taxable_balance)
     .number("cash_balance", cf.cash_balance)
     .number("social_security", cf.social_security)
     .number("pension", cf.pension)
     .number("part_time", cf.part_time)
     .number("contributions", cf.contributions)
     .number("withdrawal_cash", cf.withdrawal_cash)
     .number("withdrawal_taxable", cf.withdrawal_taxable)
     .number("withdrawal_tax_deferred", cf.withdrawal_tax_deferred)
     .number("withdrawal_tax_free", cf.withdrawal_tax_free)
     .number("rmd", cf.rmd)
     .number("federal_tax", cf.federal_tax)
     .number("capital_gains_tax", cf.capital_gains_tax)
     .number("state_tax", cf.state_tax)
     .number("irmaa", cf.irmaa)
     .number("total_tax", cf.total_tax)
     .number("essential_expenses", cf.essential_expenses)
     .number("discretionary_expenses", cf.discretionary_expenses)
     .number("healthcare_expenses", cf.healthcare_expenses)
     .number("ltc_expenses", cf.ltc_expenses)
     .number("net_cash_flow", cf.net_cash_flow)
     .text("guardrail_state", guardrail_state_to_string(cf.guardrail_state))
     .number("discretionary_multiplier", cf.discretionary_multiplier)
     .text("regime", regime_to_string(cf.regime));
    f.finish();
    os << "}";
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print) {
    const std::string newline = pretty_print ? "\n" : "";
    const std::string indent = pretty_print ? "  " : "";

    os << std::fixed << std::setprecision(6);
    os << "{";

    Fields top(os, pretty_print, 1);

    // Statistics section
    {
        std::ostream& s = top.raw("statistics");
        s << "{";
        Fields f(s, pretty_print, 2);
        f.number("success_probability", result.success_probability)
         .number("adjusted_success_probability", result.adjusted_success_probability)
         .boolean("control_variate_applied", result.control_variate_applied)
         .number("control_beta", result.control_beta)
         .number("p10_ending_balance", result.p10_ending_balance)
         .number("p50_ending_balance", result.p50_ending_balance)
         .number("p90_ending_balance", result.p90_ending_balance)
         .number("mean_ending_balance", result.mean_ending_balance)
         .number("mean_years_until_depletion", result.mean_years_until_depletion)
         .number("legacy_goal_probability", result.legacy_goal_probability);
        f.finish();
        s << "}";
    }

    {
        std::ostream& s = top.raw("scenarios");
        s << "{";
        Fields f(s, pretty_print, 2);
        f.integer("successful", static_cast<long long>(result.successful_scenarios))
         .integer("failed", static_cast<long long>(result.failed_scenarios))
         .integer("excluded", static_cast<long long>(result.excluded_scenarios))
         .integer("total", static_cast<long long>(result.total_scenarios));
        f.finish();
        s << "}";
    }

    {
        std::ostream& s = top.raw("safe_withdrawal_rate");
        if (!result.safe_withdrawal.computed) {
            s << "null";
        } else {
            s << "{";
            Fields f(s, pretty_print, 2);
            f.number("rate", result.safe_withdrawal.rate)
             .number("success_at_rate", result.safe_withdrawal.success_at_rate)
             .boolean("low_confidence", result.safe_withdrawal.low_confidence)
             .integer("iterations", result.safe_withdrawal.iterations);
            f.finish();
            s << "}";
        }
    }

    {
        const RiskMetrics& risk = result.risk;
        std::ostream& s = top.raw("risk");
        s << "{";
        Fields f(s, pretty_print, 2);
        f.number("cvar_95", risk.cvar_95)
         .number("cvar_99", risk.cvar_99)
         .number("median_max_drawdown", risk.median_max_drawdown)
         .number("median_drawdown_duration", risk.median_drawdown_duration)
         .number("median_ulcer_index", risk.median_ulcer_index)
         .number("sequence_risk_score", risk.sequence_risk_score);
        std::ostream& zones = f.raw("danger_zones");
        zones << "[";
        for (size_t i = 0; i < risk.danger_zones.size(); ++i) {
            const DangerZone& zone = risk.danger_zones[i];
            if (i > 0) {
                zones << ",";
            }
            zones << newline << indent << indent << indent;
            zones << "{\"year\":" << zone.year
                  << ",\"age\":" << zone.age
                  << ",\"depletion_rate\":" << zone.depletion_rate << "}";
        }
        if (!risk.danger_zones.empty()) {
            zones << newline << indent << indent;
        }
        zones << "]";
        f.finish();
        s << "}";
    }

    {
        std::ostream& s = top.raw("guardrails");
        s << "{";
        Fields f(s, pretty_print, 2);
        f.number("average_adjustments", result.guardrails.average_adjustments)
         .integer("total_cuts", static_cast<long long>(result.guardrails.total_cuts))
         .integer("total_raises", static_cast<long long>(result.guardrails.total_raises))
         .integer("scenarios_with_cut", static_cast<long long>(result.guardrails.scenarios_with_cut));
        f.finish();
        s << "}";
    }

    {
        std::ostream& s = top.raw("ltc_impact");
        if (!result.ltc.computed) {
            s << "null";
        } else {
            s << "{";
            Fields f(s, pretty_print, 2);
            f.number("occurrence_probability", result.ltc.occurrence_probability)
             .number("average_cost_when_occurs", result.ltc.average_cost_when_occurs);
            if (result.ltc.counterfactual_run) {
                f.number("success_without_ltc", result.ltc.success_without_ltc)
                 .number("success_delta", result.ltc.success_delta);
            }
            f.finish();
            s << "}";
        }
    }

    // Balance bands, one compact object per year
    {
        std::ostream& s = top.raw("balance_bands");
        s << "[";
        for (size_t i = 0; i < result.balance_bands.size(); ++i) {
            const BalanceBand& band = result.balance_bands[i];
            if (i > 0) {
                s << ",";
            }
            s << newline << indent << indent;
            s << "{\"year\":" << band.year
              << ",\"p10\":" << band.p10
              << ",\"p50\":" << band.p50
              << ",\"p90\":" << band.p90
              << ",\"active\":" << band.active_scenarios << "}";
        }
        if (!result.balance_bands.empty()) {
            s << newline << indent;
        }
        s << "]";
    }

    top.integer("representative_scenario", result.representative_scenario);
    {
        std::ostream& s = top.raw("representative_cashflows");
        s << "[";
        for (size_t i = 0; i < result.representative_cashflows.size(); ++i) {
            if (i > 0) {
                s << ",";
            }
            s << newline << indent << indent;
            write_cashflow(s, result.representative_cashflows[i], pretty_print, 3);
        }
        if (!result.representative_cashflows.empty()) {
            s << newline << indent;
        }
        s << "]";
    }

    os << std::setprecision(2);
    top.number("execution_time_ms", result.execution_time_ms);
    os << std::setprecision(6);

    top.finish();
    os << "}" << newline;
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace retirecalc
