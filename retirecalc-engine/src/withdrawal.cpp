#include "withdrawal.hpp"
#include <algorithm>

namespace retirecalc {

std::string guardrail_state_to_string(GuardrailState state) {
    switch (state) {
        case GuardrailState::Normal: return "normal";
        case GuardrailState::CapitalPreservation: return "capital_preservation";
        case GuardrailState::Prosperity: return "prosperity";
    }
    return "normal";
}

// ============================================================================
// GuardrailController Implementation
// ============================================================================

GuardrailController::GuardrailController(const GuardrailPolicy& policy)
    : policy_(policy),
      state_(GuardrailState::Normal),
      multiplier_(1.0),
      initial_rate_(0.0),
      initialized_(false) {}

GuardrailAdjustment GuardrailController::evaluate(double planned_withdrawal, double portfolio) {
    if (!policy_.enabled || portfolio <= 0.0) {
        state_ = GuardrailState::Normal;
        return GuardrailAdjustment::None;
    }

    double rate = std::max(planned_withdrawal, 0.0) / portfolio;

    if (!initialized_) {
        initial_rate_ = rate > 0.0 ? rate : policy_.withdrawal_rate;
        initialized_ = true;
        state_ = GuardrailState::Normal;
        return GuardrailAdjustment::None;
    }

    if (rate > initial_rate_ * policy_.upper_threshold) {
        state_ = GuardrailState::CapitalPreservation;
        double next = std::max(policy_.floor, multiplier_ * (1.0 - policy_.cut_percent));
        if (next < multiplier_) {
            multiplier_ = next;
            return GuardrailAdjustment::Cut;
        }
        return GuardrailAdjustment::None;
    }

    if (rate < initial_rate_ * policy_.lower_threshold) {
        state_ = GuardrailState::Prosperity;
        double next = std::min(policy_.ceiling, multiplier_ * (1.0 + policy_.raise_percent));
        if (next > multiplier_) {
            multiplier_ = next;
            return GuardrailAdjustment::Raise;
        }
        return GuardrailAdjustment::None;
    }

    state_ = GuardrailState::Normal;
    return GuardrailAdjustment::None;
}

// ============================================================================
// Withdrawal sequencing
// ============================================================================

WithdrawalPlan::WithdrawalPlan()
    : cash(0.0),
      taxable(0.0),
      tax_deferred(0.0),
      tax_free(0.0),
      rmd(0.0),
      realized_gains(0.0),
      basis_used(0.0) {}

WithdrawalPlan plan_withdrawal(const AssetBuckets& buckets, double gross, double rmd) {
    WithdrawalPlan plan;
    double remaining = std::max(gross, 0.0);

    plan.rmd = std::min(std::min(std::max(rmd, 0.0), buckets.tax_deferred), remaining);
    plan.tax_deferred = plan.rmd;
    remaining -= plan.rmd;

    plan.cash = std::min(remaining, buckets.cash_equivalents);
    remaining -= plan.cash;

    plan.taxable = std::min(remaining, buckets.capital_gains);
    remaining -= plan.taxable;

    double deferred_left = buckets.tax_deferred - plan.tax_deferred;
    double extra_deferred = std::min(remaining, deferred_left);
    plan.tax_deferred += extra_deferred;
    remaining -= extra_deferred;

    plan.tax_free = std::min(remaining, buckets.tax_free);

    if (plan.taxable > 0.0 && buckets.capital_gains > 0.0) {
        // Average-cost basis; a sale below basis realizes no deductible loss
        double basis_fraction = buckets.capital_gains_basis / buckets.capital_gains;
        plan.basis_used = plan.taxable * basis_fraction;
        plan.realized_gains = std::max(0.0, plan.taxable - plan.basis_used);
    }

    return plan;
}

void apply_withdrawal(AssetBuckets& buckets, const WithdrawalPlan& plan) {
    buckets.cash_equivalents = std::max(0.0, buckets.cash_equivalents - plan.cash);
    buckets.capital_gains = std::max(0.0, buckets.capital_gains - plan.taxable);
    buckets.tax_deferred = std::max(0.0, buckets.tax_deferred - plan.tax_deferred);
    buckets.tax_free = std::max(0.0, buckets.tax_free - plan.tax_free);

    buckets.capital_gains_basis = std::max(0.0, buckets.capital_gains_basis - plan.basis_used);
    if (buckets.capital_gains <= 0.0) {
        buckets.capital_gains_basis = 0.0;
    }
}

void apply_growth(AssetBuckets& buckets, const ReturnDraw& draw, const AssetVector& weights) {
    const double growth = 1.0 + draw.portfolio(weights);
    buckets.tax_deferred *= growth;
    buckets.tax_free *= growth;
    buckets.capital_gains *= growth;
    buckets.cash_equivalents *= 1.0 + draw.cash();
}

void reinvest(AssetBuckets& buckets, double amount) {
    if (amount <= 0.0) {
        return;
    }
    buckets.capital_gains += amount;
    buckets.capital_gains_basis += amount;
}

} // namespace retirecalc
