#ifndef RETIRECALC_WITHDRAWAL_HPP
#define RETIRECALC_WITHDRAWAL_HPP

#include "params.hpp"
#include "return_generator.hpp"
#include <string>

namespace retirecalc {

enum class GuardrailState : uint8_t {
    Normal = 0,
    CapitalPreservation = 1,
    Prosperity = 2
};

enum class GuardrailAdjustment : uint8_t {
    None = 0,
    Cut = 1,
    Raise = 2
};

std::string guardrail_state_to_string(GuardrailState state);

// Guyton-Klinger guardrails over the discretionary multiplier.
// The first evaluation with a funded portfolio fixes the initial rate;
// later years compare the current withdrawal rate against it.
class GuardrailController {
public:
    explicit GuardrailController(const GuardrailPolicy& policy);

    GuardrailAdjustment evaluate(double planned_withdrawal, double portfolio);

    GuardrailState state() const { return state_; }
    double multiplier() const { return multiplier_; }
    double initial_rate() const { return initial_rate_; }
    bool initialized() const { return initialized_; }

private:
    GuardrailPolicy policy_;
    GuardrailState state_;
    double multiplier_;
    double initial_rate_;
    bool initialized_;
};

// Amounts taken from each bucket in one year
struct WithdrawalPlan {
    double cash;
    double taxable;
    double tax_deferred;
    double tax_free;
    double rmd;                     // Portion of tax_deferred forced by the RMD
    double realized_gains;
    double basis_used;

    WithdrawalPlan();

    double total() const { return cash + taxable + tax_deferred + tax_free; }
};

// RMD first from tax-deferred, then cash -> taxable -> tax-deferred -> tax-free
WithdrawalPlan plan_withdrawal(const AssetBuckets& buckets, double gross, double rmd);

void apply_withdrawal(AssetBuckets& buckets, const WithdrawalPlan& plan);

// Invested buckets earn the weighted portfolio return, cash earns the cash return
void apply_growth(AssetBuckets& buckets, const ReturnDraw& draw, const AssetVector& weights);

// Surplus cash lands in the taxable bucket at full basis
void reinvest(AssetBuckets& buckets, double amount);

} // namespace retirecalc

#endif // RETIRECALC_WITHDRAWAL_HPP
