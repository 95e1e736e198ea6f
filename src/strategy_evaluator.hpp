#ifndef PLANCALC_STRATEGY_EVALUATOR_HPP
#define PLANCALC_STRATEGY_EVALUATOR_HPP

#include "cashflow_simulator.hpp"
#include "premium_plan.hpp"
#include "strategy.hpp"
#include "tax_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace plancalc {

// Supporting figures behind a net benefit
struct ResultBreakdown {
    double terminal_value;          // After-tax value held at the end of the strategy
    double total_contributions;     // Premiums paid (plan + alternative vehicle)
    double total_fees;              // Setup + balance fees
    double total_withdrawal_fees;   // Fees on partial withdrawals
    double surrender_charges;       // Surrender deduction on liquidation
    double transfer_fees;           // Switch fee
    double total_tax_savings;       // Premium-deduction tax savings
    double total_one_time_tax;      // One-time income tax on profits
    double capital_gains_tax;       // Tax on reinvestment/alternative gains
    double total_withdrawn;         // Gross amount taken out of the plan
    int withdrawal_events;
    int months_in_plan;             // Months before surrender
    int horizon_months;             // Months until the terminal value is realized
    double return_on_contributions; // net_benefit / total_contributions
    std::optional<double> irr;      // Annualized IRR, nullopt when Newton does not converge

    ResultBreakdown();
};

// Uniform evaluation result for every strategy kind
struct StrategyResult {
    StrategyDescriptor descriptor;
    std::string label;
    double net_benefit;             // terminal_value + tax_savings - contributions
    ResultBreakdown breakdown;
    std::vector<YearlySnapshot> snapshots;  // Only with EvaluationOptions::detailed_snapshots

    StrategyType type() const { return strategy_type(descriptor); }

    StrategyResult();
};

// Configuration options for evaluation
struct EvaluationOptions {
    InvestmentVehicle reinvestment;                 // Receives partial withdrawals
    std::optional<InvestmentVehicle> alternative;   // Switch target; nullopt = fund at the plan's growth rate
    bool detailed_snapshots;                        // If true, populate StrategyResult::snapshots
    bool compute_irr;                               // If true, solve for the IRR

    EvaluationOptions();
};

// Evaluate one strategy from month 0
//
// Pure: identical inputs give bit-identical results. The tax engine must be
// built from the same brackets and resident rate as `tax_context`.
//
//   FullWithdrawal:    accumulate to `year`, surrender
//   PartialWithdrawal: at every `interval` years before maturity withdraw
//                      `ratio` of the balance into the reinvestment vehicle,
//                      surrender at maturity and sell the reinvestment
//   Switch:            accumulate to `year`, surrender, move the proceeds and
//                      the remaining premiums to the alternative vehicle
//
// Throws InvalidInput for years outside [1, period], intervals < 1,
// ratios outside (0, 1] or switch fees outside [0, 1).
StrategyResult evaluate(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const EvaluationOptions& options = EvaluationOptions()
);

// Overload building the TaxEngine from the context
StrategyResult evaluate(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const EvaluationOptions& options = EvaluationOptions()
);

} // namespace plancalc

#endif // PLANCALC_STRATEGY_EVALUATOR_HPP
