#ifndef PLANCALC_SCENARIO_ANALYSIS_HPP
#define PLANCALC_SCENARIO_ANALYSIS_HPP

#include "comparison.hpp"
#include "premium_plan.hpp"
#include "strategy.hpp"
#include "strategy_catalog.hpp"
#include "strategy_evaluator.hpp"
#include "tax_engine.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plancalc {

// ============================================================================
// Income scenarios
// ============================================================================

struct IncomeScenario {
    std::string name;
    double taxable_income;
};

struct IncomeScenarioResult {
    std::string name;
    double taxable_income;
    double marginal_rate;
    StrategyResult result;
};

// Evaluate one strategy under each income. The context's own income comes
// first as "base"; the brackets and resident rate are shared.
// Throws InvalidInput for a negative scenario income.
std::vector<IncomeScenarioResult> analyze_income_scenarios(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const std::vector<IncomeScenario>& scenarios,
    const EvaluationOptions& options = EvaluationOptions()
);

// ============================================================================
// Sensitivity
// ============================================================================

enum class SensitivityParameter : uint8_t {
    MonthlyPremium,
    AnnualGrowthRate,
    PeriodYears,
    TaxableIncome
};

std::string parameter_to_string(SensitivityParameter parameter);
SensitivityParameter parameter_from_string(const std::string& name);

struct SensitivityPoint {
    double value;
    double net_benefit;
    double annual_net_benefit;          // net_benefit / years in the plan
    double return_on_contributions;
    double total_tax_savings;
    std::optional<double> irr;
};

// Re-evaluate one strategy with `parameter` replaced by each value.
// PeriodYears values must be whole numbers; a strategy year beyond a swept
// period throws InvalidInput like any other invalid evaluation.
std::vector<SensitivityPoint> analyze_sensitivity(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    SensitivityParameter parameter,
    const std::vector<double>& values,
    const EvaluationOptions& options = EvaluationOptions()
);

struct BestStrategyPoint {
    double value;
    std::string best_label;             // Empty when nothing was ranked
    double best_net_benefit;
    size_t strategies_evaluated;
};

// Full comparison per value. Without explicit ranges each point uses
// StrategyRanges::defaults for its own period.
std::vector<BestStrategyPoint> analyze_best_strategy_sensitivity(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    SensitivityParameter parameter,
    const std::vector<double>& values,
    const ComparisonConfig& config = ComparisonConfig(),
    const std::optional<StrategyRanges>& ranges = std::nullopt
);

// ============================================================================
// Tax reform
// ============================================================================

// Surrender at `withdrawal_year` when the deduction changes mid-plan
struct TaxReformYear {
    int withdrawal_year;
    int old_rule_years;
    int new_rule_years;
    double old_rule_savings;
    double new_rule_savings;
    double total_savings;
    double surrender_value;             // After surrender deduction and one-time tax
    double premiums_paid;
    double net_benefit;                 // surrender_value + total_savings - premiums_paid
    double savings_lost;                // Versus keeping the current deduction
};

struct TaxReformImpact {
    int reform_year;                    // First plan year under the new rule
    double old_deduction;
    double new_deduction;               // min(annual premium, new limit)
    double old_annual_savings;
    double new_annual_savings;
    double annual_savings_change;       // new - old
    std::optional<StrategyResult> before_reform;  // Surrender in the year before the reform
    std::vector<TaxReformYear> after_reform;
};

// Compare surrendering before a deduction reform with continuing for up to
// `years_after` plan years under it.
// Throws InvalidInput when reform_year is outside [1, period], the new limit
// is negative or years_after < 1.
TaxReformImpact analyze_tax_reform_impact(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    int reform_year,
    double new_deduction_limit,
    int years_after = 5
);

} // namespace plancalc

#endif // PLANCALC_SCENARIO_ANALYSIS_HPP
