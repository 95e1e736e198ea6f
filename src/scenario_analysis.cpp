#include "scenario_analysis.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace plancalc {

namespace {

// Plan and tax context with one parameter replaced
struct Variant {
    PremiumPlan plan;
    TaxContext tax_context;
};

int to_period(double value) {
    if (!std::isfinite(value) || value != std::floor(value) ||
        value < 1.0 || value > static_cast<double>(std::numeric_limits<int>::max() / 12)) {
        throw InvalidInput("Period sensitivity values must be whole years >= 1");
    }
    return static_cast<int>(value);
}

Variant make_variant(const PremiumPlan& plan, const TaxContext& tax_context,
                     SensitivityParameter parameter, double value) {
    double premium = plan.monthly_premium();
    double growth = plan.annual_growth_rate();
    int period = plan.period_years();
    double income = tax_context.taxable_income;

    switch (parameter) {
        case SensitivityParameter::MonthlyPremium: premium = value; break;
        case SensitivityParameter::AnnualGrowthRate: growth = value; break;
        case SensitivityParameter::PeriodYears: period = to_period(value); break;
        case SensitivityParameter::TaxableIncome: income = value; break;
    }

    return Variant{
        PremiumPlan(premium, growth, period, plan.setup_fee_rate(),
                    plan.balance_fee_rate(), plan.withdrawal_fee_rate()),
        TaxContext(income, tax_context.brackets, tax_context.resident_tax_rate)
    };
}

} // anonymous namespace

// ============================================================================
// Income scenarios
// ============================================================================

std::vector<IncomeScenarioResult> analyze_income_scenarios(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    const std::vector<IncomeScenario>& scenarios,
    const EvaluationOptions& options)
{
    std::vector<IncomeScenario> all;
    all.reserve(scenarios.size() + 1);
    all.push_back(IncomeScenario{"base", tax_context.taxable_income});
    all.insert(all.end(), scenarios.begin(), scenarios.end());

    std::vector<IncomeScenarioResult> results;
    results.reserve(all.size());
    for (const IncomeScenario& scenario : all) {
        TaxContext context(scenario.taxable_income, tax_context.brackets, tax_context.resident_tax_rate);

        IncomeScenarioResult row;
        row.name = scenario.name;
        row.taxable_income = scenario.taxable_income;
        row.marginal_rate = tax_engine.marginal_rate(scenario.taxable_income);
        row.result = evaluate(plan, tax_engine, context, descriptor, options);
        results.push_back(std::move(row));
    }
    return results;
}

// ============================================================================
// Sensitivity
// ============================================================================

std::string parameter_to_string(SensitivityParameter parameter) {
    switch (parameter) {
        case SensitivityParameter::MonthlyPremium: return "monthly_premium";
        case SensitivityParameter::AnnualGrowthRate: return "growth_rate";
        case SensitivityParameter::PeriodYears: return "period";
        case SensitivityParameter::TaxableIncome: return "taxable_income";
    }
    return "unknown";
}

SensitivityParameter parameter_from_string(const std::string& name) {
    if (name == "monthly_premium" || name == "premium") return SensitivityParameter::MonthlyPremium;
    if (name == "growth_rate" || name == "annual_growth_rate") return SensitivityParameter::AnnualGrowthRate;
    if (name == "period" || name == "period_years") return SensitivityParameter::PeriodYears;
    if (name == "taxable_income" || name == "income") return SensitivityParameter::TaxableIncome;
    throw InvalidInput("Unknown sensitivity parameter: " + name);
}

std::vector<SensitivityPoint> analyze_sensitivity(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    const StrategyDescriptor& descriptor,
    SensitivityParameter parameter,
    const std::vector<double>& values,
    const EvaluationOptions& options)
{
    const TaxEngine tax_engine(tax_context);

    std::vector<SensitivityPoint> points;
    points.reserve(values.size());
    for (double value : values) {
        Variant variant = make_variant(plan, tax_context, parameter, value);
        StrategyResult result = evaluate(variant.plan, tax_engine, variant.tax_context, descriptor, options);

        SensitivityPoint point;
        point.value = value;
        point.net_benefit = result.net_benefit;
        int years = result.breakdown.months_in_plan / 12;
        point.annual_net_benefit = years > 0 ? result.net_benefit / years : 0.0;
        point.return_on_contributions = result.breakdown.return_on_contributions;
        point.total_tax_savings = result.breakdown.total_tax_savings;
        point.irr = result.breakdown.irr;
        points.push_back(point);
    }
    return points;
}

std::vector<BestStrategyPoint> analyze_best_strategy_sensitivity(
    const PremiumPlan& plan,
    const TaxContext& tax_context,
    SensitivityParameter parameter,
    const std::vector<double>& values,
    const ComparisonConfig& config,
    const std::optional<StrategyRanges>& ranges)
{
    std::vector<BestStrategyPoint> points;
    points.reserve(values.size());
    for (double value : values) {
        Variant variant = make_variant(plan, tax_context, parameter, value);
        StrategyRanges point_ranges = ranges ? *ranges : StrategyRanges::defaults(variant.plan.period_years());

        ComparisonConfig point_config = config;
        point_config.run_id = config.run_id + ":" + parameter_to_string(parameter) + "=" + std::to_string(value);
        ComparisonResult comparison = run_comparison(variant.plan, variant.tax_context, point_ranges, point_config);

        BestStrategyPoint point;
        point.value = value;
        point.best_net_benefit = 0.0;
        point.strategies_evaluated = comparison.strategies_evaluated;
        if (!comparison.table.empty()) {
            const StrategyResult& best = comparison.table.best().result;
            point.best_label = best.label;
            point.best_net_benefit = best.net_benefit;
        }
        points.push_back(point);
    }
    return points;
}

// ============================================================================
// Tax reform
// ============================================================================

TaxReformImpact analyze_tax_reform_impact(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    int reform_year,
    double new_deduction_limit,
    int years_after)
{
    if (reform_year < 1 || reform_year > plan.period_years()) {
        throw InvalidInput("reform_year must be in [1, " + std::to_string(plan.period_years()) + "]");
    }
    if (!std::isfinite(new_deduction_limit) || new_deduction_limit < 0.0) {
        throw InvalidInput("new_deduction_limit must be non-negative");
    }
    if (years_after < 1) {
        throw InvalidInput("years_after must be at least 1");
    }

    const double income = tax_context.taxable_income;

    TaxReformImpact impact;
    impact.reform_year = reform_year;
    impact.old_deduction = tax_engine.deduction(plan.annual_premium());
    impact.new_deduction = std::min(plan.annual_premium(), new_deduction_limit);
    impact.old_annual_savings = tax_engine.tax_savings(impact.old_deduction, income).total;
    impact.new_annual_savings = tax_engine.tax_savings(impact.new_deduction, income).total;
    impact.annual_savings_change = impact.new_annual_savings - impact.old_annual_savings;

    EvaluationOptions options;
    options.compute_irr = false;

    if (reform_year > 1) {
        impact.before_reform = evaluate(plan, tax_engine, tax_context, FullWithdrawal{reform_year - 1}, options);
    }

    const int old_years = reform_year - 1;
    const int last_year = std::min(plan.period_years(), reform_year + years_after - 1);
    for (int year = reform_year; year <= last_year; ++year) {
        StrategyResult surrender = evaluate(plan, tax_engine, tax_context, FullWithdrawal{year}, options);

        TaxReformYear row;
        row.withdrawal_year = year;
        row.old_rule_years = old_years;
        row.new_rule_years = year - old_years;
        row.old_rule_savings = impact.old_annual_savings * old_years;
        row.new_rule_savings = impact.new_annual_savings * row.new_rule_years;
        row.total_savings = row.old_rule_savings + row.new_rule_savings;
        row.surrender_value = surrender.breakdown.terminal_value;
        row.premiums_paid = surrender.breakdown.total_contributions;
        row.net_benefit = row.surrender_value + row.total_savings - row.premiums_paid;
        row.savings_lost = -impact.annual_savings_change * row.new_rule_years;
        impact.after_reform.push_back(row);
    }

    return impact;
}

} // namespace plancalc
