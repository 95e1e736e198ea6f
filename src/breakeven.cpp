#include "breakeven.hpp"
#include "cashflow_simulator.hpp"
#include <algorithm>

namespace plancalc {

BreakevenAnalysis analyze_breakeven(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    int max_years)
{
    BreakevenAnalysis analysis;
    int years = std::min(plan.period_years(), max_years);
    if (years <= 0) {
        return analysis;
    }
    analysis.years.reserve(years);

    CashflowSimulator sim(plan, tax_engine, tax_context.taxable_income);

    for (int year = 1; year <= years; ++year) {
        sim.advance_to_month(year * 12);
        const SimulationState& state = sim.state();

        // Hypothetical surrender; the simulator keeps accumulating
        double charge = state.balance * CashflowSimulator::surrender_deduction_rate(year);
        double after_charge = state.balance - charge;
        double tax = tax_engine.one_time_withdrawal_tax(after_charge - state.cost_basis,
                                                        tax_context.taxable_income);

        BreakevenYear row;
        row.year = year;
        row.premiums_paid = state.contributions;
        row.balance = state.balance;
        row.surrender_value = after_charge - tax;
        row.tax_savings = state.tax_savings;
        row.total_value = row.surrender_value + row.tax_savings;
        row.covered = row.total_value >= row.premiums_paid;
        analysis.years.push_back(row);

        if (row.covered && !analysis.breakeven_year) {
            analysis.breakeven_year = year;
        }
    }

    return analysis;
}

} // namespace plancalc
