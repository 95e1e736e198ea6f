#ifndef PLANCALC_BREAKEVEN_HPP
#define PLANCALC_BREAKEVEN_HPP

#include "premium_plan.hpp"
#include "tax_engine.hpp"
#include <optional>
#include <vector>

namespace plancalc {

// Value of surrendering at the end of one policy year
struct BreakevenYear {
    int year;                       // Policy year (1-based)
    double premiums_paid;
    double balance;                 // Plan balance before surrender
    double surrender_value;         // After surrender deduction and one-time tax
    double tax_savings;             // Accrued premium-deduction tax savings
    double total_value;             // surrender_value + tax_savings
    bool covered;                   // total_value >= premiums_paid
};

struct BreakevenAnalysis {
    std::vector<BreakevenYear> years;
    std::optional<int> breakeven_year;  // First covered year, nullopt if never
};

// Year-by-year surrender value of the plan up to min(period, max_years)
BreakevenAnalysis analyze_breakeven(
    const PremiumPlan& plan,
    const TaxEngine& tax_engine,
    const TaxContext& tax_context,
    int max_years = 30
);

} // namespace plancalc

#endif // PLANCALC_BREAKEVEN_HPP
