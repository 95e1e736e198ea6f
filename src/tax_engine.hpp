#ifndef PLANCALC_TAX_ENGINE_HPP
#define PLANCALC_TAX_ENGINE_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace plancalc {

// One row of a progressive income-tax table
// tax(income) = income × marginal_rate - cumulative_deduction
// for the first bracket with income <= threshold
struct TaxBracket {
    double threshold;               // Upper bound of the bracket (inclusive)
    double cumulative_deduction;    // Quick-calculation deduction
    double marginal_rate;           // Marginal rate (0.0-1.0)

    bool operator==(const TaxBracket& other) const;
};

// Ordered bracket table; the last bracket is always unbounded
class TaxBracketTable {
public:
    // Validates ordering and rates, forces the last threshold to +infinity
    explicit TaxBracketTable(std::vector<TaxBracket> brackets);

    // Build from (threshold, marginal_rate) pairs, deriving the cumulative
    // deductions so the tax curve is continuous at every threshold
    static TaxBracketTable from_marginal_rates(
        const std::vector<std::pair<double, double>>& thresholds_and_rates);

    // Income tax table including the 2.1% reconstruction surtax
    static TaxBracketTable japan_default();

    // CSV columns: threshold,rate[,deduction]
    // An empty threshold or "inf" marks the unbounded top bracket.
    // When every row carries a deduction the rows are used as given,
    // otherwise deductions are derived as in from_marginal_rates().
    static TaxBracketTable load_from_csv(const std::string& filepath);
    static TaxBracketTable load_from_csv(std::istream& is);

    const TaxBracket& bracket_for(double taxable_income) const;
    size_t bracket_index(double taxable_income) const;

    const std::vector<TaxBracket>& brackets() const { return brackets_; }
    size_t size() const { return brackets_.size(); }

private:
    std::vector<TaxBracket> brackets_;
};

// Taxpayer-side inputs shared read-only by every evaluation in a run
struct TaxContext {
    static constexpr double DEFAULT_RESIDENT_TAX_RATE = 0.10;

    double taxable_income;
    TaxBracketTable brackets;
    double resident_tax_rate;

    // Throws InvalidInput when taxable_income < 0 or the resident rate
    // is outside [0, 1]
    explicit TaxContext(double income,
                        TaxBracketTable table = TaxBracketTable::japan_default(),
                        double resident_rate = DEFAULT_RESIDENT_TAX_RATE);
};

struct TaxSavings {
    double income_tax_savings;
    double resident_tax_savings;
    double total;

    TaxSavings();
};

struct DeductionBreakdown {
    double annual_premium;
    double deduction;
    size_t bracket;                 // 0-3, index into the deduction schedule
    double effective_rate;          // deduction / premium (0 when premium is 0)
    bool cap_reached;
};

struct CombinedDeduction {
    size_t contract_count;
    double total_premium;
    double sum_of_individual;       // Σ deduction(premium_i)
    double combined;                // deduction(Σ premium_i)
    double best;
    bool individual_is_better;
};

// Tax savings of one deduction at a shifted income
struct IncomeChangeRow {
    double income_change;
    double taxable_income;          // base + change
    double marginal_rate;
    double deduction;
    TaxSavings savings;
    double effective_rate;          // savings.total / deduction (0 when deduction is 0)
};

// Split of one premium budget across contracts
struct PremiumDistribution {
    std::vector<double> allocations;    // Annual premium per contract, summing to the budget
    double total_deduction;             // Σ deduction(allocation)
    double total_budget;
    double average_rate;                // total_deduction / total_budget (0 for an empty budget)

    PremiumDistribution();
};

// Premium deduction and income-tax arithmetic
//
// One instance is built per comparison run and passed by const reference to
// the simulator and evaluator. All methods are const and thread-safe.
class TaxEngine {
public:
    static constexpr double DEDUCTION_CAP = 50000.0;
    static constexpr double ONE_TIME_ALLOWANCE = 500000.0;
    static constexpr double ONE_TIME_INCLUSION = 0.5;
    static constexpr size_t NUM_DEDUCTION_BRACKETS = 4;

    TaxEngine();
    TaxEngine(TaxBracketTable brackets, double resident_tax_rate);
    explicit TaxEngine(const TaxContext& context);

    // Piecewise premium deduction:
    //   <= 25,000   premium × 1/2
    //   <= 50,000   premium × 1/4 + 12,500
    //   <= 100,000  premium × 1/5 + 15,000
    //   above       50,000
    // Throws InvalidInput when annual_premium < 0
    double deduction(double annual_premium) const;
    DeductionBreakdown deduction_breakdown(double annual_premium) const;
    CombinedDeduction combined_deduction(const std::vector<double>& contract_premiums) const;

    double progressive_income_tax(double taxable_income) const;
    double marginal_rate(double taxable_income) const;

    TaxSavings tax_savings(double deduction_amount, double taxable_income) const;
    TaxSavings annual_tax_savings(double annual_premium, double taxable_income) const;

    // Marginal income tax on a lump-sum profit taxed as one-time income:
    // half of the profit above the 500,000 allowance is added to income
    double one_time_withdrawal_tax(double profit, double taxable_income) const;

    // Savings of `deduction_amount` at base_income + change for each change;
    // changes that take income below zero are skipped
    std::vector<IncomeChangeRow> simulate_income_changes(
        double base_income,
        const std::vector<double>& income_changes,
        double deduction_amount) const;

    // Split `total_budget` across `num_contracts` to maximize the summed
    // deduction. Every contract but the last takes a multiple of `step` up to
    // the first one above MAX_CONTRACT_PREMIUM; the last takes the remainder.
    // Among equal totals the stepped contracts take the smallest combined amount.
    // Throws InvalidInput for a negative budget, num_contracts outside
    // [1, MAX_CONTRACTS], step <= 0, more than MAX_DISTRIBUTION_STEPS steps
    // or a search larger than MAX_DISTRIBUTION_WORK evaluations.
    PremiumDistribution optimize_premium_distribution(
        double total_budget,
        int num_contracts = 2,
        double step = 1000.0) const;

    static constexpr double MAX_CONTRACT_PREMIUM = 100000.0;
    static constexpr int MAX_CONTRACTS = 10;
    static constexpr size_t MAX_DISTRIBUTION_STEPS = 100000;
    static constexpr double MAX_DISTRIBUTION_WORK = 5.0e7;

    const TaxBracketTable& brackets() const { return brackets_; }
    double resident_tax_rate() const { return resident_tax_rate_; }

private:
    TaxBracketTable brackets_;
    double resident_tax_rate_;
};

} // namespace plancalc

#endif // PLANCALC_TAX_ENGINE_HPP
