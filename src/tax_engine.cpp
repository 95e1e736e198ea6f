#include "tax_engine.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>

namespace plancalc {

namespace {

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

// Premium deduction schedule: (upper bound, rate, base amount)
struct DeductionStep {
    double upper;
    double rate;
    double base;
};

constexpr std::array<DeductionStep, TaxEngine::NUM_DEDUCTION_BRACKETS> kDeductionSchedule = {{
    {25000.0, 0.5, 0.0},
    {50000.0, 0.25, 12500.0},
    {100000.0, 0.2, 15000.0},
    {kUnbounded, 0.0, TaxEngine::DEDUCTION_CAP},
}};

size_t deduction_step_index(double annual_premium) {
    for (size_t i = 0; i < kDeductionSchedule.size(); ++i) {
        if (annual_premium <= kDeductionSchedule[i].upper) {
            return i;
        }
    }
    return kDeductionSchedule.size() - 1;
}

bool is_unbounded_token(std::string token) {
    std::transform(token.begin(), token.end(), token.begin(), ::tolower);
    return token.empty() || token == "inf" || token == "infinity" || token == "unbounded";
}

double parse_number(const std::string& token, const std::string& column, size_t line) {
    try {
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::exception&) {
        throw ConfigParseError("Bracket CSV line " + std::to_string(line) +
                               ": invalid " + column + " '" + token + "'");
    }
}

} // anonymous namespace

// ============================================================================
// TaxBracket / TaxBracketTable Implementation
// ============================================================================

bool TaxBracket::operator==(const TaxBracket& other) const {
    return threshold == other.threshold &&
           cumulative_deduction == other.cumulative_deduction &&
           marginal_rate == other.marginal_rate;
}

TaxBracketTable::TaxBracketTable(std::vector<TaxBracket> brackets)
    : brackets_(std::move(brackets)) {
    if (brackets_.empty()) {
        throw InvalidInput("Tax bracket table must contain at least one bracket");
    }

    for (size_t i = 0; i < brackets_.size(); ++i) {
        const TaxBracket& b = brackets_[i];
        if (!std::isfinite(b.marginal_rate) || b.marginal_rate < 0.0 || b.marginal_rate > 1.0) {
            throw InvalidInput("Tax bracket " + std::to_string(i) +
                               ": marginal rate must be between 0.0 and 1.0");
        }
        if (!std::isfinite(b.cumulative_deduction) || b.cumulative_deduction < 0.0) {
            throw InvalidInput("Tax bracket " + std::to_string(i) +
                               ": cumulative deduction must be non-negative");
        }
        bool last = (i + 1 == brackets_.size());
        if (!last) {
            if (!std::isfinite(b.threshold) || b.threshold <= 0.0) {
                throw InvalidInput("Tax bracket " + std::to_string(i) +
                                   ": threshold must be positive and finite");
            }
            if (i > 0 && b.threshold <= brackets_[i - 1].threshold) {
                throw InvalidInput("Tax bracket thresholds must be strictly increasing");
            }
        }
    }

    brackets_.back().threshold = kUnbounded;
}

TaxBracketTable TaxBracketTable::from_marginal_rates(
    const std::vector<std::pair<double, double>>& thresholds_and_rates)
{
    std::vector<TaxBracket> brackets;
    brackets.reserve(thresholds_and_rates.size());

    double deduction = 0.0;
    for (size_t i = 0; i < thresholds_and_rates.size(); ++i) {
        double threshold = thresholds_and_rates[i].first;
        double rate = thresholds_and_rates[i].second;
        if (i > 0) {
            // Continuity at the previous threshold:
            // t × r_prev - d_prev == t × r - d
            const TaxBracket& prev = brackets.back();
            deduction = prev.cumulative_deduction + prev.threshold * (rate - prev.marginal_rate);
        }
        brackets.push_back(TaxBracket{threshold, deduction, rate});
    }

    return TaxBracketTable(std::move(brackets));
}

TaxBracketTable TaxBracketTable::japan_default() {
    return TaxBracketTable({
        {1950000.0, 0.0, 0.0515},
        {3300000.0, 97500.0, 0.1021},
        {6950000.0, 427500.0, 0.2042},
        {9000000.0, 636000.0, 0.2353},
        {18000000.0, 1536000.0, 0.3372},
        {40000000.0, 2796000.0, 0.4084},
        {kUnbounded, 4796000.0, 0.4599},
    });
}

TaxBracketTable TaxBracketTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open tax bracket file: " + filepath);
    }
    return load_from_csv(file);
}

TaxBracketTable TaxBracketTable::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    std::vector<TaxBracket> rows;
    bool all_have_deduction = true;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 2) {
            throw ConfigParseError("Bracket CSV requires columns: threshold,rate[,deduction]");
        }

        size_t line = reader.line_number();
        double threshold = is_unbounded_token(row[0])
            ? kUnbounded
            : parse_number(row[0], "threshold", line);
        double rate = parse_number(row[1], "rate", line);

        double deduction = 0.0;
        if (row.size() >= 3 && !row[2].empty()) {
            deduction = parse_number(row[2], "deduction", line);
        } else {
            all_have_deduction = false;
        }
        rows.push_back(TaxBracket{threshold, deduction, rate});
    }

    if (rows.empty()) {
        throw ConfigParseError("Bracket CSV contains no brackets");
    }

    if (all_have_deduction) {
        return TaxBracketTable(std::move(rows));
    }

    std::vector<std::pair<double, double>> pairs;
    pairs.reserve(rows.size());
    for (const auto& r : rows) {
        pairs.emplace_back(r.threshold, r.marginal_rate);
    }
    return from_marginal_rates(pairs);
}

const TaxBracket& TaxBracketTable::bracket_for(double taxable_income) const {
    return brackets_[bracket_index(taxable_income)];
}

size_t TaxBracketTable::bracket_index(double taxable_income) const {
    for (size_t i = 0; i < brackets_.size(); ++i) {
        if (taxable_income <= brackets_[i].threshold) {
            return i;
        }
    }
    return brackets_.size() - 1;
}

// ============================================================================
// TaxContext Implementation
// ============================================================================

TaxContext::TaxContext(double income, TaxBracketTable table, double resident_rate)
    : taxable_income(income),
      brackets(std::move(table)),
      resident_tax_rate(resident_rate) {
    if (!std::isfinite(taxable_income) || taxable_income < 0.0) {
        throw InvalidInput("taxable_income must be non-negative");
    }
    if (!std::isfinite(resident_tax_rate) || resident_tax_rate < 0.0 || resident_tax_rate > 1.0) {
        throw InvalidInput("resident_tax_rate must be between 0.0 and 1.0");
    }
}

TaxSavings::TaxSavings()
    : income_tax_savings(0.0),
      resident_tax_savings(0.0),
      total(0.0) {}

PremiumDistribution::PremiumDistribution()
    : total_deduction(0.0),
      total_budget(0.0),
      average_rate(0.0) {}

// ============================================================================
// TaxEngine Implementation
// ============================================================================

TaxEngine::TaxEngine()
    : brackets_(TaxBracketTable::japan_default()),
      resident_tax_rate_(TaxContext::DEFAULT_RESIDENT_TAX_RATE) {}

TaxEngine::TaxEngine(TaxBracketTable brackets, double resident_tax_rate)
    : brackets_(std::move(brackets)),
      resident_tax_rate_(resident_tax_rate) {
    if (!std::isfinite(resident_tax_rate_) || resident_tax_rate_ < 0.0 || resident_tax_rate_ > 1.0) {
        throw InvalidInput("resident_tax_rate must be between 0.0 and 1.0");
    }
}

TaxEngine::TaxEngine(const TaxContext& context)
    : TaxEngine(context.brackets, context.resident_tax_rate) {}

double TaxEngine::deduction(double annual_premium) const {
    if (std::isnan(annual_premium) || annual_premium < 0.0) {
        throw InvalidInput("annual_premium must be non-negative");
    }
    if (annual_premium == 0.0) {
        return 0.0;
    }

    const DeductionStep& step = kDeductionSchedule[deduction_step_index(annual_premium)];
    return std::min(annual_premium * step.rate + step.base, DEDUCTION_CAP);
}

DeductionBreakdown TaxEngine::deduction_breakdown(double annual_premium) const {
    DeductionBreakdown breakdown;
    breakdown.annual_premium = annual_premium;
    breakdown.deduction = deduction(annual_premium);
    breakdown.bracket = deduction_step_index(annual_premium);
    breakdown.effective_rate = annual_premium > 0.0 ? breakdown.deduction / annual_premium : 0.0;
    breakdown.cap_reached = breakdown.deduction >= DEDUCTION_CAP;
    return breakdown;
}

CombinedDeduction TaxEngine::combined_deduction(const std::vector<double>& contract_premiums) const {
    CombinedDeduction result;
    result.contract_count = contract_premiums.size();
    result.total_premium = 0.0;
    result.sum_of_individual = 0.0;

    for (double premium : contract_premiums) {
        result.sum_of_individual += deduction(premium);
        result.total_premium += premium;
    }

    result.combined = deduction(result.total_premium);
    result.individual_is_better = result.sum_of_individual > result.combined;
    result.best = std::max(result.sum_of_individual, result.combined);
    return result;
}

double TaxEngine::progressive_income_tax(double taxable_income) const {
    if (!(taxable_income > 0.0)) {
        return 0.0;
    }
    const TaxBracket& bracket = brackets_.bracket_for(taxable_income);
    return taxable_income * bracket.marginal_rate - bracket.cumulative_deduction;
}

double TaxEngine::marginal_rate(double taxable_income) const {
    return brackets_.bracket_for(taxable_income).marginal_rate;
}

TaxSavings TaxEngine::tax_savings(double deduction_amount, double taxable_income) const {
    TaxSavings savings;
    if (!(taxable_income > 0.0) || !(deduction_amount > 0.0)) {
        return savings;
    }

    double after_income = std::max(0.0, taxable_income - deduction_amount);
    savings.income_tax_savings =
        progressive_income_tax(taxable_income) - progressive_income_tax(after_income);

    // Resident tax is flat, so only the part of the deduction that actually
    // reduces income counts
    savings.resident_tax_savings = (taxable_income - after_income) * resident_tax_rate_;

    savings.total = savings.income_tax_savings + savings.resident_tax_savings;
    return savings;
}

TaxSavings TaxEngine::annual_tax_savings(double annual_premium, double taxable_income) const {
    return tax_savings(deduction(annual_premium), taxable_income);
}

double TaxEngine::one_time_withdrawal_tax(double profit, double taxable_income) const {
    if (!(profit > ONE_TIME_ALLOWANCE)) {
        return 0.0;
    }

    double taxable_half = (profit - ONE_TIME_ALLOWANCE) * ONE_TIME_INCLUSION;
    double base_income = std::max(0.0, taxable_income);
    return progressive_income_tax(base_income + taxable_half) - progressive_income_tax(base_income);
}

std::vector<IncomeChangeRow> TaxEngine::simulate_income_changes(
    double base_income,
    const std::vector<double>& income_changes,
    double deduction_amount) const
{
    if (!std::isfinite(deduction_amount) || deduction_amount < 0.0) {
        throw InvalidInput("deduction_amount must be non-negative");
    }

    std::vector<IncomeChangeRow> rows;
    rows.reserve(income_changes.size());
    for (double change : income_changes) {
        double income = base_income + change;
        if (!std::isfinite(income) || income < 0.0) {
            continue;
        }

        IncomeChangeRow row;
        row.income_change = change;
        row.taxable_income = income;
        row.marginal_rate = marginal_rate(income);
        row.deduction = deduction_amount;
        row.savings = tax_savings(deduction_amount, income);
        row.effective_rate = deduction_amount > 0.0 ? row.savings.total / deduction_amount : 0.0;
        rows.push_back(row);
    }
    return rows;
}

PremiumDistribution TaxEngine::optimize_premium_distribution(
    double total_budget,
    int num_contracts,
    double step) const
{
    if (!std::isfinite(total_budget) || total_budget < 0.0) {
        throw InvalidInput("total_budget must be non-negative");
    }
    if (num_contracts < 1 || num_contracts > MAX_CONTRACTS) {
        throw InvalidInput("num_contracts must be in [1, " + std::to_string(MAX_CONTRACTS) + "]");
    }
    if (!std::isfinite(step) || step <= 0.0) {
        throw InvalidInput("step must be positive");
    }
    if (total_budget / step > static_cast<double>(MAX_DISTRIBUTION_STEPS)) {
        throw InvalidInput("total_budget / step exceeds " + std::to_string(MAX_DISTRIBUTION_STEPS) + " steps");
    }

    PremiumDistribution result;
    result.total_budget = total_budget;

    const size_t units = static_cast<size_t>(std::floor(total_budget / step));
    // One step past MAX_CONTRACT_PREMIUM reaches the cap; more never adds deduction
    const size_t max_units = std::min(units, static_cast<size_t>(std::floor(MAX_CONTRACT_PREMIUM / step)) + 1);
    const size_t stepped = static_cast<size_t>(num_contracts - 1);
    if (static_cast<double>(stepped) * static_cast<double>(units + 1) *
            static_cast<double>(max_units + 1) > MAX_DISTRIBUTION_WORK) {
        throw InvalidInput("Premium distribution search too large; use a coarser step");
    }
    constexpr double kNone = -std::numeric_limits<double>::infinity();

    // best[k][u]: largest deduction of the first k contracts using u steps
    std::vector<std::vector<double>> best(stepped + 1, std::vector<double>(units + 1, kNone));
    std::vector<std::vector<size_t>> choice(stepped + 1, std::vector<size_t>(units + 1, 0));
    best[0][0] = 0.0;

    for (size_t k = 1; k <= stepped; ++k) {
        for (size_t u = 0; u <= units; ++u) {
            for (size_t a = 0; a <= std::min(max_units, u); ++a) {
                double prev = best[k - 1][u - a];
                if (prev == kNone) {
                    continue;
                }
                double total = prev + deduction(static_cast<double>(a) * step);
                if (total > best[k][u]) {
                    best[k][u] = total;
                    choice[k][u] = a;
                }
            }
        }
    }

    // The last contract takes whatever the stepped ones leave
    size_t best_used = 0;
    double best_total = kNone;
    for (size_t u = 0; u <= units; ++u) {
        if (best[stepped][u] == kNone) {
            continue;
        }
        double remainder = std::max(0.0, total_budget - static_cast<double>(u) * step);
        double total = best[stepped][u] + deduction(remainder);
        if (total > best_total) {
            best_total = total;
            best_used = u;
        }
    }

    result.allocations.assign(static_cast<size_t>(num_contracts), 0.0);
    result.allocations.back() = std::max(0.0, total_budget - static_cast<double>(best_used) * step);
    size_t u = best_used;
    for (size_t k = stepped; k >= 1; --k) {
        size_t a = choice[k][u];
        result.allocations[k - 1] = static_cast<double>(a) * step;
        u -= a;
    }

    result.total_deduction = best_total;
    result.average_rate = total_budget > 0.0 ? best_total / total_budget : 0.0;
    return result;
}

} // namespace plancalc
