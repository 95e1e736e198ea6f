#ifndef PLANCALC_CONFIG_HPP
#define PLANCALC_CONFIG_HPP

#include "comparison.hpp"
#include "logger.hpp"
#include "premium_plan.hpp"
#include "strategy_catalog.hpp"
#include "tax_engine.hpp"
#include <optional>
#include <string>
#include <vector>

namespace plancalc {

struct PlanSettings {
    double monthly_premium;
    double annual_growth_rate;
    int period_years;
    double setup_fee_rate;
    double balance_fee_rate;
    double withdrawal_fee_rate;

    PlanSettings();
};

struct TaxSettings {
    double taxable_income;
    double resident_tax_rate;
    std::optional<TaxBracketTable> brackets;    // nullopt = default table

    TaxSettings();
};

// Strategy grid as configured; unset lists fall back to
// StrategyRanges::defaults() for the plan period
struct StrategySettings {
    std::optional<std::vector<int>> withdrawal_intervals;
    std::optional<std::vector<double>> withdrawal_ratios;
    std::optional<std::vector<int>> full_withdrawal_years;
    std::optional<std::vector<int>> switch_years;
    std::optional<std::vector<double>> switch_fee_rates;
};

struct RunSettings {
    size_t batch_size;
    size_t max_strategies;          // 0 = no limit
    size_t top;                     // Entries written to the output (0 = all)
    std::string output_path;        // JSON ranking ("" = stdout)
    std::string parquet_path;       // Parquet ranking ("" = none)

    RunSettings();
};

// Complete run configuration
//
// JSON layout:
//   {
//     "plan":         {"monthly_premium", "annual_growth_rate", "period_years",
//                      "setup_fee_rate", "balance_fee_rate", "withdrawal_fee_rate"},
//     "tax":          {"taxable_income", "resident_tax_rate",
//                      "brackets": [{"threshold": n|null, "rate": r, "deduction": d}],
//                      "brackets_csv": "path"},
//     "reinvestment": {"annual_return", "annual_fee", "capital_gains_tax_rate", "tax_exempt"},
//     "alternative":  {... same as reinvestment ...},
//     "strategies":   {"withdrawal_intervals", "withdrawal_ratios", "full_withdrawal_years",
//                      "switch_years", "switch_fee_rates"},
//     "run":          {"batch_size", "max_strategies", "top", "output", "parquet"},
//     "logging":      {"level", "json", "file"}
//   }
//
// Range lists are JSON arrays or {"from", "to", "step"} objects.
struct RunConfig {
    PlanSettings plan;
    TaxSettings tax;
    InvestmentVehicle reinvestment;
    std::optional<InvestmentVehicle> alternative;
    StrategySettings strategies;
    RunSettings run;
    LoggerConfig logging;

    RunConfig();

    // Throw InvalidInput when a value is outside its domain
    PremiumPlan premium_plan() const;
    TaxContext tax_context() const;
    StrategyRanges strategy_ranges() const;
    ComparisonConfig comparison_config() const;

    // Builds every derived object once so invalid values fail at load time
    void validate() const;
};

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration
 * @param base_path Directory that relative paths are resolved against
 * @throws ConfigParseError if the JSON is invalid or a required field is missing
 * @throws InvalidInput if a value is outside its domain
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& base_path = "");

/**
 * @brief Parses a run configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or the JSON is invalid
 * @throws InvalidInput if a value is outside its domain
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Expands ${VAR} and $VAR references from the environment
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a relative path against a base directory
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

} // namespace plancalc

#endif // PLANCALC_CONFIG_HPP
